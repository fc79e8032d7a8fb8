// ═════════════════════════════════════════════════════════════
// Category 2: ABILITIES: Executor & Deferred Effects
// ═════════════════════════════════════════════════════════════

TEST_CASE_FIXTURE(MatchTestHarness,
                  "Cat2: Burst fire spreads ten shots over a cone") {
  auto marine = spawn(0, UNIT_MARINE, 0.0f, 0.0f);
  auto target = spawn(1, UNIT_MEDIC, 5.0f, 0.0f);

  // At 5m only the six central shots pass within 0.5m of the target
  CHECK(execute_ability(marine, 0.0f, 0.0f, 1.0f, 0.0f));
  CHECK(hp(target) == doctest::Approx(48.0f));
  CHECK(marine.get<AbilityState>().cooldown == doctest::Approx(5.0f));

  SUBCASE("Second cast is a silent no-op while on cooldown") {
    CHECK_FALSE(execute_ability(marine, 0.0f, 0.0f, 1.0f, 0.0f));
    CHECK(hp(target) == doctest::Approx(48.0f));
  }
}

TEST_CASE_FIXTURE(MatchTestHarness, "Cat2: Burst fire ignores cloaked units") {
  auto marine = spawn(0, UNIT_MARINE, 0.0f, 0.0f);
  auto scout = spawn(1, UNIT_SCOUT, 5.0f, 0.0f);
  REQUIRE(execute_ability(scout, 5.0f, 0.0f, 0.0f, 0.0f)); // cloak

  CHECK(execute_ability(marine, 0.0f, 0.0f, 1.0f, 0.0f));
  CHECK(hp(scout) == doctest::Approx(30.0f));
}

TEST_CASE_FIXTURE(MatchTestHarness,
                  "Cat2: Dash strike lands on the enemy near the anchor") {
  auto warrior = spawn(0, UNIT_WARRIOR, 0.0f, 0.0f);
  auto target = spawn(1, UNIT_MEDIC, 6.0f, 0.0f);

  CHECK(execute_ability(warrior, 5.0f, 0.0f, 0.0f, 0.0f));
  CHECK(pos(warrior).x == doctest::Approx(6.0f));
  CHECK(hp(target) == doctest::Approx(6.0f)); // 18 * 3
  CHECK(effects(warrior).dash.active);
  CHECK(warrior.get<AbilityState>().cooldown == doctest::Approx(8.0f));

  step(2); // dash flag lasts 0.3s
  CHECK_FALSE(effects(warrior).dash.active);
}

TEST_CASE_FIXTURE(MatchTestHarness,
                  "Cat2: Dash strike with nobody near the anchor keeps cooldown") {
  auto warrior = spawn(0, UNIT_WARRIOR, 0.0f, 0.0f);
  spawn(1, UNIT_MEDIC, 20.0f, 20.0f);

  CHECK_FALSE(execute_ability(warrior, 5.0f, 0.0f, 0.0f, 0.0f));
  CHECK(pos(warrior).x == doctest::Approx(0.0f));
  CHECK(warrior.get<AbilityState>().cooldown == doctest::Approx(0.0f));
}

TEST_CASE_FIXTURE(MatchTestHarness,
                  "Cat2: Shield halves ranged damage to covered allies") {
  auto tank = spawn(0, UNIT_TANK, 0.0f, 0.0f);
  auto ally = spawn(0, UNIT_MARINE, 2.0f, 0.0f);
  auto outside = spawn(0, UNIT_MARINE, 10.0f, 0.0f);
  REQUIRE(execute_ability(tank, 0.0f, 0.0f, 0.0f, 0.0f));

  CHECK(shield_factor(ecs, 0, 2.0f, 0.0f, DAMAGE_RANGED) ==
        doctest::Approx(0.5f));
  CHECK(shield_factor(ecs, 1, 2.0f, 0.0f, DAMAGE_RANGED) ==
        doctest::Approx(1.0f)); // enemy shields never cover you

  CHECK(damage_unit(ecs, ally, 10.0f, DAMAGE_RANGED, 1) ==
        doctest::Approx(5.0f));
  CHECK(damage_unit(ecs, ally, 10.0f, DAMAGE_MELEE, 1) ==
        doctest::Approx(10.0f));
  CHECK(damage_unit(ecs, ally, 10.0f, DAMAGE_PURE, 1) ==
        doctest::Approx(10.0f));
  CHECK(damage_unit(ecs, outside, 10.0f, DAMAGE_RANGED, 1) ==
        doctest::Approx(10.0f));
  CHECK(hp(ally) == doctest::Approx(15.0f));
}

TEST_CASE_FIXTURE(MatchTestHarness,
                  "Cat2: Shield expires after five seconds") {
  auto tank = spawn(0, UNIT_TANK, 0.0f, 0.0f);
  REQUIRE(execute_ability(tank, 0.0f, 0.0f, 0.0f, 0.0f));

  step(20); // t = 5.0, still up
  CHECK(effects(tank).shield.active);
  step(1);
  CHECK_FALSE(effects(tank).shield.active);
}

TEST_CASE_FIXTURE(MatchTestHarness,
                  "Cat2: Cloaked units are not targeted until cloak ends") {
  auto scout = spawn(0, UNIT_SCOUT, 0.0f, 0.0f);
  spawn(1, UNIT_TANK, 3.0f, 0.0f); // 9.6 dps at 6m
  REQUIRE(execute_ability(scout, 0.0f, 0.0f, 0.0f, 0.0f));

  step(20); // t = 5.0
  CHECK(effects(scout).cloak.active);
  CHECK(hp(scout) == doctest::Approx(30.0f));

  step(2); // cloak drops at t = 5.25, two ticks of fire
  CHECK_FALSE(effects(scout).cloak.active);
  CHECK(hp(scout) == doctest::Approx(25.2f));
}

TEST_CASE_FIXTURE(MatchTestHarness,
                  "Cat2: Bombardment damages only inside its window") {
  auto artillery = spawn(0, UNIT_ARTILLERY, -20.0f, 0.0f); // out of range
  auto target = spawn(1, UNIT_MEDIC, 10.0f, 0.0f);
  auto bystander = spawn(1, UNIT_MEDIC, 14.0f, 0.0f);

  REQUIRE(execute_ability(artillery, 10.0f, 0.0f, 0.0f, 0.0f));
  CHECK(effects(artillery).bombardment.active);

  step(6); // t = 1.5: impact time, not yet past it
  CHECK(hp(target) == doctest::Approx(60.0f));

  step(1); // t = 1.75: 40 dps
  CHECK(hp(target) == doctest::Approx(50.0f));

  step(1); // t = 2.0: window closed, slot cleared
  CHECK(hp(target) == doctest::Approx(50.0f));
  CHECK_FALSE(effects(artillery).bombardment.active);
  CHECK(hp(bystander) == doctest::Approx(60.0f));
}

TEST_CASE_FIXTURE(MatchTestHarness,
                  "Cat2: Bombardment hits bases and cloaked units") {
  auto artillery = spawn(0, UNIT_ARTILLERY, -20.0f, 0.0f);
  auto scout = spawn(1, UNIT_SCOUT, 10.0f, 1.0f);
  auto enemy_base = base(1, BASE_STANDARD, 10.0f, 0.0f);
  REQUIRE(execute_ability(scout, 0.0f, 0.0f, 0.0f, 0.0f));

  REQUIRE(execute_ability(artillery, 10.0f, 0.0f, 0.0f, 0.0f));
  step(8);
  CHECK(hp(scout) == doctest::Approx(20.0f));
  CHECK(hp(enemy_base) == doctest::Approx(980.0f)); // 80 dps, one tick
}

TEST_CASE_FIXTURE(MatchTestHarness, "Cat2: Heal pulse restores allies") {
  auto medic = spawn(0, UNIT_MEDIC, 0.0f, 0.0f);
  auto marine = spawn(0, UNIT_MARINE, 3.0f, 0.0f);
  auto tank = spawn(0, UNIT_TANK, 0.0f, 4.0f);
  auto far_tank = spawn(0, UNIT_TANK, 0.0f, 8.0f);
  auto enemy = spawn(1, UNIT_TANK, -3.0f, 0.0f);
  auto home = base(0, BASE_STANDARD, 4.0f, 0.0f);
  set_hp(marine, 10.0f);
  set_hp(tank, 100.0f);
  set_hp(far_tank, 100.0f);
  set_hp(enemy, 100.0f);
  set_hp(home, 500.0f);

  REQUIRE(execute_ability(medic, 0.0f, 0.0f, 0.0f, 0.0f));
  CHECK(hp(marine) == doctest::Approx(40.0f)); // capped at max hp
  CHECK(hp(tank) == doctest::Approx(150.0f));
  CHECK(hp(far_tank) == doctest::Approx(100.0f));
  CHECK(hp(enemy) == doctest::Approx(100.0f));
  CHECK(hp(home) == doctest::Approx(600.0f));
  CHECK(effects(medic).heal_pulse.active);
}

TEST_CASE_FIXTURE(MatchTestHarness,
                  "Cat2: Missiles lock ahead and resolve at the locked spot") {
  auto interceptor = spawn(0, UNIT_INTERCEPTOR, 0.0f, 0.0f);
  auto stays = spawn(1, UNIT_MEDIC, 11.0f, 0.0f);
  auto dodges = spawn(1, UNIT_MEDIC, 11.5f, 1.0f);
  auto behind = spawn(1, UNIT_MEDIC, -11.0f, 0.0f);

  REQUIRE(execute_ability(interceptor, 0.0f, 0.0f, 1.0f, 0.0f));
  const MissileBarrageSlot &slot = effects(interceptor).missiles;
  CHECK(slot.active);
  CHECK(slot.count == 2);
  CHECK(slot.missiles[0].target_x == doctest::Approx(11.0f));

  place(dodges, 11.5f, 5.0f);
  step(5); // t = 1.25
  CHECK(hp(stays) == doctest::Approx(60.0f));

  step(1); // t = 1.5: impact
  CHECK(hp(stays) == doctest::Approx(45.0f));
  CHECK(hp(dodges) == doctest::Approx(60.0f));
  CHECK(hp(behind) == doctest::Approx(60.0f));
  CHECK_FALSE(effects(interceptor).missiles.active);
}

TEST_CASE_FIXTURE(MatchTestHarness,
                  "Cat2: Promotion scales ability damage") {
  auto warrior = spawn(0, UNIT_WARRIOR, 0.0f, 0.0f);
  auto target = spawn(1, UNIT_TANK, 2.0f, 0.0f);
  warrior.get_mut<Veterancy>().damage_multiplier = 1.5f;

  REQUIRE(execute_ability(warrior, 2.0f, 0.0f, 0.0f, 0.0f));
  CHECK(hp(target) == doctest::Approx(200.0f - 81.0f));
}

TEST_CASE_FIXTURE(MatchTestHarness,
                  "Cat2: Line jump strikes each enemy on the line once") {
  auto snaker = spawn(0, UNIT_SNAKER, 0.0f, 0.0f);
  snaker.get_mut<Veterancy>().damage_multiplier = 1.5f;
  auto near_line = spawn(1, UNIT_MEDIC, 2.0f, 0.5f); // spans many sweep steps
  auto far_line = spawn(1, UNIT_MEDIC, 4.0f, -0.8f);
  auto off_line = spawn(1, UNIT_MEDIC, 3.0f, 1.5f);
  auto beyond_end = spawn(1, UNIT_MEDIC, 7.5f, 0.0f);
  auto ally = spawn(0, UNIT_MEDIC, 3.0f, 0.0f);

  REQUIRE(execute_ability(snaker, 0.0f, 0.0f, 6.0f, 0.0f));
  step(1); // telegraph
  CHECK(hp(near_line) == doctest::Approx(60.0f));

  step(1); // t = 0.5: resolves, 20 * 1.5 melee
  CHECK(pos(snaker).x == doctest::Approx(6.0f));
  CHECK(hp(near_line) == doctest::Approx(30.0f));
  CHECK(hp(far_line) == doctest::Approx(30.0f));
  CHECK(hp(off_line) == doctest::Approx(60.0f));
  CHECK(hp(beyond_end) == doctest::Approx(60.0f));
  CHECK(hp(ally) == doctest::Approx(60.0f));
  CHECK(ecs.get<MatchStats>().damage_dealt[0] == doctest::Approx(60.0f));

  step(1); // resolved once, never again
  CHECK(hp(near_line) == doctest::Approx(30.0f));
  CHECK(hp(far_line) == doctest::Approx(30.0f));
  CHECK_FALSE(effects(snaker).line_jump.active);
}
