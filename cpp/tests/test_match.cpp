// ═════════════════════════════════════════════════════════════
// Category 4: MATCH: Economy, Spawning, Bases & Victory
// ═════════════════════════════════════════════════════════════

TEST_CASE_FIXTURE(MatchTestHarness, "Cat4: Income lands once per second") {
  int start = photons(ecs, 0);

  step(3); // 0.75s
  CHECK(photons(ecs, 0) == start);
  step(1); // 1.0s
  CHECK(photons(ecs, 0) == start + 1);
  CHECK(photons(ecs, 1) == start + 1);

  step(36); // 10.0s: nine grants at rate 1, the tenth at rate 2
  CHECK(photons(ecs, 0) == start + 11);
  CHECK(ecs.get<Economy>().players[0].income_rate == 2);
}

TEST_CASE_FIXTURE(MatchTestHarness, "Cat4: Large frames still pay every second") {
  int start = photons(ecs, 0);
  advance(ecs, 2.5f);
  CHECK(photons(ecs, 0) == start + 2);
  CHECK(ecs.get<MatchClock>().income_timer == doctest::Approx(0.5));
}

TEST_CASE_FIXTURE(MatchTestHarness, "Cat4: Spawn spends photons") {
  int start = photons(ecs, 0);
  uint32_t id = 0;
  REQUIRE(spawn_unit(ecs, 0, UNIT_TANK, {0.0f, 0.0f}, {2.0f, 0.0f}, &id));

  CHECK(photons(ecs, 0) == start - 60);
  CHECK(photons(ecs, 1) == start);
  CHECK(unit_count(ecs, 0) == 1);
  CHECK(find_unit(ecs, id).is_valid());
  CHECK(ecs.get<MatchStats>().units_trained[0] == 1);
  CHECK(ecs.get<MatchStats>().photons_spent[0] == 60);
  CHECK(count_events(EVENT_SPAWN) == 1);

  flecs::entity tank = find_unit(ecs, id);
  CHECK(hp(tank) == doctest::Approx(200.0f));
  CHECK(tank.get<Veterancy>().damage_multiplier == doctest::Approx(1.0f));
  CHECK(tank.get<Owner>().player == 0);
}

TEST_CASE_FIXTURE(MatchTestHarness, "Cat4: Unit ids are unique and increasing") {
  uint32_t a = uid(spawn(0, UNIT_SCOUT, 0.0f, 0.0f));
  uint32_t b = uid(spawn(1, UNIT_SCOUT, 5.0f, 5.0f));
  uint32_t c = uid(spawn(0, UNIT_SCOUT, 9.0f, 0.0f));
  CHECK(a < b);
  CHECK(b < c);
}

TEST_CASE_FIXTURE(MatchTestHarness, "Cat4: Rejected spawns change nothing") {
  SUBCASE("Not enough photons") {
    ecs.get_mut<Economy>().players[0].photons = 59;
    CHECK_FALSE(spawn_unit(ecs, 0, UNIT_TANK, {0, 0}, {0, 0}));
    CHECK(photons(ecs, 0) == 59);
  }
  SUBCASE("Disabled unit type") {
    ecs.get_mut<MatchConfig>().enabled_units = ~(1u << UNIT_TANK);
    int before = photons(ecs, 0);
    CHECK_FALSE(spawn_unit(ecs, 0, UNIT_TANK, {0, 0}, {0, 0}));
    CHECK(spawn_unit(ecs, 0, UNIT_MARINE, {0, 0}, {0, 0}));
    CHECK(photons(ecs, 0) == before - 25);
  }
  SUBCASE("Match already decided") {
    ecs.get_mut<MatchOutcome>() = {true, 1};
    int before = photons(ecs, 0);
    CHECK_FALSE(spawn_unit(ecs, 0, UNIT_MARINE, {0, 0}, {0, 0}));
    CHECK(photons(ecs, 0) == before);
  }
  SUBCASE("Unknown owner") {
    CHECK_FALSE(spawn_unit(ecs, 2, UNIT_MARINE, {0, 0}, {0, 0}));
  }
  CHECK(ecs.get<MatchStats>().units_trained[0] <= 1);
  CHECK(unit_count(ecs, 0) <= 1);
}

TEST_CASE_FIXTURE(MatchTestHarness, "Cat4: Commands to unknown units fail") {
  CHECK_FALSE(queue_command(ecs, 42, move_command(1.0f, 1.0f)));
  CHECK_FALSE(clear_commands(ecs, 42));
  CHECK_FALSE(set_base_target(ecs, 42, {1.0f, 1.0f}));
  CHECK_FALSE(select_base(ecs, 42, true));
}

TEST_CASE_FIXTURE(MatchTestHarness, "Cat4: Bases accelerate toward a target") {
  auto home = base(0, BASE_STANDARD, 0.0f, 0.0f);
  REQUIRE(set_base_target(ecs, bid(home), {10.0f, 0.0f}));

  step(4); // capped at 1.5 m/s from the first tick
  CHECK(pos(home).x == doctest::Approx(1.5f));
  CHECK(home.get<BaseState>().current_speed == doctest::Approx(1.5f));

  REQUIRE(clear_base_target(ecs, bid(home)));
  step(4);
  CHECK(pos(home).x == doctest::Approx(1.5f));
  CHECK(home.get<BaseState>().current_speed == doctest::Approx(0.0f));
}

TEST_CASE_FIXTURE(MatchTestHarness, "Cat4: Bases stop at the target") {
  auto home = base(0, BASE_STANDARD, 0.0f, 0.0f);
  set_base_target(ecs, bid(home), {1.0f, 0.0f});
  step(8);
  CHECK(pos(home).x == doctest::Approx(1.0f));
  CHECK_FALSE(home.get<BaseState>().has_target);
}

TEST_CASE_FIXTURE(MatchTestHarness, "Cat4: Defense bases cannot move") {
  auto tower = base(0, BASE_DEFENSE, 0.0f, 0.0f);
  CHECK_FALSE(set_base_target(ecs, bid(tower), {5.0f, 0.0f}));
  step(4);
  CHECK(pos(tower).x == doctest::Approx(0.0f));
}

TEST_CASE_FIXTURE(MatchTestHarness, "Cat4: Selection flag is stored") {
  auto home = base(0, BASE_STANDARD, 0.0f, 0.0f);
  CHECK(select_base(ecs, bid(home), true));
  CHECK(home.get<BaseState>().selected);
  CHECK(select_base(ecs, bid(home), false));
  CHECK_FALSE(home.get<BaseState>().selected);
}

TEST_CASE_FIXTURE(MatchTestHarness,
                  "Cat4: Assault base is shielded only while moving") {
  auto assault = base(0, BASE_ASSAULT, 0.0f, 0.0f);
  set_base_target(ecs, bid(assault), {10.0f, 0.0f});
  step(1);
  CHECK(assault.get<BaseState>().shield_active);
  CHECK(damage_base(ecs, assault, 100.0f, DAMAGE_RANGED, 1) ==
        doctest::Approx(50.0f));
  CHECK(damage_base(ecs, assault, 100.0f, DAMAGE_PURE, 1) ==
        doctest::Approx(100.0f));

  clear_base_target(ecs, bid(assault));
  step(1);
  CHECK_FALSE(assault.get<BaseState>().shield_active);
  CHECK(damage_base(ecs, assault, 100.0f, DAMAGE_RANGED, 1) ==
        doctest::Approx(100.0f));
  CHECK(ecs.get<MatchStats>().base_damage_taken[0] == doctest::Approx(250.0f));
}

TEST_CASE_FIXTURE(MatchTestHarness, "Cat4: Support base regenerates allies") {
  auto support = base(0, BASE_SUPPORT, 0.0f, 0.0f);
  auto tank = spawn(0, UNIT_TANK, 3.0f, 0.0f);
  auto far_tank = spawn(0, UNIT_TANK, 20.0f, 0.0f);
  set_hp(tank, 100.0f);
  set_hp(far_tank, 100.0f);
  set_hp(support, 800.0f);

  step(4); // 15 hp/s to units, half that to itself
  CHECK(hp(tank) == doctest::Approx(115.0f));
  CHECK(hp(far_tank) == doctest::Approx(100.0f));
  CHECK(hp(support) == doctest::Approx(807.5f));

  step(4); // second pulse at t = 2
  CHECK(support.get<BaseState>().pulse_end_time == doctest::Approx(2.5f));
}

// ─── End-to-end scenarios ─────────────────────────────────

TEST_CASE_FIXTURE(MatchTestHarness,
                  "Cat4: Scenario B - laser on a 1000 hp base, match goes on") {
  auto home = base(0, BASE_STANDARD, 0.0f, 0.0f);
  auto enemy_base = base(1, BASE_STANDARD, 10.0f, 0.0f);

  REQUIRE(fire_laser(ecs, bid(home), 1.0f, 0.0f));
  CHECK(hp(enemy_base) == doctest::Approx(700.0f));

  step(1);
  CHECK(winner(ecs) == NO_WINNER);
  CHECK(ecs.get<MatchStats>().base_damage_taken[1] == doctest::Approx(300.0f));
}

TEST_CASE_FIXTURE(MatchTestHarness,
                  "Cat4: Scenario C - base at exactly 0 ends the match") {
  base(0, BASE_DEFENSE, 0.0f, 0.0f);
  auto enemy_base = base(1, BASE_STANDARD, 5.0f, 0.0f);
  set_hp(enemy_base, 15.0f); // one defense shot

  CHECK(advance(ecs, 0.25f));
  CHECK(hp(enemy_base) == doctest::Approx(0.0f));
  CHECK(winner(ecs) == 0);
  CHECK(count_events(EVENT_VICTORY) == 1);

  // Frozen from here on
  double t = elapsed();
  CHECK_FALSE(advance(ecs, 0.25f));
  CHECK(elapsed() == t);
  CHECK_FALSE(spawn_unit(ecs, 1, UNIT_MARINE, {5, 0}, {5, 0}));
  CHECK_FALSE(fire_laser(ecs, 1, 1.0f, 0.0f));
  CHECK(count_events(EVENT_VICTORY) == 1);
}

TEST_CASE_FIXTURE(MatchTestHarness,
                  "Cat4: Scenario D - time limit goes to less damage taken") {
  ecs.get_mut<MatchConfig>().match_time_limit = 1.0f;
  auto mine = base(0, BASE_STANDARD, 0.0f, 0.0f);
  auto theirs = base(1, BASE_STANDARD, 50.0f, 0.0f);
  set_hp(mine, 800.0f);   // 200 taken
  set_hp(theirs, 850.0f); // 150 taken

  step(3);
  CHECK(winner(ecs) == NO_WINNER);
  step(1);
  CHECK(winner(ecs) == 1);
}

TEST_CASE_FIXTURE(MatchTestHarness, "Cat4: Time limit tie-break") {
  ecs.get_mut<MatchConfig>().match_time_limit = 1.0f;
  base(0, BASE_STANDARD, 0.0f, 0.0f);
  base(1, BASE_STANDARD, 50.0f, 0.0f);

  SUBCASE("Equal taken, equal dealt: draw") {
    step(4);
    CHECK(winner(ecs) == DRAW);
  }
  SUBCASE("Equal taken, more damage dealt wins") {
    ecs.get_mut<MatchStats>().damage_dealt[1] = 25.0f;
    step(4);
    CHECK(winner(ecs) == 1);
  }
}

TEST_CASE("Cat4: Tie without stats is a draw") {
  flecs::world ecs;
  MatchConfig cfg;
  cfg.match_time_limit = 0.5f;
  init_match(ecs, cfg, default_definitions(), false);
  create_base(ecs, 0, BASE_STANDARD, {0.0f, 0.0f});
  create_base(ecs, 1, BASE_STANDARD, {50.0f, 0.0f});

  CHECK_FALSE(ecs.has<MatchStats>());
  advance(ecs, 0.25f);
  advance(ecs, 0.25f);
  CHECK(winner(ecs) == DRAW);
}

TEST_CASE_FIXTURE(MatchTestHarness,
                  "Cat4: Destroyed base beats the time limit on the same tick") {
  ecs.get_mut<MatchConfig>().match_time_limit = 0.25f;
  auto mine = base(0, BASE_ASSAULT, 0.0f, 0.0f);    // 800 max
  auto theirs = base(1, BASE_DEFENSE, 50.0f, 0.0f); // 1200 max
  set_hp(mine, 0.0f);     // 800 taken
  set_hp(theirs, 300.0f); // 900 taken: player 0 would win on time

  step(1);
  CHECK(winner(ecs) == 1);
  CHECK(count_events(EVENT_VICTORY) == 1);
}

TEST_CASE_FIXTURE(MatchTestHarness, "Cat4: dt <= 0 does not tick") {
  CHECK_FALSE(advance(ecs, 0.0f));
  CHECK_FALSE(advance(ecs, -1.0f));
  CHECK(elapsed() == doctest::Approx(0.0));
  CHECK(advance(ecs, 0.25f));
  CHECK(elapsed() == doctest::Approx(0.25));
}
