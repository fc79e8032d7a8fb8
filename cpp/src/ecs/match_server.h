#ifndef PHOTON_MATCH_SERVER_H
#define PHOTON_MATCH_SERVER_H

#include <flecs.h>
#include <godot_cpp/classes/node.hpp>
#include <godot_cpp/variant/packed_float32_array.hpp>
#include <godot_cpp/variant/string.hpp>

namespace godot {

class PhotonServer : public Node {
  GDCLASS(PhotonServer, Node)

private:
  flecs::world ecs;
  bool match_ready = false;

  // Renderer feed, repacked after every tick
  PackedFloat32Array unit_buffer; // UNIT_STRIDE floats per unit
  int unit_buffer_count = 0;
  PackedFloat32Array base_buffer; // BASE_STRIDE floats per base
  int base_buffer_count = 0;

  void sync_buffers();

protected:
  static void _bind_methods();

public:
  PhotonServer();
  ~PhotonServer();

  void _ready() override;
  void _process(double delta) override;

  void init_match_world();

  // --- Setup ---
  int create_base(int owner, int base_type, float x, float y);
  void add_obstacle(float x, float y, float width, float height);

  // --- Units ---
  int spawn_unit(int owner, int unit_type, float spawn_x, float spawn_y,
                 float rally_x, float rally_y);
  bool order_move(int unit_id, float x, float y);
  bool order_attack_move(int unit_id, float x, float y);
  bool order_patrol(int unit_id, float x, float y, float return_x,
                    float return_y);
  bool order_ability(int unit_id, float x, float y, float dir_x, float dir_y);
  bool clear_orders(int unit_id);

  // --- Bases ---
  bool move_base(int base_id, float x, float y);
  bool stop_base(int base_id);
  bool set_base_selected(int base_id, bool selected);
  bool fire_laser(int base_id, float dir_x, float dir_y);

  // --- Queries ---
  int get_photons(int owner);
  int get_unit_count(int owner);
  int get_winner();
  PackedFloat32Array get_unit_buffer() const;
  int get_unit_buffer_count() const;
  PackedFloat32Array get_base_buffer() const;
  int get_base_buffer_count() const;

  // --- Snapshot ---
  String save_match();
  bool load_match(const String &snapshot);
};

} // namespace godot

#endif // PHOTON_MATCH_SERVER_H
