#include "tenx/util/digest.h"

#include <sstream>
#include <type_traits>

#include "tenx/util/sorted_keys.h"

namespace tenx {
namespace {

// FNV-1a 64-bit.
class Digest64 {
 public:
  void add_u8(std::uint8_t b) {
    h_ ^= static_cast<std::uint64_t>(b);
    h_ *= kPrime;
  }

  void add_u64(std::uint64_t v) {
    // Little-endian bytes regardless of host.
    for (int i = 0; i < 8; ++i) add_u8(static_cast<std::uint8_t>((v >> (i * 8)) & 0xFFu));
  }

  void add_i64(std::int64_t v) { add_u64(static_cast<std::uint64_t>(v)); }
  void add_size(std::size_t n) { add_u64(static_cast<std::uint64_t>(n)); }
  void add_bool(bool b) { add_u8(static_cast<std::uint8_t>(b ? 1 : 0)); }

  template <typename E, typename = std::enable_if_t<std::is_enum_v<E>>>
  void add_enum(E e) {
    using U = std::underlying_type_t<E>;
    add_u64(static_cast<std::uint64_t>(static_cast<U>(e)));
  }

  void add_string(const std::string& s) {
    add_size(s.size());
    for (unsigned char c : s) add_u8(static_cast<std::uint8_t>(c));
  }

  std::uint64_t value() const { return h_; }

 private:
  static constexpr std::uint64_t kOffset = 1469598103934665603ull;
  static constexpr std::uint64_t kPrime = 1099511628211ull;

  std::uint64_t h_{kOffset};
};

void hash_map(Digest64& d, const Map& m) {
  d.add_string(m.code);
  d.add_i64(m.width);
  d.add_i64(m.height);
  // Tiles keep their authored order; the vector is immutable for a game's lifetime.
  d.add_size(m.tiles.size());
  for (const auto& t : m.tiles) {
    d.add_u64(t.id);
    d.add_i64(t.pos.row);
    d.add_i64(t.pos.col);
    d.add_enum(t.terrain);
    d.add_string(t.resource_type);
    d.add_i64(t.resource_amount);
  }
}

void hash_game_state(Digest64& d, const GameState& s, const DigestOptions& opt) {
  d.add_string("GameStateDigestV1");

  d.add_i64(s.schema_version);
  d.add_u64(s.id);
  d.add_i64(s.turn_no);
  d.add_u64(s.active_participant_id);
  d.add_enum(s.status);
  d.add_u64(s.next_id);
  d.add_u64(s.next_event_seq);

  hash_map(d, s.map);

  d.add_size(s.participants.size());
  for (const auto& p : s.participants) {
    d.add_u64(p.id);
    d.add_string(p.display_name);
    d.add_enum(p.kind);
    d.add_bool(p.is_eliminated);
  }

  d.add_size(s.units.size());
  for (Id id : util::sorted_keys(s.units)) {
    const auto& u = s.units.at(id);
    d.add_u64(id);
    d.add_u64(u.participant_id);
    d.add_string(u.type_code);
    d.add_i64(u.hp);
    d.add_u64(u.tile_id);
    d.add_bool(u.has_acted);
  }

  d.add_size(s.cities.size());
  for (Id id : util::sorted_keys(s.cities)) {
    const auto& c = s.cities.at(id);
    d.add_u64(id);
    d.add_u64(c.participant_id);
    d.add_u64(c.tile_id);
    d.add_i64(c.hp);
    d.add_i64(c.max_hp);
    d.add_size(c.tiles.size());
    for (Id tile_id : c.tiles) d.add_u64(tile_id);
    d.add_size(c.resources.size());
    for (const auto& type : util::sorted_keys(c.resources)) {
      d.add_string(type);
      d.add_i64(c.resources.at(type));
    }
  }

  d.add_size(s.tile_resources.size());
  for (Id tile_id : util::sorted_keys(s.tile_resources)) {
    d.add_u64(tile_id);
    d.add_i64(s.tile_resources.at(tile_id));
  }

  if (opt.include_events) {
    d.add_size(s.events.size());
    for (const auto& ev : s.events) {
      d.add_u64(ev.seq);
      d.add_i64(ev.turn_no);
      d.add_enum(ev.kind);
      d.add_u64(ev.participant_id);
      d.add_string(ev.message);
    }
  }
}

} // namespace

std::uint64_t digest_game_state64(const GameState& state, const DigestOptions& opt) {
  Digest64 d;
  hash_game_state(d, state, opt);
  return d.value();
}

std::uint64_t digest_content_db64(const ContentDB& content) {
  Digest64 d;
  d.add_string("ContentDigestV1");
  d.add_size(content.unit_types.size());
  for (const auto& code : util::sorted_keys(content.unit_types)) {
    const auto& u = content.unit_types.at(code);
    d.add_string(code);
    d.add_i64(u.attack);
    d.add_i64(u.defence);
    d.add_i64(u.health);
    d.add_i64(u.move_points);
    d.add_bool(u.is_ranged);
    d.add_i64(u.range_min);
    d.add_i64(u.range_max);
  }
  return d.value();
}

std::string digest64_to_hex(std::uint64_t v) {
  std::ostringstream out;
  out << std::hex;
  out.width(16);
  out.fill('0');
  out << v;
  return out.str();
}

} // namespace tenx
