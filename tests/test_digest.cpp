#include <iostream>
#include <string>
#include <utility>

#include "tenx/core/content.h"
#include "tenx/core/scenario.h"
#include "tenx/util/digest.h"

#define TENX_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_digest() {
  const tenx::ContentDB content = tenx::default_content();

  const auto a = tenx::make_demo_scenario(content);
  auto b = tenx::make_demo_scenario(content);

  // Deterministic for equal states regardless of hash map history.
  const auto da = tenx::digest_game_state64(a);
  TENX_ASSERT(da == tenx::digest_game_state64(b));
  b.units.rehash(64);
  b.cities.rehash(64);
  TENX_ASSERT(da == tenx::digest_game_state64(b));

  // The action guard is transient.
  b.turn_in_progress = true;
  TENX_ASSERT(da == tenx::digest_game_state64(b));

  // Any board change shows up.
  b.units.at(4).hp -= 1;
  TENX_ASSERT(da != tenx::digest_game_state64(b));

  // Events can be excluded.
  {
    auto c = tenx::make_demo_scenario(content);
    tenx::push_event(c, tenx::GameEventKind::TurnEnded, 1, "Turn 1 ended", 0);
    TENX_ASSERT(tenx::digest_game_state64(c) != da);

    tenx::DigestOptions opt;
    opt.include_events = false;
    auto plain = a;
    plain.next_event_seq = c.next_event_seq;
    TENX_ASSERT(tenx::digest_game_state64(c, opt) == tenx::digest_game_state64(plain, opt));
  }

  // Turn order matters.
  {
    auto c = tenx::make_demo_scenario(content);
    std::swap(c.participants[0], c.participants[1]);
    TENX_ASSERT(tenx::digest_game_state64(c) != da);
  }

  const std::string hex = tenx::digest64_to_hex(0xabcULL);
  TENX_ASSERT(hex == "0000000000000abc");
  TENX_ASSERT(tenx::digest64_to_hex(da).size() == 16);

  auto other = content;
  other.unit_types.at("warrior").attack = 21;
  TENX_ASSERT(tenx::digest_content_db64(content) == tenx::digest_content_db64(tenx::default_content()));
  TENX_ASSERT(tenx::digest_content_db64(content) != tenx::digest_content_db64(other));

  return 0;
}
