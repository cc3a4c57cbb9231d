#include "ulidkit_cli/commands/generate_logic.h"

#include <catch2/catch_test_macros.hpp>

using namespace ulidkit;

TEST_CASE("execute_generate prints ids and succeeds", "[cli][generate]") {
  core::UlidGenerator gen(1);
  core::FixedClock clock(1767225600000ULL);

  app::MintRequest req;
  req.count = 2;
  CHECK(execute_generate(req, gen, clock, false) == 0);
  CHECK(execute_generate(req, gen, clock, true) == 0);
}

TEST_CASE("execute_generate fails cleanly on an oversized count", "[cli][generate]") {
  core::UlidGenerator gen(1);
  core::FixedClock clock(1767225600000ULL);

  app::MintRequest req;
  req.count = 18446744073709551615ULL;
  CHECK(execute_generate(req, gen, clock, false) == 1);
  CHECK(gen.state() == core::GeneratorState{});
}
