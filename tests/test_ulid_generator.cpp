#include "ulidkit/core/encoder.h"
#include "ulidkit/core/ulid_generator.h"

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <string>
#include <vector>

using namespace ulidkit::core;

namespace {

constexpr std::uint64_t kTwoPow48 = 1ULL << 48;

std::string timestamp_part(const std::string& id) { return id.substr(0, kTimestampSymbols); }
std::string payload_part(const std::string& id) { return id.substr(kTimestampSymbols); }

}  // namespace

TEST_CASE("UlidGenerator output is 26 alphabet characters", "[ulid]") {
  UlidGenerator gen(123);
  const std::vector<std::uint64_t> timestamps = {0, 1, 5, 1700000000000ULL, kTwoPow48 - 1,
                                                 kTwoPow48, ~0ULL};
  for (const auto ts : timestamps) {
    const std::string id = gen.next(ts);
    REQUIRE(id.size() == kEncodedLength);
    for (char ch : id) {
      CHECK(kCrockfordAlphabet.find(ch) != std::string_view::npos);
    }
  }
}

TEST_CASE("UlidGenerator is monotonic within one millisecond", "[ulid][monotonic]") {
  UlidGenerator gen(99);
  const std::string a = gen.next(5);
  const std::string b = gen.next(5);
  const std::string c = gen.next(5);

  CHECK(a < b);
  CHECK(b < c);
  CHECK(timestamp_part(a) == timestamp_part(c));
}

TEST_CASE("UlidGenerator is monotonic across milliseconds", "[ulid][monotonic]") {
  UlidGenerator gen(99);
  const std::string a = gen.next(5);
  const std::string b = gen.next(6);

  CHECK(a < b);
  CHECK(timestamp_part(a) == "0000000005");
  CHECK(timestamp_part(b) == "0000000006");
}

TEST_CASE("UlidGenerator stays ordered over a long same-millisecond run", "[ulid][monotonic]") {
  UlidGenerator gen(2024);
  std::string previous = gen.next(1700000000000ULL);
  for (int i = 0; i < 1000; ++i) {
    const std::string current = gen.next(1700000000000ULL + static_cast<std::uint64_t>(i / 100));
    REQUIRE(previous < current);
    previous = current;
  }
}

TEST_CASE("UlidGenerator masks timestamps to 48 bits", "[ulid][mask]") {
  const std::uint64_t ts = 1234567;

  SECTION("fresh generators agree on the whole id") {
    UlidGenerator a(7);
    UlidGenerator b(7);
    CHECK(a.next(ts) == b.next(ts + kTwoPow48));
  }

  SECTION("one generator treats the wrapped timestamp as the same millisecond") {
    UlidGenerator gen(7);
    const std::string first = gen.next(ts);
    const std::string second = gen.next(ts + kTwoPow48);
    CHECK(timestamp_part(first) == timestamp_part(second));
    CHECK(first < second);
    CHECK(gen.state().last_timestamp == ts);
  }

  SECTION("all-ones input keeps only the low 48 bits") {
    UlidGenerator gen(7);
    const std::string id = gen.next(~0ULL);
    CHECK(timestamp_part(id) == "7ZZZZZZZZZ");
    CHECK(gen.state().last_timestamp == kTimestampMask);
  }
}

TEST_CASE("UlidGenerator is deterministic for a seed", "[ulid][determinism]") {
  UlidGenerator a(0xC0FFEE);
  UlidGenerator b(0xC0FFEE);
  const std::vector<std::uint64_t> timestamps = {10, 10, 11, 11, 11, 500, 499, 1000};

  for (const auto ts : timestamps) {
    REQUIRE(a.next(ts) == b.next(ts));
  }
  CHECK(a.state() == b.state());
}

TEST_CASE("UlidGenerator seeds change only the payload", "[ulid][determinism]") {
  UlidGenerator a(1);
  UlidGenerator b(2);
  const std::string id_a = a.next(1000);
  const std::string id_b = b.next(1000);

  CHECK(id_a != id_b);
  CHECK(timestamp_part(id_a) == timestamp_part(id_b));
  CHECK(payload_part(id_a) != payload_part(id_b));
}

TEST_CASE("UlidGenerator state tracks the last id", "[ulid][state]") {
  UlidGenerator gen(5);
  REQUIRE(gen.state() == GeneratorState{});

  const Uint128 first = gen.next_value(42);
  CHECK(gen.state().last_timestamp == 42);
  CHECK(gen.state().last_random == Uint128{first.hi & kPayloadHiMask, first.lo});
  CHECK(first == compose_ulid(42, gen.state().last_random));

  const Uint128 second = gen.next_value(42);
  CHECK(gen.state().last_random.lo == first.lo + 1);
  CHECK(first < second);
}

TEST_CASE("UlidGenerator first call at timestamp zero counts up from the zero state",
          "[ulid][state]") {
  // Zero state means "nothing generated"; ts 0 is not newer than it.
  UlidGenerator gen(5);
  CHECK(gen.next(0) == "00000000000000000000000001");
}

TEST_CASE("UlidGenerator increments the payload on clock regression", "[ulid][state]") {
  UlidGenerator gen(11);
  const Uint128 at_ten = gen.next_value(10);
  const Uint128 regressed = gen.next_value(3);

  CHECK(gen.state().last_timestamp == 3);
  CHECK(gen.state().last_random.lo == at_ten.lo + 1);
  CHECK((regressed.hi >> 16) == 3);
}

TEST_CASE("UlidGenerator carries the payload increment across words", "[ulid][state]") {
  UlidGenerator gen(3);
  gen.restore(GeneratorState{77, Uint128{0x00FF, ~0ULL}});

  gen.next_value(77);
  CHECK(gen.state().last_random == Uint128{0x0100, 0});
}

TEST_CASE("UlidGenerator wraps an exhausted payload to zero", "[ulid][wraparound]") {
  const std::uint64_t t = 1700000000000ULL;
  UlidGenerator gen(3);
  gen.restore(GeneratorState{t, kPayloadMax});

  const std::string before = encode_ulid(compose_ulid(t, kPayloadMax));
  const std::string wrapped = gen.next(t);

  CHECK(payload_part(wrapped) == std::string(16, '0'));
  CHECK(timestamp_part(wrapped) == timestamp_part(before));
  CHECK(gen.state().last_random == Uint128{});
  CHECK(gen.state().last_timestamp == t);
  // Documented ordering break: the id after the wrap sorts first.
  CHECK(wrapped < before);

  // Counting resumes from zero.
  CHECK(payload_part(gen.next(t)) == "0000000000000001");
}

TEST_CASE("UlidGenerator next_now uses the wall clock", "[ulid]") {
  UlidGenerator gen(8);
  const std::string id = gen.next_now();
  REQUIRE(id.size() == kEncodedLength);
  // Any current date sorts after the 2020-01-01 prefix.
  CHECK(timestamp_part(id) > timestamp_part(encode_ulid(compose_ulid(1577836800000ULL, {}))));
  CHECK(gen.state().last_timestamp > 1577836800000ULL);
}
