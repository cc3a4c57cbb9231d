#pragma once

// cmd_generate: print one or more ULIDs.
// Usage: ulidkit_cli generate [--count <n>] [--seed <u64>] [--timestamp <ms>]
//                             [--prefix <p>] [--json] [--log-level <level>]
// Without --seed the generator is seeded from std::random_device.
// Without --timestamp each id reads the system clock.
int cmd_generate(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
