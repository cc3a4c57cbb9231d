#include "ulidkit/core/version.h"

#include "commands/generate.h"
#include "commands/record.h"
#include <iostream>
#include <string>

namespace {

void print_usage() {
  std::cout << "ulidkit_cli v" << ulidkit::core::kBuildVersion << "\n"
            << "Usage:\n"
            << "  ulidkit_cli generate [--count <n>] [--seed <u64>] [--timestamp <ms>]\n"
            << "                       [--prefix <p>] [--json] [--log-level <level>]\n"
            << "  ulidkit_cli record add --kind <kind> [--payload <text>] [--db <path>]\n"
            << "                         [--seed <u64>] [--log-level <level>]\n"
            << "  ulidkit_cli record list [--kind <kind>] [--db <path>] [--log-level <level>]\n"
            << "  ulidkit_cli version\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  const std::string subcommand = argv[1];
  if (subcommand == "generate") {
    return cmd_generate(argc, argv);
  }
  if (subcommand == "record") {
    const std::string action = argc > 2 ? argv[2] : "";
    if (action == "add") {
      return cmd_record_add(argc, argv);
    }
    if (action == "list") {
      return cmd_record_list(argc, argv);
    }
    std::cerr << "Unknown record action: '" << action << "' (valid: add, list)\n";
    return 1;
  }
  if (subcommand == "version" || subcommand == "--version") {
    std::cout << ulidkit::core::kBuildVersion << "\n";
    return 0;
  }
  if (subcommand == "help" || subcommand == "--help") {
    print_usage();
    return 0;
  }

  std::cerr << "Unknown subcommand: " << subcommand << "\n";
  print_usage();
  return 1;
}
