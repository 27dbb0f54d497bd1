#include "dqv/core/version.h"

#include "commands/show_report.h"
#include "commands/validate.h"

#include <iostream>
#include <string>

namespace {

void print_usage() {
  std::cerr << "dqv_cli " << dqv::core::kBuildVersion << " - partitioned data-quality validator\n\n"
            << "Usage:\n"
            << "  dqv_cli validate --rules <file> (--data <file> | --sqlite <db> --table <name>) "
               "[options]\n"
            << "  dqv_cli show-report --audit-db <db> (--report-id <id> | --dataset <name>)\n"
            << "  dqv_cli --version\n\n"
            << "Run 'dqv_cli <command> --help' for the options of a command.\n"
            << "Exit codes: 0 passed, 2 quality gate failed, 1 error.\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  const std::string subcommand = argv[1];
  if (subcommand == "validate") {
    return cmd_validate(argc, argv);
  }
  if (subcommand == "show-report") {
    return cmd_show_report(argc, argv);
  }
  if (subcommand == "--version") {
    std::cout << "dqv_cli " << dqv::core::kBuildVersion << "\n";
    return 0;
  }
  if (subcommand == "--help" || subcommand == "-h") {
    print_usage();
    return 0;
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_usage();
  return 1;
}
