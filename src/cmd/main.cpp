#include <cctype>
#include <cstdlib>
#include <iostream>

#include "cmd/commands.hpp"
#include "sys/log.hpp"
#include "sys/util.hpp"

bool isNumberArg(const std::string& arg) {
  if (arg.empty()) {
    return false;
  }
  const size_t start = (arg[0] == '-') ? 1 : 0;
  if (start == arg.size()) {
    return false;
  }
  for (size_t i = start; i < arg.size(); i++) {
    if (!std::isdigit(static_cast<unsigned char>(arg[i]))) {
      return false;
    }
  }
  return true;
}

int dispatch(Settings settings, const std::vector<std::string>& args) {
  // pre-flight checks
  if (args.empty()) {
    Commands::help();
    return EXIT_SUCCESS;
  }
  std::string cmd = args.front();
  if (settings.print_as_b_file && cmd != "eval" && cmd != "conj" &&
      cmd != "check") {
    Log::get().error("Option -b not allowed for this command", true);
  }
  if (cmd == "help") {
    Commands::help();
    return EXIT_SUCCESS;
  }

  Commands commands(settings);

  // official commands
  if (isNumberArg(cmd)) {
    commands.validate(cmd);
  } else if (cmd == "validate") {
    commands.validate(args.at(1));
  } else if (cmd == "evaluate" || cmd == "eval") {
    commands.evaluate(args.size() > 1 ? args.at(1) : std::string());
  } else if (cmd == "conjecture" || cmd == "conj") {
    commands.conjecture(args.size() > 1 ? args.at(1) : std::string());
  } else if (cmd == "row") {
    commands.row(args.at(1));
  } else if (cmd == "check") {
    commands.check(args.at(1));
  } else if (cmd == "export") {
    commands.export_(args.at(1));
  }
#ifndef A300793_VERSION
  // hidden commands (only in development versions)
  else if (cmd == "test") {
    commands.testAll();
  } else if (cmd == "test-fast") {
    commands.testFast();
  } else if (cmd == "test-slow") {
    commands.testSlow();
  }
#endif
  // unknown command
  else {
    std::cerr << "Unknown command: " << cmd << std::endl;
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}

int main(int argc, char* argv[]) {
  try {
    Settings settings;
    auto args = settings.parseArgs(argc, argv);
    return dispatch(settings, args);
  } catch (const std::exception& e) {
    std::cerr << e.what() << std::endl;
    return EXIT_FAILURE;
  }
}
