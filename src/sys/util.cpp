#include "sys/util.hpp"

#include <cctype>
#include <sstream>
#include <stdexcept>

#include "sys/log.hpp"
#include "sys/setup.hpp"

#define cstr(a) std::string(xstr(a))
#define xstr(a) ystr(a)
#define ystr(a) #a

#ifdef A300793_VERSION
const std::string Version::INFO = "A300793 v" + cstr(A300793_VERSION);
#else
const std::string Version::INFO = "A300793 developer version";
#endif

Settings::Settings()
    : num_terms(DEFAULT_NUM_TERMS),
      print_as_b_file(false) {}

enum class Option { NONE, NUM_TERMS, LOG_LEVEL };

std::vector<std::string> Settings::parseArgs(int argc, char *argv[]) {
  // defaults from setup.txt; command-line options take precedence
  num_terms = Setup::getDefaultNumTerms();
  auto level = Setup::getSetupValue(Setup::LOG_LEVEL_KEY);
  if (!level.empty()) {
    Log::get().level = Log::parseLevel(level);
  }
  Option option(Option::NONE);
  std::vector<std::string> unparsed;
  for (int i = 1; i < argc; ++i) {
    std::string arg(argv[i]);
    if (option == Option::NUM_TERMS) {
      num_terms = parseNumTerms(arg);
      option = Option::NONE;
    } else if (option == Option::LOG_LEVEL) {
      Log::get().level = Log::parseLevel(arg);
      option = Option::NONE;
    } else if (arg.size() > 1 && arg.at(0) == '-' &&
               !std::isdigit(static_cast<unsigned char>(arg.at(1)))) {
      std::string opt = arg.substr(1);
      if (opt == "t") {
        option = Option::NUM_TERMS;
      } else if (opt == "b") {
        print_as_b_file = true;
      } else if (opt == "l") {
        option = Option::LOG_LEVEL;
      } else {
        Log::get().error("Unknown option: -" + opt, true);
      }
    } else {
      unparsed.push_back(arg);
    }
  }
  if (option != Option::NONE) {
    Log::get().error("Missing argument", true);
  }
  return unparsed;
}

int64_t parseNumTerms(const std::string &str) {
  std::stringstream s(str);
  int64_t val = -1;
  s >> val;
  if (!s || !(s >> std::ws).eof() || val < 0) {
    throw std::invalid_argument("Invalid number of terms: " + str);
  }
  return val;
}

void trimString(std::string &str) {
  while (!str.empty()) {
    if (std::isspace(static_cast<unsigned char>(str.front()))) {
      str = str.substr(1);
    } else if (std::isspace(static_cast<unsigned char>(str.back()))) {
      str = str.substr(0, str.size() - 1);
    } else {
      break;
    }
  }
}
