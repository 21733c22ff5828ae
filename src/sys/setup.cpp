#include "sys/setup.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

#include "sys/file.hpp"
#include "sys/log.hpp"
#include "sys/util.hpp"

const std::string Setup::NUM_TERMS_KEY("A300793_NUM_TERMS");
const std::string Setup::LOG_LEVEL_KEY("A300793_LOG_LEVEL");

std::string Setup::HOME;
std::map<std::string, std::string> Setup::SETUP;
bool Setup::LOADED_SETUP = false;
int64_t Setup::NUM_TERMS = UNDEFINED_INT;

std::string Setup::getHomeNoCheck() {
  if (!HOME.empty()) {
    return HOME;
  }
  auto home = std::getenv("A300793_HOME");
  std::string result;
  if (home) {
    result = std::string(home);
  } else {
    result = getHomeDir() + FILE_SEP + "a300793" + FILE_SEP;
  }
  ensureTrailingFileSep(result);
  return result;
}

const std::string& Setup::getHome() {
  if (HOME.empty()) {
    setHome(getHomeNoCheck());
  }
  return HOME;
}

void Setup::setHome(const std::string& home) {
  HOME = home;
  ensureTrailingFileSep(HOME);
  // configuration is bound to the home directory
  SETUP.clear();
  LOADED_SETUP = false;
  NUM_TERMS = UNDEFINED_INT;
  Log::get().debug("Using home directory \"" + HOME + "\"");
}

std::string Setup::getSetupValue(const std::string& key) {
  if (!LOADED_SETUP) {
    loadSetup();
    LOADED_SETUP = true;
  }
  auto it = SETUP.find(key);
  if (it != SETUP.end()) {
    return it->second;
  }
  return std::string();
}

int64_t Setup::getSetupInt(const std::string& key, int64_t default_value) {
  auto s = getSetupValue(key);
  if (s.empty()) {
    return default_value;
  }
  size_t pos = 0;
  int64_t result = 0;
  try {
    result = std::stoll(s, &pos);
  } catch (const std::exception&) {
    pos = 0;
  }
  if (pos != s.size()) {
    Log::get().error("Invalid value for " + key + " in setup.txt: " + s, true);
  }
  return result;
}

int64_t Setup::getDefaultNumTerms() {
  if (NUM_TERMS == UNDEFINED_INT) {
    const auto n = getSetupInt(NUM_TERMS_KEY, Settings::DEFAULT_NUM_TERMS);
    if (n < 0) {
      Log::get().error("Invalid value for " + NUM_TERMS_KEY + " in setup.txt: " +
                           std::to_string(n),
                       true);
    }
    NUM_TERMS = n;
  }
  return NUM_TERMS;
}

void throwSetupParseError(const std::string& line) {
  Log::get().error("Invalid line in setup.txt: " + line, true);
}

void Setup::loadSetup() {
  std::ifstream in(getHome() + "setup.txt");
  if (in.good()) {
    std::string line;
    while (std::getline(in, line)) {
      trimString(line);
      if (line.empty() || line[0] == '#') {
        continue;
      }
      auto pos = line.find('=');
      if (pos == std::string::npos) {
        throwSetupParseError(line);
      }
      auto key = line.substr(0, pos);
      auto value = line.substr(pos + 1);
      trimString(key);
      trimString(value);
      std::transform(key.begin(), key.end(), key.begin(), ::toupper);
      if (key.empty() || value.empty()) {
        throwSetupParseError(line);
      }
      SETUP[key] = value;
    }
  }
}
