#pragma once

#include <cstdint>
#include <map>
#include <string>

class Setup {
 public:
  static const std::string NUM_TERMS_KEY;
  static const std::string LOG_LEVEL_KEY;

  static std::string getHomeNoCheck();

  static const std::string& getHome();

  static void setHome(const std::string& home);

  static std::string getSetupValue(const std::string& key);

  static int64_t getSetupInt(const std::string& key, int64_t default_value);

  static int64_t getDefaultNumTerms();

 private:
  static constexpr int64_t UNDEFINED_INT = -2;  // cannot use -1

  static std::string HOME;
  static std::map<std::string, std::string> SETUP;
  static bool LOADED_SETUP;
  static int64_t NUM_TERMS;

  static void loadSetup();
};
