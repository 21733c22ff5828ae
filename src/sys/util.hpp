#pragma once

#include <cstdint>
#include <string>
#include <vector>

class Version {
 public:
  static const std::string INFO;
};

class Settings {
 public:
  static constexpr int64_t DEFAULT_NUM_TERMS = 10;

  int64_t num_terms;

  // flag for printing results in b-file format
  bool print_as_b_file;

  Settings();

  std::vector<std::string> parseArgs(int argc, char *argv[]);
};

// parses a non-negative number of terms; throws std::invalid_argument
int64_t parseNumTerms(const std::string &str);

void trimString(std::string &str);
