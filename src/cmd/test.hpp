#pragma once

#include <random>
#include <string>

#include "math/sequence.hpp"
#include "sys/util.hpp"

class Test {
 public:
  Test();

  void all();

  void fast();

  void slow();

  void number();

  void randomNumber(size_t tests);

  void sequence();

  void advanceRow();

  void provenRecurrence();

  void conjecturedRecurrence();

  void knownTerms();

  void validator();

  void inputErrors();

  void bFile();

  void setup();

  void prefixExtension(int64_t max_terms);

  void largeTerms(int64_t num_terms);

 private:
  Sequence loadTestBFile(const std::string &name);

  std::string getTestBFilePath(const std::string &name) const;

  Settings settings;
  std::mt19937_64 gen;
};
