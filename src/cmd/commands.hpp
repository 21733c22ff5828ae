#pragma once

#include <string>

#include "math/sequence.hpp"
#include "sys/util.hpp"

class Commands {
 public:
  explicit Commands(const Settings& settings) : settings(settings) {}

  static void help();

  // official commands

  void validate(const std::string& num_terms);

  void evaluate(const std::string& num_terms);

  void conjecture(const std::string& num_terms);

  void row(const std::string& generation);

  void check(const std::string& path);

  void export_(const std::string& path);

  // hidden commands

  void testAll();

  void testFast();

  void testSlow();

 private:
  const Settings& settings;

  static void initLog(bool silent);

  int64_t getNumTerms(const std::string& num_terms) const;

  void printTerms(const Sequence& seq) const;
};
