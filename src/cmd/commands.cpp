#include "cmd/commands.hpp"

#include <cstdlib>
#include <iostream>

#include "cmd/test.hpp"
#include "eval/conjectured_recurrence.hpp"
#include "eval/proven_recurrence.hpp"
#include "eval/validator.hpp"
#include "seq/bfile.hpp"
#include "sys/log.hpp"

static const std::string BFILE_COMMENT =
    "A300793: n-th derivative of arcsinh(1/x) at x=1 times (-2)^n/sqrt(2)";

void Commands::initLog(bool silent) {
  if (silent && Log::get().level != Log::Level::DEBUG) {
    Log::get().silent = true;
  } else {
    Log::get().silent = false;
    Log::get().info("Starting " + Version::INFO);
  }
}

void Commands::help() {
  initLog(true);
  Settings settings;
  std::cout << "Welcome to " << Version::INFO
            << ". Computes terms of https://oeis.org/A300793" << std::endl
            << std::endl;
  std::cout << "Usage: a300793 <command> <options>" << std::endl << std::endl;
  std::cout << "Commands:" << std::endl;
  std::cout << "  <number>             Same as validate <number>" << std::endl;
  std::cout << "  validate  <number>   Compute terms using both recurrences "
               "and verify that they agree"
            << std::endl;
  std::cout << "  eval     [<number>]  Compute terms using the proven "
               "recurrence (see -t,-b)"
            << std::endl;
  std::cout << "  conj     [<number>]  Compute terms using the conjectured "
               "recurrence (see -t,-b)"
            << std::endl;
  std::cout << "  row       <number>   Print the row of helper values b of a "
               "generation"
            << std::endl;
  std::cout << "  check     <b-file>   Verify both recurrences against a "
               "b-file (see -b)"
            << std::endl;
  std::cout << "  export    <b-file>   Write terms to a b-file, compressed if "
               "it ends with .gz (see -t)"
            << std::endl;

  std::cout << std::endl << "Options:" << std::endl;
  std::cout << "  -t <number>          Number of sequence terms (default: "
            << settings.num_terms << ")" << std::endl;
  std::cout << "  -b                   Print result in the OEIS b-file format"
            << std::endl;
  std::cout << "  -l <string>          Log level (values: "
               "debug,info,warn,error)"
            << std::endl;
}

int64_t Commands::getNumTerms(const std::string& num_terms) const {
  if (num_terms.empty()) {
    return settings.num_terms;
  }
  return parseNumTerms(num_terms);
}

void Commands::printTerms(const Sequence& seq) const {
  if (settings.print_as_b_file) {
    seq.to_b_file(std::cout, Validator::OFFSET);
  } else {
    std::cout << seq << std::endl;
  }
}

// official commands

void Commands::validate(const std::string& num_terms) {
  initLog(true);
  report_t report;
  std::string error;
  try {
    Validator validator(settings);
    report = validator.validateAndReport(getNumTerms(num_terms));
  } catch (const std::exception& e) {
    error = e.what();
  }
  if (!error.empty()) {
    std::cerr << error << std::endl;
    exit(1);
  }
  for (auto& entry : report) {
    std::cout << "a(" << entry.first << ")=" << entry.second << std::endl;
  }
}

void Commands::evaluate(const std::string& num_terms) {
  initLog(true);
  Sequence seq;
  std::string error;
  try {
    seq = ProvenRecurrence::computeTerms(getNumTerms(num_terms));
  } catch (const std::exception& e) {
    error = e.what();
  }
  if (!error.empty()) {
    std::cerr << error << std::endl;
    exit(1);
  }
  printTerms(seq);
}

void Commands::conjecture(const std::string& num_terms) {
  initLog(true);
  Sequence seq;
  std::string error;
  try {
    seq = ConjecturedRecurrence::computeTerms(getNumTerms(num_terms));
  } catch (const std::exception& e) {
    error = e.what();
  }
  if (!error.empty()) {
    std::cerr << error << std::endl;
    exit(1);
  }
  printTerms(seq);
}

void Commands::row(const std::string& generation) {
  initLog(true);
  Sequence row;
  std::string error;
  try {
    const int64_t n = parseNumTerms(generation);
    row = ProvenRecurrence::computeRow(n);
  } catch (const std::exception& e) {
    error = e.what();
  }
  if (!error.empty()) {
    std::cerr << error << std::endl;
    exit(1);
  }
  std::cout << row << std::endl;
}

void Commands::check(const std::string& path) {
  initLog(true);
  status_t result = status_t::ERROR;
  std::string error;
  try {
    auto bfile = BFile::read(path);
    Validator validator(settings);
    result = validator.checkReference(bfile);
  } catch (const std::exception& e) {
    error = e.what();
  }
  if (!error.empty()) {
    std::cerr << error << std::endl;
    exit(1);
  }
  switch (result) {
    case status_t::OK:
      std::cout << "ok" << std::endl;
      break;
    case status_t::ERROR:
      std::cout << "error" << std::endl;
      exit(1);
  }
}

void Commands::export_(const std::string& path) {
  initLog(false);
  BFile bfile(Validator::OFFSET,
              ProvenRecurrence::computeTerms(settings.num_terms));
  bfile.write(path, BFILE_COMMENT);
  Log::get().info("Exported " + std::to_string(bfile.terms.size()) +
                  " terms to " + path);
}

// hidden commands

void Commands::testAll() {
  initLog(false);
  Test test;
  test.all();
}

void Commands::testFast() {
  initLog(false);
  Test test;
  test.fast();
}

void Commands::testSlow() {
  initLog(false);
  Test test;
  test.slow();
}
