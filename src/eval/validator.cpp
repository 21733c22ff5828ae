#include "eval/validator.hpp"

#include <iostream>

#include "eval/conjectured_recurrence.hpp"
#include "eval/proven_recurrence.hpp"
#include "sys/log.hpp"

void printb(int64_t index, const std::string &val) {
  std::cout << index << " " << val << std::endl;
}

Validator::Validator(const Settings &settings) : settings(settings) {}

report_t Validator::validateAndReport(int64_t num_terms) {
  const auto proven = ProvenRecurrence::computeTerms(num_terms);
  const auto conjectured = ConjecturedRecurrence::computeTerms(num_terms);
  return assertAgreement(proven, conjectured);
}

report_t Validator::assertAgreement(const Sequence &proven,
                                    const Sequence &conjectured) {
  if (proven.size() != conjectured.size()) {
    Log::get().error("Unexpected number of terms: " +
                         std::to_string(proven.size()) + " != " +
                         std::to_string(conjectured.size()),
                     true);
  }
  report_t report;
  report.reserve(proven.size());
  for (size_t i = 0; i < proven.size(); i++) {
    const int64_t index = i + OFFSET;
    if (proven[i] != conjectured[i]) {
      Log::get().error("Recurrences disagree at a(" + std::to_string(index) +
                           "): " + proven[i].to_string() +
                           " != " + conjectured[i].to_string(),
                       true);
    }
    report.emplace_back(index, proven[i]);
  }
  Log::get().debug("Validated " + std::to_string(report.size()) + " terms");
  return report;
}

status_t Validator::check(int64_t num_terms) {
  const auto proven = ProvenRecurrence::computeTerms(num_terms);
  const auto conjectured = ConjecturedRecurrence::computeTerms(num_terms);
  return compare(proven, conjectured, "proven recurrence",
                 settings.print_as_b_file);
}

status_t Validator::checkReference(const BFile &bfile) {
  if (bfile.offset != OFFSET) {
    Log::get().error("Unexpected offset in b-file: " +
                     std::to_string(bfile.offset));
    return status_t::ERROR;
  }
  const int64_t num_terms = bfile.terms.size();
  const auto proven = ProvenRecurrence::computeTerms(num_terms);
  auto result = compare(proven, bfile.terms, "proven recurrence",
                        settings.print_as_b_file);
  if (result == status_t::OK) {
    const auto conjectured = ConjecturedRecurrence::computeTerms(num_terms);
    result = compare(conjectured, bfile.terms, "conjectured recurrence", false);
  }
  return result;
}

status_t Validator::compare(const Sequence &actual, const Sequence &expected,
                            const std::string &name, bool print) const {
  for (size_t i = 0; i < actual.size(); i++) {
    const int64_t index = i + OFFSET;
    if (i >= expected.size() || actual[i] != expected[i]) {
      const std::string e =
          (i < expected.size()) ? expected[i].to_string() : "no term";
      if (print) {
        printb(index, actual[i].to_string() + " -> expected " + e);
      }
      Log::get().error("Unexpected value of " + name + " at a(" +
                       std::to_string(index) + "): " + actual[i].to_string() +
                       "; expected " + e);
      return status_t::ERROR;
    }
    if (print) {
      printb(index, actual[i].to_string());
    }
  }
  if (actual.size() != expected.size()) {
    Log::get().error("Unexpected number of terms of " + name + ": " +
                     std::to_string(actual.size()) + "; expected " +
                     std::to_string(expected.size()));
    return status_t::ERROR;
  }
  return status_t::OK;
}
