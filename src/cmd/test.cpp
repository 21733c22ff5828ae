#include "cmd/test.hpp"

#include <cstdio>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

#include "eval/conjectured_recurrence.hpp"
#include "eval/proven_recurrence.hpp"
#include "eval/validator.hpp"
#include "seq/bfile.hpp"
#include "sys/file.hpp"
#include "sys/log.hpp"
#include "sys/setup.hpp"

Test::Test() : gen(std::random_device()()) {
  const std::string home = getTmpDir() + "a300793" + FILE_SEP;
  ensureDir(home);
  Setup::setHome(home);
}

void Test::all() {
  fast();
  slow();
}

void Test::fast() {
  number();
  sequence();
  advanceRow();
  provenRecurrence();
  conjecturedRecurrence();
  knownTerms();
  validator();
  inputErrors();
  bFile();
  setup();
}

void Test::slow() {
  randomNumber(100);
  prefixExtension(60);
  largeTerms(300);
}

std::string Test::getTestBFilePath(const std::string& name) const {
  return std::string("tests") + FILE_SEP + "bfiles" + FILE_SEP + name;
}

Sequence Test::loadTestBFile(const std::string& name) {
  return BFile::read(getTestBFilePath(name)).terms;
}

void check_num(const Number& m, const std::string& s) {
  if (m.to_string() != s) {
    Log::get().error("Expected " + m.to_string() + " to be " + s, true);
  }
}

void check_less(const Number& m, const Number& n) {
  if (!(m < n)) {
    Log::get().error(
        "Expected " + m.to_string() + " to be less than " + n.to_string(),
        true);
  }
}

void check_seq(const Sequence& s, const Sequence& expected,
               const std::string& what) {
  if (s != expected) {
    Log::get().error("Unexpected result of " + what + ": " + s.to_string() +
                         "; expected " + expected.to_string(),
                     true);
  }
}

template <class E, class F>
void check_throws(const std::string& what, F f) {
  bool thrown = false;
  try {
    f();
  } catch (const E&) {
    thrown = true;
  }
  if (!thrown) {
    Log::get().error("Expected exception for " + what, true);
  }
}

void testNumberDigits(int64_t num_digits, bool test_negative) {
  for (char d = '1'; d <= '9'; d++) {
    std::string str;
    if (test_negative) {
      str += '-';
    }
    str += d;
    for (int64_t i = 0; i < num_digits; i++) {
      str += d;
      Number n(str);
      check_num(n, str);
    }
  }
}

void Test::number() {
  Log::get().info("Testing number");
  constexpr int64_t max = std::numeric_limits<int64_t>::max();
  constexpr int64_t min = std::numeric_limits<int64_t>::min();
  check_num(Number::ZERO, "0");
  check_num(Number::ONE, "1");
  check_num(Number::MINUS_ONE, "-1");
  check_num(Number("1"), "1");
  check_num(Number("2 "), "2");
  check_num(Number(" 3"), "3");
  check_num(Number("-4 "), "-4");
  check_num(Number("-0"), "0");
  check_less(Number::ZERO, Number::ONE);
  check_less(Number::MINUS_ONE, Number::ZERO);
  check_num(max, std::to_string(max));
  check_num(min, std::to_string(min));
  Number o(1);
  o += Number(2);
  check_num(o, "3");
  o += Number(-5);
  check_num(o, "-2");
  o *= Number(5);
  check_num(o, "-10");
  o *= Number(-10);
  check_num(o, "100");
  o -= Number(101);
  check_num(o, "-1");

  // promotion to big numbers
  Number m(max);
  m += Number::ONE;
  check_num(m, "9223372036854775808");
  if (!m.isBig()) {
    Log::get().error("Expected big number after overflow", true);
  }
  m -= Number::ONE;
  check_num(m, std::to_string(max));
  if (m != Number(max) || m.asInt() != max) {
    Log::get().error("Unexpected value after demotion", true);
  }
  m = Number(min);
  m.negate();
  check_num(m, "9223372036854775808");
  m = Number(min);
  m *= Number::MINUS_ONE;
  check_num(m, "9223372036854775808");
  m = Number(min);
  m += Number::MINUS_ONE;
  check_num(m, "-9223372036854775809");
  check_less(m, Number(min));
  m = Number(min);
  if (m.asInt() != min) {
    Log::get().error("Unexpected value of minimum integer", true);
  }

  // multiplication of big numbers
  Number p("18446744073709551616");
  p *= p;
  check_num(p, "340282366920938463463374607431768211456");
  Number q("1000000000000000000000000000001");
  q *= Number("999999999999999999999999999999");
  check_num(q, std::string(60, '9'));
  Number c("-18446744073709551616");
  c *= Number(-2);
  check_num(c, "36893488147419103232");
  c *= Number::MINUS_ONE;
  check_num(c, "-36893488147419103232");
  c += Number("36893488147419103232");
  check_num(c, "0");
  if (c != Number::ZERO) {
    Log::get().error("Expected big zero to be equal to zero", true);
  }
  check_throws<std::runtime_error>("integer overflow", [] {
    Number("99999999999999999999").asInt();
  });
  testNumberDigits(200, false);
  testNumberDigits(200, true);
}

void Test::randomNumber(size_t tests) {
  Log::get().info("Testing random number");
  std::string str, inv, nines;
  for (size_t i = 0; i < tests; i++) {
    // small number test
    const int64_t v = static_cast<int32_t>(gen());
    const int64_t w = static_cast<int32_t>(gen());
    check_num(Number(v), std::to_string(v));
    Number vv(v);
    Number ww(w);
    if (v < w) {
      check_less(vv, ww);
    } else if (w < v) {
      check_less(ww, vv);
    }
    auto xx = vv;
    xx += ww;
    check_num(xx, std::to_string(v + w));
    xx = vv;
    xx *= ww;
    check_num(xx, std::to_string(v * w));
    xx = vv;
    xx -= ww;
    check_num(xx, std::to_string(v - w));

    // big number test
    const int64_t num_digits = (gen() % 2000) + 1;
    char ch;
    str.clear();
    inv.clear();
    nines.clear();
    if (gen() % 2) {
      str += '-';
      inv += '-';
      nines += '-';
    }
    ch = static_cast<char>((gen() % 9));
    str += '1' + ch;
    inv += '8' - ch;
    nines += '9';
    for (int64_t j = 1; j < num_digits; j++) {
      ch = static_cast<char>((gen() % 10));
      str += '0' + ch;
      inv += '9' - ch;
      nines += '9';
    }
    Number n(str);
    check_num(n, str);
    check_num(Number(n), str);
    Number triple1 = n;
    Number triple2 = n;
    Number triple3(3);
    triple1 += n;
    triple1 += n;
    triple2 *= Number(3);
    triple3 *= n;
    check_num(triple1, triple2.to_string());
    check_num(triple1, triple3.to_string());
    auto t = triple3;
    auto neg = n;
    neg.negate();
    t += neg;
    t += neg;
    check_num(t, n.to_string());
    auto shifted = n;
    shifted *= Number("1000000000000000000000000000000");
    check_num(shifted, str + std::string(30, '0'));
    if (str.size() > 2) {
      auto smaller = str.substr(0, str.size() - 1);
      Number s(smaller);
      if (str[0] == '-') {
        check_less(n, s);
      } else {
        check_less(s, n);
      }
    }
    Number o(inv);
    o += n;
    check_num(o, nines);
  }
}

void Test::sequence() {
  Log::get().info("Testing sequence");
  Sequence s({1, 2, 3, 4, 5, 6, 7, 8, 9, 10});
  Sequence t({2, 3, 4, 5, 6, 7, 8, 9});
  auto u = s.subsequence(1, 8);
  if (t != u) {
    Log::get().error("Error comparing subsequence", true);
  }
  if (t.to_string() != "2,3,4,5,6,7,8,9") {
    Log::get().error("Error printing sequence", true);
  }
  check_num(t.sum(), "44");
  check_num(Sequence().sum(), "0");
  if (!s.subsequence(0, 3).is_prefix_of(s) || !s.is_prefix_of(s) ||
      !Sequence().is_prefix_of(s)) {
    Log::get().error("Sequence should be a prefix", true);
  }
  if (t.is_prefix_of(s) || s.is_prefix_of(t)) {
    Log::get().error("Sequence should not be a prefix", true);
  }
  std::stringstream buf;
  Sequence({5, -7}).to_b_file(buf, 1);
  if (buf.str() != "1 5\n2 -7\n") {
    Log::get().error("Error printing b-file: " + buf.str(), true);
  }
}

void Test::advanceRow() {
  Log::get().info("Testing advance row");
  check_seq(ProvenRecurrence::advanceRow(Sequence({-1})), Sequence({1, 2}),
            "advanceRow([-1])");
  check_seq(ProvenRecurrence::advanceRow(Sequence({1, 2})),
            Sequence({-2, -5, -6}), "advanceRow([1,2])");
  check_seq(ProvenRecurrence::advanceRow(Sequence({-2, -5, -6})),
            Sequence({6, 21, 24, 24}), "advanceRow([-2,-5,-6])");
  check_seq(ProvenRecurrence::advanceRow(Sequence({3, -4})),
            Sequence({-6, -15, 12}), "advanceRow([3,-4])");

  // input row is not modified
  Sequence row({-2, -5, -6});
  const auto copy = row;
  ProvenRecurrence::advanceRow(row);
  check_seq(row, copy, "row after advanceRow");

  // rows of later generations
  check_seq(ProvenRecurrence::computeRow(1), Sequence({-1}), "computeRow(1)");
  check_seq(ProvenRecurrence::computeRow(5),
            Sequence({-24, -108, -189, -120, -120}), "computeRow(5)");
  const auto row7 = ProvenRecurrence::computeRow(7);
  check_seq(row7, Sequence({-720, -4680, -12870, -19305, -18270, -2520, -5040}),
            "computeRow(7)");
  auto a7 = row7.sum();
  a7.negate();
  check_num(a7, "63405");
  for (int64_t n = 1; n <= 30; n++) {
    if (static_cast<int64_t>(ProvenRecurrence::computeRow(n).size()) != n) {
      Log::get().error("Unexpected row length in generation " +
                           std::to_string(n),
                       true);
    }
  }
}

void Test::provenRecurrence() {
  Log::get().info("Testing proven recurrence");
  if (!ProvenRecurrence::computeTerms(0).empty()) {
    Log::get().error("Expected empty sequence", true);
  }
  for (int64_t n = 1; n <= 20; n++) {
    if (static_cast<int64_t>(ProvenRecurrence::computeTerms(n).size()) != n) {
      Log::get().error("Unexpected number of terms: " + std::to_string(n),
                       true);
    }
  }
  const auto terms = ProvenRecurrence::computeTerms(30);
  check_seq(terms.subsequence(0, 5), Sequence({1, 3, 13, 75, 561}),
            "proven terms");
  check_seq(ProvenRecurrence::computeTerms(30), terms, "repeated evaluation");

  // incremental evaluation
  ProvenRecurrence rec;
  for (size_t i = 0; i < 10; i++) {
    if (rec.next() != terms[i]) {
      Log::get().error("Unexpected term in incremental evaluation", true);
    }
  }
  if (rec.getGeneration() != 11 || rec.getRow().size() != 11) {
    Log::get().error("Unexpected generation after incremental evaluation",
                     true);
  }
  rec.reset();
  if (rec.getGeneration() != 1 || rec.next() != Number::ONE) {
    Log::get().error("Unexpected term after reset", true);
  }
}

void Test::conjecturedRecurrence() {
  Log::get().info("Testing conjectured recurrence");
  if (!ConjecturedRecurrence::computeTerms(0).empty()) {
    Log::get().error("Expected empty sequence", true);
  }
  check_seq(ConjecturedRecurrence::computeTerms(1), Sequence({1}),
            "conjectured terms");
  check_seq(ConjecturedRecurrence::computeTerms(2), Sequence({1, 3}),
            "conjectured terms");
  check_seq(ConjecturedRecurrence::computeTerms(3), Sequence({1, 3, 13}),
            "conjectured terms");
  check_seq(ConjecturedRecurrence::computeTerms(5),
            Sequence({1, 3, 13, 75, 561}), "conjectured terms");
  const auto terms = ConjecturedRecurrence::computeTerms(40);
  check_seq(ConjecturedRecurrence::computeTerms(40), terms,
            "repeated evaluation");

  ConjecturedRecurrence rec;
  for (size_t i = 0; i < terms.size(); i++) {
    if (rec.getIndex() != static_cast<int64_t>(i) || rec.next() != terms[i]) {
      Log::get().error("Unexpected term in incremental evaluation", true);
    }
  }
  rec.reset();
  if (rec.getIndex() != 0 || rec.next() != Number::ONE) {
    Log::get().error("Unexpected term after reset", true);
  }
}

void Test::knownTerms() {
  Log::get().info("Testing known terms");
  const auto expected = loadTestBFile("b300793.txt");
  if (expected.size() != 100) {
    Log::get().error("Unexpected number of terms in test b-file", true);
  }
  check_num(expected[11], "116065424475");
  check_seq(ProvenRecurrence::computeTerms(expected.size()), expected,
            "proven recurrence");
  check_seq(ConjecturedRecurrence::computeTerms(expected.size()), expected,
            "conjectured recurrence");
}

void Test::validator() {
  Log::get().info("Testing validator");
  const auto expected = loadTestBFile("b300793.txt");
  Validator validator(settings);
  for (int64_t n = 0; n <= 50; n++) {
    const auto report = validator.validateAndReport(n);
    if (static_cast<int64_t>(report.size()) != n) {
      Log::get().error("Unexpected report size: " + std::to_string(n), true);
    }
    for (size_t i = 0; i < report.size(); i++) {
      if (report[i].first != static_cast<int64_t>(i + 1) ||
          report[i].second != expected[i]) {
        Log::get().error("Unexpected report entry for a(" +
                             std::to_string(i + 1) + ")",
                         true);
      }
    }
  }

  // disagreeing terms
  const auto terms = expected.subsequence(0, 20);
  if (Validator::assertAgreement(terms, terms).size() != 20) {
    Log::get().error("Unexpected report size for agreeing terms", true);
  }
  auto wrong = terms;
  wrong[11] += Number::ONE;
  check_throws<std::runtime_error>("disagreeing term", [&] {
    Validator::assertAgreement(terms, wrong);
  });
  check_throws<std::runtime_error>("disagreeing first term", [&] {
    Validator::assertAgreement(Sequence({2}), terms.subsequence(0, 1));
  });
  check_throws<std::runtime_error>("disagreeing number of terms", [&] {
    Validator::assertAgreement(terms, terms.subsequence(0, 19));
  });
  check_throws<std::runtime_error>("missing terms", [&] {
    Validator::assertAgreement(Sequence(), terms);
  });
  if (validator.check(50) != status_t::OK) {
    Log::get().error("Expected successful check", true);
  }
  auto bfile = BFile::read(getTestBFilePath("b300793.txt"));
  if (validator.checkReference(bfile) != status_t::OK) {
    Log::get().error("Expected successful check of reference b-file", true);
  }
  bfile = BFile::read(getTestBFilePath("b300793_invalid.txt"));
  if (validator.checkReference(bfile) != status_t::ERROR) {
    Log::get().error("Expected failed check of invalid b-file", true);
  }
  bfile = BFile::read(getTestBFilePath("b300793_offset.txt"));
  if (validator.checkReference(bfile) != status_t::ERROR) {
    Log::get().error("Expected failed check of b-file with wrong offset",
                     true);
  }
}

void Test::inputErrors() {
  Log::get().info("Testing input errors");
  check_throws<std::invalid_argument>("negative number of proven terms", [] {
    ProvenRecurrence::computeTerms(-1);
  });
  check_throws<std::invalid_argument>(
      "negative number of conjectured terms",
      [] { ConjecturedRecurrence::computeTerms(-1); });
  check_throws<std::invalid_argument>("negative number of validated terms",
                                      [this] {
                                        Validator validator(settings);
                                        validator.validateAndReport(-1);
                                      });
  check_throws<std::invalid_argument>(
      "generation 0", [] { ProvenRecurrence::computeRow(0); });
  check_throws<std::invalid_argument>(
      "empty row", [] { ProvenRecurrence::advanceRow(Sequence()); });
  for (auto& s : {"abc", "-3", "2.5", "", "12x"}) {
    check_throws<std::invalid_argument>(
        "number of terms '" + std::string(s) + "'",
        [&s] { parseNumTerms(s); });
  }
  if (parseNumTerms("42") != 42 || parseNumTerms(" 7 ") != 7 ||
      parseNumTerms("0") != 0) {
    Log::get().error("Error parsing number of terms", true);
  }
  check_throws<std::invalid_argument>("number '12a'", [] { Number("12a"); });
  check_throws<std::invalid_argument>("empty number", [] { Number(""); });
  check_throws<std::invalid_argument>("log level",
                                      [] { Log::parseLevel("verbose"); });
}

void Test::bFile() {
  Log::get().info("Testing b-files");
  const auto full = BFile::read(getTestBFilePath("b300793.txt"));
  if (full.offset != 1 || full.terms.size() != 100) {
    Log::get().error("Unexpected content of b-file", true);
  }
  const auto gz = BFile::read(getTestBFilePath("b300793_short.txt.gz"));
  if (gz.offset != 1) {
    Log::get().error("Unexpected offset in gzip b-file", true);
  }
  check_seq(gz.terms, full.terms.subsequence(0, 30), "gzip b-file");
  const auto shifted = BFile::read(getTestBFilePath("b300793_offset.txt"));
  if (shifted.offset != 0 || shifted.terms.size() != 10) {
    Log::get().error("Unexpected content of b-file with offset 0", true);
  }

  // parsing
  std::stringstream in(
      "# comment\n5 -7\n6 0\n\n  7 123456789012345678901234567890\n");
  const auto parsed = BFile::parse(in, "stream");
  if (parsed.offset != 5 || parsed.terms.size() != 3) {
    Log::get().error("Unexpected result of b-file parser", true);
  }
  check_num(parsed.terms[0], "-7");
  check_num(parsed.terms[1], "0");
  check_num(parsed.terms[2], "123456789012345678901234567890");

  // errors
  for (auto& name : {"b300793_gap.txt", "b300793_garbage.txt",
                     "b300793_trailing.txt",
                     "b300793_missing.txt", "b300793_missing.txt.gz"}) {
    const auto path = getTestBFilePath(name);
    check_throws<std::runtime_error>(path, [&path] { BFile::read(path); });
  }
  for (auto& line : {"1 3x", "1 13junk 99", "1 5 6", "1 7\t#"}) {
    check_throws<std::runtime_error>(
        "b-file line '" + std::string(line) + "'", [&line] {
          std::stringstream bad(line);
          BFile::parse(bad, "stream");
        });
  }
  std::stringstream spaces("1 5  \r\n2 -6\t\n");
  check_seq(BFile::parse(spaces, "stream").terms, Sequence({5, -6}),
            "b-file with trailing whitespace");
  check_throws<std::runtime_error>("empty b-file", [] {
    std::stringstream empty("# only a comment\n");
    BFile::parse(empty, "empty");
  });

  // writing
  const BFile out(Validator::OFFSET, ProvenRecurrence::computeTerms(40));
  for (auto& name : {"b300793_test.txt", "b300793_test.txt.gz"}) {
    const std::string path = getTmpDir() + "a300793" + FILE_SEP + name;
    out.write(path, "test");
    const auto back = BFile::read(path);
    if (back.offset != out.offset) {
      Log::get().error("Unexpected offset in " + path, true);
    }
    check_seq(back.terms, out.terms, "written b-file " + path);
    std::remove(path.c_str());
  }
}

void Test::setup() {
  Log::get().info("Testing setup");
  const std::string home = Setup::getHome();
  const std::string file = home + "setup.txt";
  {
    std::ofstream out(file);
    out << "# test configuration" << std::endl
        << "a300793_num_terms = 25" << std::endl
        << "A300793_LOG_LEVEL=info" << std::endl;
  }
  Setup::setHome(home);
  if (Setup::getDefaultNumTerms() != 25 ||
      Setup::getSetupValue(Setup::LOG_LEVEL_KEY) != "info" ||
      Setup::getSetupInt("A300793_UNKNOWN", 7) != 7) {
    Log::get().error("Unexpected setup values", true);
  }
  {
    std::ofstream out(file);
    out << "A300793_NUM_TERMS=abc" << std::endl;
  }
  Setup::setHome(home);
  check_throws<std::runtime_error>("invalid setup value",
                                   [] { Setup::getDefaultNumTerms(); });
  {
    std::ofstream out(file);
    out << "A300793_NUM_TERMS" << std::endl;
  }
  Setup::setHome(home);
  check_throws<std::runtime_error>(
      "invalid setup line", [] { Setup::getSetupValue(Setup::NUM_TERMS_KEY); });
  std::remove(file.c_str());
  Setup::setHome(home);
  if (Setup::getDefaultNumTerms() != Settings::DEFAULT_NUM_TERMS) {
    Log::get().error("Unexpected default number of terms", true);
  }

  // command-line options
  std::vector<std::string> strs = {"a300793", "-t", "15", "-b",
                                   "-l",      "info", "eval", "-3"};
  std::vector<char*> argv;
  for (auto& s : strs) {
    argv.push_back(&s[0]);
  }
  Settings s;
  auto args = s.parseArgs(argv.size(), argv.data());
  if (s.num_terms != 15 || !s.print_as_b_file ||
      args != std::vector<std::string>({"eval", "-3"})) {
    Log::get().error("Unexpected result of argument parser", true);
  }
  strs = {"a300793", "-x"};
  argv.clear();
  for (auto& t : strs) {
    argv.push_back(&t[0]);
  }
  check_throws<std::runtime_error>("unknown option", [&argv] {
    Settings t;
    t.parseArgs(argv.size(), argv.data());
  });
}

void Test::prefixExtension(int64_t max_terms) {
  Log::get().info("Testing prefix extension");
  auto proven = ProvenRecurrence::computeTerms(1);
  auto conjectured = ConjecturedRecurrence::computeTerms(1);
  for (int64_t n = 1; n <= max_terms; n++) {
    auto next_proven = ProvenRecurrence::computeTerms(n + 1);
    auto next_conjectured = ConjecturedRecurrence::computeTerms(n + 1);
    if (!proven.is_prefix_of(next_proven) ||
        !conjectured.is_prefix_of(next_conjectured)) {
      Log::get().error("Terms are not extended at n=" + std::to_string(n),
                       true);
    }
    proven = next_proven;
    conjectured = next_conjectured;
  }
}

void Test::largeTerms(int64_t num_terms) {
  Log::get().info("Testing " + std::to_string(num_terms) + " terms");
  Validator validator(settings);
  const auto report = validator.validateAndReport(num_terms);
  const auto expected = loadTestBFile("b300793.txt");
  for (size_t i = 0; i < expected.size(); i++) {
    if (report.at(i).second != expected[i]) {
      Log::get().error("Unexpected value for a(" + std::to_string(i + 1) + ")",
                       true);
    }
  }
  if (report.at(199).second.to_string().size() != 433 ||
      report.at(299).second.to_string().size() != 703) {
    Log::get().error("Unexpected number of digits of large terms", true);
  }
}
