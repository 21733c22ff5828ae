#pragma once

#include <cstdint>
#include <iostream>
#include <string>

class BigNumber;

/**
 * Exact signed integer. Values are kept in a plain int64 as long as they fit
 * and are promoted to an arbitrary-precision BigNumber when an operation
 * would overflow.
 */
class Number {
 public:
  static const Number ZERO;
  static const Number ONE;
  static const Number MINUS_ONE;

  Number();

  Number(const Number& n);

  Number(int64_t value);

  Number(const std::string& s);

  ~Number();

  Number& operator=(const Number& n);

  bool operator==(const Number& n) const;

  bool operator!=(const Number& n) const;

  bool operator<(const Number& n) const;

  bool operator>(const Number& n) const;

  bool operator<=(const Number& n) const;

  bool operator>=(const Number& n) const;

  Number& negate();

  Number& operator+=(const Number& n);

  Number& operator-=(const Number& n);

  Number& operator*=(const Number& n);

  bool isBig() const { return big != nullptr; }

  int64_t asInt() const;

  int64_t getNumUsedWords() const;

  friend std::ostream& operator<<(std::ostream& out, const Number& n);

  std::string to_string() const;

  static void readIntString(std::istream& in, std::string& out);

 private:
  void convertToBig();

  int64_t value;
  BigNumber* big;
};
