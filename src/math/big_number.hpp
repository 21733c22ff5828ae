#pragma once

#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

/**
 * Arbitrary-precision signed integer in sign-magnitude representation.
 *
 * The magnitude is stored in 64-bit words, least significant word first.
 * Words are always normalized: there are no leading zero words, zero is
 * represented by an empty word vector and is never negative.
 */
class BigNumber {
 public:
  BigNumber();

  BigNumber(int64_t value);

  BigNumber(const std::string& s);

  bool operator==(const BigNumber& n) const;

  bool operator!=(const BigNumber& n) const;

  bool operator<(const BigNumber& n) const;

  BigNumber& negate();

  BigNumber& operator+=(const BigNumber& n);

  BigNumber& operator*=(const BigNumber& n);

  std::string toString() const;

  friend std::ostream& operator<<(std::ostream& out, const BigNumber& n);

  bool isZero() const { return words.empty(); }

  bool fitsInt() const;

  int64_t asInt() const;

  int64_t getNumUsedWords() const;

 private:
  static constexpr uint64_t LOW_BIT_MASK = 0x00000000FFFFFFFFull;

  void load(const std::string& s);

  void trim();

  int compareAbs(const BigNumber& n) const;

  void add(const BigNumber& n);

  void sub(const BigNumber& n);

  void mulShort(uint64_t n);

  void shift(int64_t n);

  uint64_t divShort(uint64_t n);

  std::vector<uint64_t> words;
  bool is_negative;
};
