// CHIEFTALLY - Arbitrary Precision Unsigned Integers
// Copyright (c) 2024 CHIEFTALLY Developers
// MIT License
//
// Thin RAII wrapper over OpenSSL BIGNUM for uint256 contract values,
// wei amounts and ray (10^27) fixed-point arithmetic.

#ifndef CHIEFTALLY_CORE_BIGNUM_H
#define CHIEFTALLY_CORE_BIGNUM_H

#include "chieftally/core/types.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

typedef struct bignum_st BIGNUM;

namespace chieftally {

/// Non-negative arbitrary precision integer
class BigNum {
public:
    /// Zero
    BigNum();

    /// From a machine integer
    explicit BigNum(uint64_t value);

    BigNum(const BigNum& other);
    BigNum& operator=(const BigNum& other);
    BigNum(BigNum&& other) noexcept = default;
    BigNum& operator=(BigNum&& other) noexcept = default;
    ~BigNum() = default;

    /// From big-endian bytes (an ABI word)
    static BigNum FromBytes(const Byte* data, size_t len);

    /// From a decimal string; throws std::invalid_argument on bad input
    static BigNum FromDecimal(const std::string& dec);

    /// 10^exp
    static BigNum Pow10(unsigned exp);

    bool IsZero() const;

    /// Decimal representation
    std::string ToDecimal() const;

    /// Value as uint64 if it fits
    std::optional<uint64_t> ToUint64() const;

    /// Three-way comparison
    int Compare(const BigNum& other) const;

    BigNum operator+(const BigNum& other) const;
    BigNum& operator+=(const BigNum& other);
    BigNum operator*(const BigNum& other) const;
    /// Floor division; throws std::domain_error on zero divisor
    BigNum operator/(const BigNum& other) const;
    BigNum operator%(const BigNum& other) const;
    /// Subtraction; throws std::domain_error if the result would be negative
    BigNum operator-(const BigNum& other) const;

    bool operator==(const BigNum& other) const { return Compare(other) == 0; }
    bool operator!=(const BigNum& other) const { return Compare(other) != 0; }
    bool operator<(const BigNum& other) const { return Compare(other) < 0; }
    bool operator>(const BigNum& other) const { return Compare(other) > 0; }
    bool operator<=(const BigNum& other) const { return Compare(other) <= 0; }
    bool operator>=(const BigNum& other) const { return Compare(other) >= 0; }

private:
    struct Deleter {
        void operator()(BIGNUM* bn) const;
    };
    std::unique_ptr<BIGNUM, Deleter> bn_;

    /// Take ownership of a BIGNUM; throws std::bad_alloc on null
    static BigNum Adopt(BIGNUM* raw);
};

/// Render value / 10^decimals exactly, without trailing fractional zeros
/// ("1.5", "10", "0")
std::string FormatUnits(const BigNum& value, unsigned decimals);

/// Parse a decimal string such as "12.5" into value * 10^decimals
/// Throws std::invalid_argument if it has more than `decimals` fraction digits
BigNum ParseUnits(const std::string& text, unsigned decimals);

} // namespace chieftally

#endif // CHIEFTALLY_CORE_BIGNUM_H
