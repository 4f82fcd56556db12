// CHIEFTALLY - Arbitrary Precision Unsigned Integers
// Copyright (c) 2024 CHIEFTALLY Developers
// MIT License

#include "chieftally/core/bignum.h"

#include <openssl/bn.h>
#include <openssl/crypto.h>

#include <cctype>
#include <new>
#include <stdexcept>

namespace chieftally {

namespace {

BIGNUM* NewOrThrow() {
    BIGNUM* bn = BN_new();
    if (!bn) {
        throw std::bad_alloc();
    }
    return bn;
}

/// RAII holder for a BN_CTX scratch context
struct ContextHolder {
    BN_CTX* ctx;
    ContextHolder() : ctx(BN_CTX_new()) {
        if (!ctx) {
            throw std::bad_alloc();
        }
    }
    ~ContextHolder() { BN_CTX_free(ctx); }
    ContextHolder(const ContextHolder&) = delete;
    ContextHolder& operator=(const ContextHolder&) = delete;
};

} // anonymous namespace

void BigNum::Deleter::operator()(BIGNUM* bn) const {
    BN_free(bn);
}

BigNum::BigNum() : bn_(NewOrThrow()) {
    BN_zero(bn_.get());
}

BigNum::BigNum(uint64_t value) : bn_(NewOrThrow()) {
    if (!BN_set_word(bn_.get(), static_cast<BN_ULONG>(value))) {
        throw std::runtime_error("BN_set_word failed");
    }
}

BigNum BigNum::Adopt(BIGNUM* raw) {
    if (!raw) {
        throw std::bad_alloc();
    }
    BigNum result;
    result.bn_.reset(raw);
    return result;
}

BigNum::BigNum(const BigNum& other) : bn_(BN_dup(other.bn_.get())) {
    if (!bn_) {
        throw std::bad_alloc();
    }
}

BigNum& BigNum::operator=(const BigNum& other) {
    if (this != &other) {
        // A moved-from value has no BIGNUM
        if (!bn_) {
            bn_.reset(NewOrThrow());
        }
        if (!BN_copy(bn_.get(), other.bn_.get())) {
            throw std::bad_alloc();
        }
    }
    return *this;
}

BigNum BigNum::FromBytes(const Byte* data, size_t len) {
    return Adopt(BN_bin2bn(data, static_cast<int>(len), nullptr));
}

BigNum BigNum::FromDecimal(const std::string& dec) {
    if (dec.empty()) {
        throw std::invalid_argument("Empty decimal string");
    }
    for (char c : dec) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw std::invalid_argument("Invalid decimal string: " + dec);
        }
    }
    BIGNUM* raw = nullptr;
    if (BN_dec2bn(&raw, dec.c_str()) == 0) {
        throw std::invalid_argument("Invalid decimal string: " + dec);
    }
    return Adopt(raw);
}

BigNum BigNum::Pow10(unsigned exp) {
    BigNum result(1);
    BigNum ten(10);
    for (unsigned i = 0; i < exp; ++i) {
        result = result * ten;
    }
    return result;
}

bool BigNum::IsZero() const {
    return BN_is_zero(bn_.get());
}

std::string BigNum::ToDecimal() const {
    char* str = BN_bn2dec(bn_.get());
    if (!str) {
        throw std::bad_alloc();
    }
    std::string result(str);
    OPENSSL_free(str);
    return result;
}

std::optional<uint64_t> BigNum::ToUint64() const {
    if (BN_num_bits(bn_.get()) > 64) {
        return std::nullopt;
    }
    Byte buf[8] = {0};
    int n = BN_num_bytes(bn_.get());
    BN_bn2bin(bn_.get(), buf + (8 - n));
    uint64_t value = 0;
    for (Byte b : buf) {
        value = (value << 8) | b;
    }
    return value;
}

int BigNum::Compare(const BigNum& other) const {
    return BN_cmp(bn_.get(), other.bn_.get());
}

BigNum BigNum::operator+(const BigNum& other) const {
    BigNum result;
    if (!BN_add(result.bn_.get(), bn_.get(), other.bn_.get())) {
        throw std::runtime_error("BN_add failed");
    }
    return result;
}

BigNum& BigNum::operator+=(const BigNum& other) {
    if (!BN_add(bn_.get(), bn_.get(), other.bn_.get())) {
        throw std::runtime_error("BN_add failed");
    }
    return *this;
}

BigNum BigNum::operator-(const BigNum& other) const {
    if (Compare(other) < 0) {
        throw std::domain_error("BigNum subtraction underflow");
    }
    BigNum result;
    if (!BN_sub(result.bn_.get(), bn_.get(), other.bn_.get())) {
        throw std::runtime_error("BN_sub failed");
    }
    return result;
}

BigNum BigNum::operator*(const BigNum& other) const {
    ContextHolder ctx;
    BigNum result;
    if (!BN_mul(result.bn_.get(), bn_.get(), other.bn_.get(), ctx.ctx)) {
        throw std::runtime_error("BN_mul failed");
    }
    return result;
}

BigNum BigNum::operator/(const BigNum& other) const {
    if (other.IsZero()) {
        throw std::domain_error("BigNum division by zero");
    }
    ContextHolder ctx;
    BigNum result;
    if (!BN_div(result.bn_.get(), nullptr, bn_.get(), other.bn_.get(), ctx.ctx)) {
        throw std::runtime_error("BN_div failed");
    }
    return result;
}

BigNum BigNum::operator%(const BigNum& other) const {
    if (other.IsZero()) {
        throw std::domain_error("BigNum modulo by zero");
    }
    ContextHolder ctx;
    BigNum result;
    if (!BN_div(nullptr, result.bn_.get(), bn_.get(), other.bn_.get(), ctx.ctx)) {
        throw std::runtime_error("BN_div failed");
    }
    return result;
}

// ============================================================================
// Unit Formatting
// ============================================================================

std::string FormatUnits(const BigNum& value, unsigned decimals) {
    std::string digits = value.ToDecimal();
    if (decimals == 0) {
        return digits;
    }

    if (digits.size() <= decimals) {
        digits.insert(0, decimals - digits.size() + 1, '0');
    }

    std::string whole = digits.substr(0, digits.size() - decimals);
    std::string frac = digits.substr(digits.size() - decimals);

    size_t last = frac.find_last_not_of('0');
    if (last == std::string::npos) {
        return whole;
    }
    return whole + "." + frac.substr(0, last + 1);
}

BigNum ParseUnits(const std::string& text, unsigned decimals) {
    size_t dot = text.find('.');
    std::string whole = dot == std::string::npos ? text : text.substr(0, dot);
    std::string frac = dot == std::string::npos ? "" : text.substr(dot + 1);

    if (whole.empty()) {
        whole = "0";
    }
    if (frac.size() > decimals) {
        throw std::invalid_argument("Too many fractional digits: " + text);
    }
    frac.append(decimals - frac.size(), '0');
    return BigNum::FromDecimal(whole + frac);
}

} // namespace chieftally
