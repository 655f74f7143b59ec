// =============================================================================
// types.cpp - Address/amount formatting and error names
// =============================================================================

#include "cpmm/types.hpp"
#include <algorithm>
#include <stdexcept>

namespace cpmm {

namespace {

constexpr char HEX_DIGITS[] = "0123456789abcdef";

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

// =============================================================================
// Addresses
// =============================================================================

std::string to_hex(const Address& addr) {
    std::string out = "0x";
    out.reserve(2 + addr.size() * 2);
    for (uint8_t b : addr) {
        out.push_back(HEX_DIGITS[b >> 4]);
        out.push_back(HEX_DIGITS[b & 0x0F]);
    }
    return out;
}

Address address_from_hex(std::string_view hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex.remove_prefix(2);
    }
    Address addr = {};
    if (hex.size() != addr.size() * 2) {
        throw std::invalid_argument("address must be 40 hex digits: " + std::string(hex));
    }
    for (size_t i = 0; i < addr.size(); ++i) {
        int hi = hex_value(hex[2 * i]);
        int lo = hex_value(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("invalid hex digit in address: " + std::string(hex));
        }
        addr[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return addr;
}

// =============================================================================
// 256-bit Arithmetic
// =============================================================================

namespace u256 {

U256 mul(U128 a, U128 b) {
    // Split into 64-bit halves so no partial product can wrap
    constexpr U128 MASK64 = (U128(1) << 64) - 1;
    U128 a_lo = a & MASK64;
    U128 a_hi = a >> 64;
    U128 b_lo = b & MASK64;
    U128 b_hi = b >> 64;

    U128 p0 = a_lo * b_lo;
    U128 p1 = a_lo * b_hi;
    U128 p2 = a_hi * b_lo;
    U128 p3 = a_hi * b_hi;

    U128 mid = (p0 >> 64) + (p1 & MASK64) + (p2 & MASK64);

    U256 result;
    result.lo = (p0 & MASK64) | (mid << 64);
    result.hi = p3 + (p1 >> 64) + (p2 >> 64) + (mid >> 64);
    return result;
}

bool div(const U256& num, U128 d, U128& quot) {
    if (d == 0 || num.hi >= d) {
        return false;
    }
    if (num.hi == 0) {
        quot = num.lo / d;
        return true;
    }

    // Shift-subtract over the low limb; the running remainder stays below d,
    // so one carry bit is enough to hold it before each subtraction
    U128 rem = num.hi;
    U128 q = 0;
    for (int i = 127; i >= 0; --i) {
        bool carry = (rem >> 127) != 0;
        rem = (rem << 1) | ((num.lo >> i) & 1);
        q <<= 1;
        if (carry || rem >= d) {
            rem -= d;
            q |= 1;
        }
    }
    quot = q;
    return true;
}

} // namespace u256

// =============================================================================
// Amounts
// =============================================================================

std::string to_string(U128 value) {
    if (value == 0) return "0";
    std::string out;
    while (value > 0) {
        out.push_back(static_cast<char>('0' + static_cast<int>(value % 10)));
        value /= 10;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

std::string to_string(const U256& value) {
    if (value.hi == 0) return to_string(value.lo);
    std::string out;
    U256 rest = value;
    while (!rest.is_zero()) {
        // (hi % 10) * 2^128 + lo, divided by 10, always fits in the low limb
        U128 rem_hi = rest.hi % 10;
        U128 quot_lo = 0;
        if (!u256::div(U256(rest.lo, rem_hi), 10, quot_lo)) {
            throw std::logic_error("to_string: digit division out of range");
        }
        U128 digit = rest.lo - quot_lo * 10;
        out.push_back(static_cast<char>('0' + static_cast<int>(digit)));
        rest = U256(quot_lo, rest.hi / 10);
    }
    std::reverse(out.begin(), out.end());
    return out;
}

U128 parse_u128(std::string_view text) {
    if (text.empty()) {
        throw std::invalid_argument("empty amount");
    }
    U128 value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            throw std::invalid_argument("invalid digit in amount: " + std::string(text));
        }
        if (!u128::mul(value, 10, value) ||
            !u128::add(value, static_cast<U128>(c - '0'), value)) {
            throw std::out_of_range("amount exceeds 128 bits: " + std::string(text));
        }
    }
    return value;
}

// =============================================================================
// Names
// =============================================================================

const char* state_name(PoolState state) {
    switch (state) {
        case PoolState::UNINITIALIZED: return "uninitialized";
        case PoolState::ACTIVE: return "active";
        case PoolState::DRAINED: return "drained";
    }
    return "unknown";
}

const char* error_name(int32_t code) {
    switch (code) {
        case errors::OK: return "OK";
        case errors::POOL_NOT_INITIALIZED: return "POOL_NOT_INITIALIZED";
        case errors::POOL_TERMINATED: return "POOL_TERMINATED";
        case errors::INVALID_AMOUNT: return "INVALID_AMOUNT";
        case errors::TRANSFER_FAILED: return "TRANSFER_FAILED";
        case errors::RATIO_MISMATCH: return "RATIO_MISMATCH";
        case errors::DEPOSIT_TOO_SMALL: return "DEPOSIT_TOO_SMALL";
        case errors::POOL_DRAINAGE: return "POOL_DRAINAGE";
        case errors::INSUFFICIENT_POOL_SHARES: return "INSUFFICIENT_POOL_SHARES";
        case errors::INSUFFICIENT_OWNED_SHARES: return "INSUFFICIENT_OWNED_SHARES";
        case errors::ARITHMETIC_OVERFLOW: return "ARITHMETIC_OVERFLOW";
        case errors::REENTRANCY: return "REENTRANCY";
        default: return "UNKNOWN_ERROR";
    }
}

} // namespace cpmm
