#ifndef CPMM_TYPES_HPP
#define CPMM_TYPES_HPP

#include <cstdint>
#include <cstddef>
#include <array>
#include <string>
#include <string_view>

namespace cpmm {

// =============================================================================
// Party Identifiers (EVM-style 20-byte addresses)
// =============================================================================

using Address = std::array<uint8_t, 20>;

namespace addresses {

// Default custody address of a pool: 0x...00000000C9AA
constexpr Address POOL = {0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0xC9,0xAA};

// Build an address whose low 8 bytes hold `id` (big-endian)
constexpr Address from_id(uint64_t id) {
    Address addr = {};
    for (size_t i = 0; i < 8; ++i) {
        addr[19 - i] = static_cast<uint8_t>((id >> (8 * i)) & 0xFF);
    }
    return addr;
}

constexpr bool is_zero(const Address& addr) {
    for (auto b : addr) {
        if (b != 0) return false;
    }
    return true;
}

} // namespace addresses

// "0x" + 40 lowercase hex digits
std::string to_hex(const Address& addr);

// Accepts an optional "0x" prefix; throws std::invalid_argument on bad input
Address address_from_hex(std::string_view hex);

struct AddressHash {
    size_t operator()(const Address& a) const noexcept {
        uint64_t h = 0;
        for (uint8_t b : a) h = h * 31 + b;
        return static_cast<size_t>(h);
    }
};

// =============================================================================
// Integer Amounts
// =============================================================================

// Reserves and shares live in 128 bits. Products of two amounts (k, and the
// intermediates of share and withdrawal arithmetic) need 256.
using U128 = unsigned __int128;

constexpr U128 PRECISION = 1000000000000000000ULL;  // 1e18
constexpr U128 SEED_SHARES = 100 * PRECISION;        // first-deposit issuance
constexpr U128 DEFAULT_RATIO_TOLERANCE = 1000;

// =============================================================================
// 256-bit Unsigned (two U128 limbs)
// =============================================================================

struct U256 {
    U128 lo;  // Low 128 bits
    U128 hi;  // High 128 bits

    constexpr U256() : lo(0), hi(0) {}
    constexpr U256(U128 l) : lo(l), hi(0) {}
    constexpr U256(U128 l, U128 h) : lo(l), hi(h) {}

    constexpr bool operator==(const U256& other) const {
        return lo == other.lo && hi == other.hi;
    }
    constexpr bool operator!=(const U256& other) const { return !(*this == other); }
    constexpr bool operator<(const U256& other) const {
        return hi < other.hi || (hi == other.hi && lo < other.lo);
    }
    constexpr bool is_zero() const { return lo == 0 && hi == 0; }
};

namespace u256 {

// Full product of two U128 values; cannot overflow
U256 mul(U128 a, U128 b);

// floor(num / d); false if d == 0 or the quotient needs more than 128 bits
bool div(const U256& num, U128 d, U128& quot);

} // namespace u256

// Checked arithmetic. Returns false on wrap, leaving `out` unspecified.
namespace u128 {

inline bool add(U128 a, U128 b, U128& out) {
    return !__builtin_add_overflow(a, b, &out);
}

inline bool mul(U128 a, U128 b, U128& out) {
    return !__builtin_mul_overflow(a, b, &out);
}

// floor(a * b / d) through a 256-bit product; false only when d == 0 or the
// quotient itself does not fit
inline bool mul_div(U128 a, U128 b, U128 d, U128& out) {
    return u256::div(u256::mul(a, b), d, out);
}

} // namespace u128

// Decimal rendering (fmt and nlohmann have no portable 128-bit support)
std::string to_string(U128 value);
std::string to_string(const U256& value);

// Parses a non-negative decimal; throws std::invalid_argument / std::out_of_range
U128 parse_u128(std::string_view text);

// =============================================================================
// Assets
// =============================================================================

enum class Asset : uint8_t {
    A = 0,
    B = 1
};

constexpr Asset other(Asset asset) {
    return asset == Asset::A ? Asset::B : Asset::A;
}

constexpr const char* asset_name(Asset asset) {
    return asset == Asset::A ? "A" : "B";
}

// =============================================================================
// Pool Lifecycle
// =============================================================================

enum class PoolState : uint8_t {
    UNINITIALIZED = 0,  // no deposit yet
    ACTIVE = 1,         // totalShares > 0
    DRAINED = 2         // all shares redeemed after having been active
};

const char* state_name(PoolState state);

// =============================================================================
// Error Codes
// =============================================================================

namespace errors {
constexpr int32_t OK = 0;
constexpr int32_t POOL_NOT_INITIALIZED = -1;
constexpr int32_t POOL_TERMINATED = -2;
constexpr int32_t INVALID_AMOUNT = -3;
constexpr int32_t TRANSFER_FAILED = -10;
constexpr int32_t RATIO_MISMATCH = -11;
constexpr int32_t DEPOSIT_TOO_SMALL = -12;
constexpr int32_t POOL_DRAINAGE = -13;
constexpr int32_t INSUFFICIENT_POOL_SHARES = -14;
constexpr int32_t INSUFFICIENT_OWNED_SHARES = -15;
constexpr int32_t ARITHMETIC_OVERFLOW = -20;
constexpr int32_t REENTRANCY = -30;
}

const char* error_name(int32_t code);

} // namespace cpmm

#endif // CPMM_TYPES_HPP
