// cpmm - Pool Configuration
// Builder pattern for fluent configuration, loadable from JSON

#pragma once

#include <string>
#include <string_view>

#include "types.hpp"

namespace cpmm {

class PoolConfig {
public:
    // Account holding the pool's reserves in the asset ledgers
    Address pool_address = addresses::POOL;

    // Shares minted by the first deposit into an empty pool
    U128 seed_shares = SEED_SHARES;

    // Deposits pass the ratio check when
    //   shares_a / divisor == shares_b / divisor
    // Deliberately loose; a larger divisor tolerates more skew.
    U128 ratio_tolerance_divisor = DEFAULT_RATIO_TOLERANCE;

    // Whether a pool whose shares were all redeemed accepts a new seed deposit
    bool reseed_on_empty = true;

    // Level applied to the "cpmm" logger when a Pool is built from this
    // config; empty leaves the logger as it is
    std::string log_level;

    PoolConfig() = default;

    // Load from JSON file
    static PoolConfig from_file(std::string_view path);

    // Load from JSON string
    //   {"pool": {"address": "0x..", "seed_shares": "100000000000000000000",
    //             "ratio_tolerance_divisor": 1000, "reseed_on_empty": true},
    //    "logging": {"level": "info"}}
    // Missing keys keep their defaults.
    static PoolConfig from_json(std::string_view content);

    // Throws std::invalid_argument if a value is unusable
    void validate() const;

    // Builder methods
    PoolConfig& with_address(const Address& address) {
        pool_address = address;
        return *this;
    }

    PoolConfig& with_seed_shares(U128 shares) {
        seed_shares = shares;
        return *this;
    }

    PoolConfig& with_ratio_tolerance(U128 divisor) {
        ratio_tolerance_divisor = divisor;
        return *this;
    }

    PoolConfig& allow_reseed(bool enabled = true) {
        reseed_on_empty = enabled;
        return *this;
    }

    PoolConfig& with_log_level(std::string_view level) {
        log_level = std::string(level);
        return *this;
    }
};

}  // namespace cpmm
