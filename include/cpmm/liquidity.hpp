#ifndef CPMM_LIQUIDITY_HPP
#define CPMM_LIQUIDITY_HPP

#include <unordered_map>

#include "ledger.hpp"

namespace cpmm {

// =============================================================================
// Share Computations
// =============================================================================

struct ShareQuote {
    int32_t status;
    U128 shares;
};

struct WithdrawQuote {
    int32_t status;
    U128 amount_a;
    U128 amount_b;
};

// =============================================================================
// LiquidityBook - share issuance, redemption and per-party positions
// =============================================================================

class LiquidityBook {
public:
    using Positions = std::unordered_map<Address, U128, AddressHash>;

    // ratio_tolerance: divisor applied to both share proposals before comparing
    explicit LiquidityBook(U128 seed_shares = SEED_SHARES,
                           U128 ratio_tolerance = DEFAULT_RATIO_TOLERANCE);

    // Shares minted by depositing (amount_a, amount_b) against `reserves`.
    // An empty book always yields the seed issuance.
    ShareQuote shares_for_deposit(const ReserveSnapshot& reserves,
                                  U128 amount_a, U128 amount_b) const;

    // Proportional slice of both reserves for `shares`; floor division keeps
    // dust in the pool.
    WithdrawQuote amounts_for_withdraw(const ReserveSnapshot& reserves, U128 shares) const;

    // Commit helpers. Both keep sum(positions) == total_shares().
    int32_t mint(const Address& party, U128 shares);
    int32_t burn(const Address& party, U128 shares);

    U128 total_shares() const { return total_shares_; }
    U128 shares_of(const Address& party) const;
    size_t position_count() const { return positions_.size(); }
    const Positions& positions() const { return positions_; }

    U128 seed_shares() const { return seed_shares_; }
    U128 ratio_tolerance() const { return ratio_tolerance_; }

private:
    U128 seed_shares_;
    U128 ratio_tolerance_;
    U128 total_shares_{0};
    Positions positions_;
};

} // namespace cpmm

#endif // CPMM_LIQUIDITY_HPP
