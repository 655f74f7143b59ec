#ifndef CPMM_PRICING_HPP
#define CPMM_PRICING_HPP

#include "ledger.hpp"

namespace cpmm {

// =============================================================================
// Swap Quote
// =============================================================================

struct SwapQuote {
    int32_t status;
    Asset asset_in;
    U128 amount_in;
    U128 amount_out;
    U128 reserve_in_after;   // reserve_in + amount_in
    U128 reserve_out_after;  // reserve_out - amount_out

    bool ok() const { return status == errors::OK; }
};

// =============================================================================
// Constant-Product Pricing
// =============================================================================

namespace pricing {

// Output for selling `amount_in` of `asset_in`, priced against the pre-swap k:
//   reserve_out_after = k / (reserve_in + amount_in)
//   amount_out        = reserve_out - reserve_out_after
// The output is clamped one unit below reserve_out (anti-drain guard), so it
// is non-decreasing in amount_in and never reaches the opposite reserve.
SwapQuote quote_exact_in(const ReserveSnapshot& reserves, Asset asset_in, U128 amount_in);

inline SwapQuote quote_a_to_b(const ReserveSnapshot& reserves, U128 amount_a) {
    return quote_exact_in(reserves, Asset::A, amount_a);
}

inline SwapQuote quote_b_to_a(const ReserveSnapshot& reserves, U128 amount_b) {
    return quote_exact_in(reserves, Asset::B, amount_b);
}

// Input of other(asset_out) needed to receive `amount_out` of `asset_out`.
// amount_out must be strictly below the opposite reserve.
SwapQuote quote_exact_out(const ReserveSnapshot& reserves, Asset asset_out, U128 amount_out);

// Amount of the paired asset matching `amount` at the current reserve ratio
struct DepositQuote {
    int32_t status;
    U128 amount;
};

DepositQuote deposit_b_for_a(const ReserveSnapshot& reserves, U128 amount_a);
DepositQuote deposit_a_for_b(const ReserveSnapshot& reserves, U128 amount_b);

} // namespace pricing

} // namespace cpmm

#endif // CPMM_PRICING_HPP
