// =============================================================================
// liquidity.cpp - LiquidityBook share accounting
// =============================================================================

#include "cpmm/liquidity.hpp"
#include <stdexcept>

namespace cpmm {

LiquidityBook::LiquidityBook(U128 seed_shares, U128 ratio_tolerance)
    : seed_shares_(seed_shares), ratio_tolerance_(ratio_tolerance) {
    if (seed_shares_ == 0) {
        throw std::invalid_argument("LiquidityBook: seed issuance must be positive");
    }
    if (ratio_tolerance_ == 0) {
        throw std::invalid_argument("LiquidityBook: ratio tolerance divisor must be positive");
    }
}

// =============================================================================
// Deposit
// =============================================================================

ShareQuote LiquidityBook::shares_for_deposit(const ReserveSnapshot& reserves,
                                             U128 amount_a, U128 amount_b) const {
    if (amount_a == 0 || amount_b == 0) {
        return {errors::INVALID_AMOUNT, 0};
    }

    // First deposit fixes the price; no proportionality check
    if (total_shares_ == 0) {
        return {errors::OK, seed_shares_};
    }

    if (reserves.empty()) {
        return {errors::POOL_NOT_INITIALIZED, 0};
    }

    U128 shares_a, shares_b;
    if (!u128::mul_div(total_shares_, amount_a, reserves.reserve_a, shares_a) ||
        !u128::mul_div(total_shares_, amount_b, reserves.reserve_b, shares_b)) {
        return {errors::ARITHMETIC_OVERFLOW, 0};
    }

    // Coarse tolerance against truncation noise, not an exact ratio proof
    if (shares_a / ratio_tolerance_ != shares_b / ratio_tolerance_) {
        return {errors::RATIO_MISMATCH, 0};
    }

    if (shares_a == 0) {
        return {errors::DEPOSIT_TOO_SMALL, 0};
    }

    U128 new_total;
    if (!u128::add(total_shares_, shares_a, new_total)) {
        return {errors::ARITHMETIC_OVERFLOW, 0};
    }

    return {errors::OK, shares_a};
}

// =============================================================================
// Withdraw
// =============================================================================

WithdrawQuote LiquidityBook::amounts_for_withdraw(const ReserveSnapshot& reserves,
                                                  U128 shares) const {
    if (total_shares_ == 0) {
        return {errors::POOL_NOT_INITIALIZED, 0, 0};
    }
    if (shares > total_shares_) {
        return {errors::INSUFFICIENT_POOL_SHARES, 0, 0};
    }

    U128 amount_a, amount_b;
    if (!u128::mul_div(shares, reserves.reserve_a, total_shares_, amount_a) ||
        !u128::mul_div(shares, reserves.reserve_b, total_shares_, amount_b)) {
        return {errors::ARITHMETIC_OVERFLOW, 0, 0};
    }

    return {errors::OK, amount_a, amount_b};
}

// =============================================================================
// Positions
// =============================================================================

int32_t LiquidityBook::mint(const Address& party, U128 shares) {
    U128 new_total;
    if (!u128::add(total_shares_, shares, new_total)) {
        return errors::ARITHMETIC_OVERFLOW;
    }
    if (shares == 0) {
        return errors::OK;
    }

    // Position <= total, so it cannot wrap once the total did not
    positions_[party] += shares;
    total_shares_ = new_total;
    return errors::OK;
}

int32_t LiquidityBook::burn(const Address& party, U128 shares) {
    auto it = positions_.find(party);
    U128 owned = (it != positions_.end()) ? it->second : 0;
    if (shares > owned) {
        return errors::INSUFFICIENT_OWNED_SHARES;
    }
    if (shares > total_shares_) {
        return errors::INSUFFICIENT_POOL_SHARES;
    }
    if (shares == 0) {
        return errors::OK;
    }

    it->second -= shares;
    if (it->second == 0) {
        positions_.erase(it);
    }
    total_shares_ -= shares;
    return errors::OK;
}

U128 LiquidityBook::shares_of(const Address& party) const {
    auto it = positions_.find(party);
    return it != positions_.end() ? it->second : 0;
}

} // namespace cpmm
