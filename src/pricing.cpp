// =============================================================================
// pricing.cpp - Constant-product swap quotes
// =============================================================================

#include "cpmm/pricing.hpp"

namespace cpmm {
namespace pricing {

SwapQuote quote_exact_in(const ReserveSnapshot& reserves, Asset asset_in, U128 amount_in) {
    SwapQuote q{errors::OK, asset_in, amount_in, 0, 0, 0};

    if (reserves.empty()) {
        q.status = errors::POOL_NOT_INITIALIZED;
        return q;
    }
    if (amount_in == 0) {
        q.status = errors::INVALID_AMOUNT;
        return q;
    }

    U128 reserve_in = reserves.reserve(asset_in);
    U128 reserve_out = reserves.reserve(other(asset_in));

    if (!u128::add(reserve_in, amount_in, q.reserve_in_after)) {
        q.status = errors::ARITHMETIC_OVERFLOW;
        return q;
    }

    // Truncating division: reserve_in_after * reserve_out_after <= k
    U128 reserve_out_after;
    if (!u256::div(reserves.k, q.reserve_in_after, reserve_out_after) ||
        reserve_out_after > reserve_out) {
        // Only reachable with a k larger than the reserve product
        q.status = errors::ARITHMETIC_OVERFLOW;
        return q;
    }

    U128 amount_out = reserve_out - reserve_out_after;
    if (amount_out == reserve_out) {
        --amount_out;
    }
    if (amount_out >= reserve_out) {
        q.status = errors::POOL_DRAINAGE;
        return q;
    }

    q.amount_out = amount_out;
    q.reserve_out_after = reserve_out - amount_out;
    return q;
}

SwapQuote quote_exact_out(const ReserveSnapshot& reserves, Asset asset_out, U128 amount_out) {
    Asset asset_in = other(asset_out);
    SwapQuote q{errors::OK, asset_in, 0, amount_out, 0, 0};

    if (reserves.empty()) {
        q.status = errors::POOL_NOT_INITIALIZED;
        return q;
    }
    if (amount_out == 0) {
        q.status = errors::INVALID_AMOUNT;
        return q;
    }

    U128 reserve_in = reserves.reserve(asset_in);
    U128 reserve_out = reserves.reserve(asset_out);
    if (amount_out >= reserve_out) {
        q.status = errors::POOL_DRAINAGE;
        return q;
    }

    q.reserve_out_after = reserve_out - amount_out;
    if (!u256::div(reserves.k, q.reserve_out_after, q.reserve_in_after) ||
        q.reserve_in_after < reserve_in) {
        q.status = errors::ARITHMETIC_OVERFLOW;
        return q;
    }

    q.amount_in = q.reserve_in_after - reserve_in;
    return q;
}

// =============================================================================
// Deposit Ratio
// =============================================================================

DepositQuote deposit_b_for_a(const ReserveSnapshot& reserves, U128 amount_a) {
    if (reserves.empty()) {
        return {errors::POOL_NOT_INITIALIZED, 0};
    }
    U128 amount_b;
    if (!u128::mul_div(reserves.reserve_b, amount_a, reserves.reserve_a, amount_b)) {
        return {errors::ARITHMETIC_OVERFLOW, 0};
    }
    return {errors::OK, amount_b};
}

DepositQuote deposit_a_for_b(const ReserveSnapshot& reserves, U128 amount_b) {
    if (reserves.empty()) {
        return {errors::POOL_NOT_INITIALIZED, 0};
    }
    U128 amount_a;
    if (!u128::mul_div(reserves.reserve_a, amount_b, reserves.reserve_b, amount_a)) {
        return {errors::ARITHMETIC_OVERFLOW, 0};
    }
    return {errors::OK, amount_a};
}

} // namespace pricing
} // namespace cpmm
