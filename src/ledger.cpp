// =============================================================================
// ledger.cpp - ReserveLedger
// =============================================================================

#include "cpmm/ledger.hpp"

namespace cpmm {

void ReserveLedger::commit(U128 new_reserve_a, U128 new_reserve_b) {
    reserve_a_ = new_reserve_a;
    reserve_b_ = new_reserve_b;
    k_ = u256::mul(new_reserve_a, new_reserve_b);
}

int32_t ReserveLedger::apply(U128 in_a, U128 out_a, U128 in_b, U128 out_b) {
    U128 a, b;
    if (!u128::add(reserve_a_, in_a, a) || !u128::add(reserve_b_, in_b, b)) {
        return errors::ARITHMETIC_OVERFLOW;
    }
    // Outflows never exceed what the ledger holds
    if (out_a > a || out_b > b) {
        return errors::ARITHMETIC_OVERFLOW;
    }
    commit(a - out_a, b - out_b);
    return errors::OK;
}

} // namespace cpmm
