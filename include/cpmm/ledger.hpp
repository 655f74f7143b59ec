#ifndef CPMM_LEDGER_HPP
#define CPMM_LEDGER_HPP

#include "types.hpp"

namespace cpmm {

// =============================================================================
// Reserve Snapshot (value copy of the ledger)
// =============================================================================

struct ReserveSnapshot {
    U128 reserve_a;
    U128 reserve_b;
    U256 k;             // reserve_a * reserve_b

    U128 reserve(Asset asset) const {
        return asset == Asset::A ? reserve_a : reserve_b;
    }

    bool empty() const { return reserve_a == 0 || reserve_b == 0; }
};

// =============================================================================
// ReserveLedger - the two reserves and their product
// =============================================================================

// Pure bookkeeping. Callers validate transitions; the ledger only guarantees
// that a commit is all-or-nothing and that k is never stale.
class ReserveLedger {
public:
    ReserveLedger() = default;

    U128 reserve_a() const { return reserve_a_; }
    U128 reserve_b() const { return reserve_b_; }
    const U256& constant_product() const { return k_; }

    ReserveSnapshot snapshot() const { return {reserve_a_, reserve_b_, k_}; }

    // Set both reserves and recompute k (exact in 256 bits)
    void commit(U128 new_reserve_a, U128 new_reserve_b);

    // Apply per-asset movements: reserve += in, reserve -= out. Returns
    // ARITHMETIC_OVERFLOW without touching state if a reserve would wrap.
    int32_t apply(U128 in_a, U128 out_a, U128 in_b, U128 out_b);

private:
    U128 reserve_a_{0};
    U128 reserve_b_{0};
    U256 k_;
};

} // namespace cpmm

#endif // CPMM_LEDGER_HPP
