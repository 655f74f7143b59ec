// =============================================================================
// asset.cpp - InMemoryAsset balance ledger
// =============================================================================

#include "cpmm/transfer.hpp"
#include <utility>

namespace cpmm {

InMemoryAsset::InMemoryAsset(std::string symbol, const Address& custodian)
    : symbol_(std::move(symbol)), custodian_(custodian) {}

bool InMemoryAsset::transfer_from(const Address& from, const Address& to, U128 amount) {
    std::lock_guard lock(mutex_);
    return move(from, to, amount);
}

bool InMemoryAsset::transfer(const Address& to, U128 amount) {
    std::lock_guard lock(mutex_);
    return move(custodian_, to, amount);
}

bool InMemoryAsset::mint(const Address& to, U128 amount) {
    std::lock_guard lock(mutex_);
    U128 new_supply;
    if (!u128::add(total_supply_, amount, new_supply)) {
        return false;
    }
    total_supply_ = new_supply;
    balances_[to] += amount;
    return true;
}

U128 InMemoryAsset::balance_of(const Address& owner) const {
    std::lock_guard lock(mutex_);
    auto it = balances_.find(owner);
    return it != balances_.end() ? it->second : 0;
}

U128 InMemoryAsset::total_supply() const {
    std::lock_guard lock(mutex_);
    return total_supply_;
}

// Caller holds mutex_
bool InMemoryAsset::move(const Address& from, const Address& to, U128 amount) {
    if (amount == 0) {
        return true;
    }
    auto it = balances_.find(from);
    if (it == balances_.end() || it->second < amount) {
        return false;
    }
    if (from == to) {
        return true;
    }

    it->second -= amount;
    if (it->second == 0) {
        balances_.erase(it);
    }
    // Balances sum to total_supply_, so the credit cannot wrap
    balances_[to] += amount;
    return true;
}

} // namespace cpmm
