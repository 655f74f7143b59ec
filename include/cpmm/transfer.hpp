#ifndef CPMM_TRANSFER_HPP
#define CPMM_TRANSFER_HPP

#include <mutex>
#include <string>
#include <unordered_map>

#include "types.hpp"

namespace cpmm {

// =============================================================================
// Asset Transfer Interface (one instance per pooled asset)
// =============================================================================

class IAssetTransfer {
public:
    virtual ~IAssetTransfer() = default;

    // Move `amount` from `from` to `to` on behalf of the pool
    virtual bool transfer_from(const Address& from, const Address& to, U128 amount) = 0;

    // Pay `amount` out of the pool's own holding to `to`
    virtual bool transfer(const Address& to, U128 amount) = 0;
};

// =============================================================================
// InMemoryAsset - thread-safe balance ledger for one fungible asset
// =============================================================================

class InMemoryAsset : public IAssetTransfer {
public:
    // `custodian` is the account debited by transfer()
    InMemoryAsset(std::string symbol, const Address& custodian = addresses::POOL);

    // Non-copyable
    InMemoryAsset(const InMemoryAsset&) = delete;
    InMemoryAsset& operator=(const InMemoryAsset&) = delete;

    bool transfer_from(const Address& from, const Address& to, U128 amount) override;
    bool transfer(const Address& to, U128 amount) override;

    // Faucet: credit `amount` out of thin air
    bool mint(const Address& to, U128 amount);

    U128 balance_of(const Address& owner) const;
    U128 total_supply() const;

    const std::string& symbol() const { return symbol_; }
    const Address& custodian() const { return custodian_; }

private:
    bool move(const Address& from, const Address& to, U128 amount);

    std::string symbol_;
    Address custodian_;
    U128 total_supply_{0};
    std::unordered_map<Address, U128, AddressHash> balances_;
    mutable std::mutex mutex_;
};

} // namespace cpmm

#endif // CPMM_TRANSFER_HPP
