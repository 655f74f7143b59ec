#ifndef CPMM_POOL_HPP
#define CPMM_POOL_HPP

#include <atomic>
#include <shared_mutex>
#include <thread>
#include <vector>

#include "config.hpp"
#include "ledger.hpp"
#include "liquidity.hpp"
#include "observer.hpp"
#include "pricing.hpp"
#include "transfer.hpp"

namespace cpmm {

// =============================================================================
// Operation Results
// =============================================================================

struct LiquidityResult {
    int32_t status;
    U128 shares;         // minted

    bool ok() const { return status == errors::OK; }
};

struct SwapResult {
    int32_t status;
    U128 amount_in;
    U128 amount_out;

    bool ok() const { return status == errors::OK; }
};

struct WithdrawResult {
    int32_t status;
    U128 amount_a;
    U128 amount_b;

    bool ok() const { return status == errors::OK; }
};

struct QuoteResult {
    int32_t status;
    U128 amount;

    bool ok() const { return status == errors::OK; }
};

struct PoolDetails {
    PoolState state;
    U128 reserve_a;
    U128 reserve_b;
    U256 constant_product;
    U128 total_shares;
    size_t providers;    // parties with a non-zero position
};

// =============================================================================
// Pool - two-asset constant-product pool
// =============================================================================

// Every mutating operation holds the pool's exclusive lock from validation
// through the asset transfers to the commit; readers take a shared lock and
// always see committed reserves. Ledger and share state change only after
// all transfers of an operation succeeded.
class Pool {
public:
    Pool(IAssetTransfer& asset_a, IAssetTransfer& asset_b, PoolConfig config = PoolConfig{});
    ~Pool() = default;

    // Non-copyable
    Pool(const Pool&) = delete;
    Pool& operator=(const Pool&) = delete;

    // =========================================================================
    // Mutating Operations
    // =========================================================================

    // Deposit both assets from `party`; returns the shares minted
    LiquidityResult add_liquidity(const Address& party, U128 amount_a, U128 amount_b);

    // Sell `amount_in` of `asset_in` for the other asset
    SwapResult swap(const Address& party, Asset asset_in, U128 amount_in);

    SwapResult swap_token_a(const Address& party, U128 amount_a) {
        return swap(party, Asset::A, amount_a);
    }

    SwapResult swap_token_b(const Address& party, U128 amount_b) {
        return swap(party, Asset::B, amount_b);
    }

    // Redeem `shares` of `party` for a proportional slice of both reserves
    WithdrawResult remove_liquidity(const Address& party, U128 shares);

    // =========================================================================
    // Queries
    // =========================================================================

    // B matching `amount_a` at the current ratio (and the converse)
    QuoteResult calculate_token_b_deposit(U128 amount_a) const;
    QuoteResult calculate_token_a_deposit(U128 amount_b) const;

    // Output of swapping A for B (and B for A)
    QuoteResult calculate_token_a_swap(U128 amount_a) const;
    QuoteResult calculate_token_b_swap(U128 amount_b) const;

    // Input needed to receive an exact output
    QuoteResult calculate_token_a_for_exact_b(U128 amount_b_out) const;
    QuoteResult calculate_token_b_for_exact_a(U128 amount_a_out) const;

    WithdrawResult calculate_withdraw_amount(U128 shares) const;

    PoolDetails details() const;
    PoolState state() const;
    U128 shares_of(const Address& party) const;
    LiquidityBook::Positions positions() const;

    const PoolConfig& config() const { return config_; }

    // =========================================================================
    // Observers (notified after the pool lock is released)
    // =========================================================================

    void add_observer(IPoolObserver* observer);
    void remove_observer(IPoolObserver* observer);

    // =========================================================================
    // Statistics
    // =========================================================================

    struct Stats {
        uint64_t deposits;
        uint64_t swaps;
        uint64_t withdrawals;
        uint64_t rejected;
        U128 volume_a_in;   // swap input totals
        U128 volume_b_in;
    };
    Stats get_stats() const;

private:
    class WriteScope;

    std::shared_lock<std::shared_mutex> read_lock() const;
    bool in_operation() const;

    // Collaborator calls; an exception counts as a failed transfer
    bool pull(Asset asset, const Address& from, U128 amount);
    bool pay(Asset asset, const Address& to, U128 amount);
    IAssetTransfer& asset(Asset which) { return which == Asset::A ? asset_a_ : asset_b_; }

    template <typename Result>
    Result reject(const char* op, const Address& party, Result result);

    void notify_swap(const SwapRecord& record);
    void notify_liquidity(const LiquidityRecord& record);

    IAssetTransfer& asset_a_;
    IAssetTransfer& asset_b_;
    const PoolConfig config_;

    // Pool state (guarded by mutex_)
    ReserveLedger ledger_;
    LiquidityBook book_;
    PoolState state_{PoolState::UNINITIALIZED};
    U128 volume_a_in_{0};
    U128 volume_b_in_{0};
    mutable std::shared_mutex mutex_;
    std::atomic<std::thread::id> writer_{};

    std::vector<IPoolObserver*> observers_;
    mutable std::shared_mutex observers_mutex_;

    // Statistics
    std::atomic<uint64_t> deposits_{0};
    std::atomic<uint64_t> swaps_{0};
    std::atomic<uint64_t> withdrawals_{0};
    std::atomic<uint64_t> rejected_{0};
};

} // namespace cpmm

#endif // CPMM_POOL_HPP
