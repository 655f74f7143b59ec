// =============================================================================
// pool.cpp - Pool operation coordinator
// Staged commit: validate and price, move assets, then write state
// =============================================================================

#include "cpmm/pool.hpp"
#include "cpmm/logging.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <mutex>

namespace cpmm {

namespace {

uint64_t now_seconds() {
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()
        ).count()
    );
}

U128 saturating_add(U128 a, U128 b) {
    U128 sum;
    return u128::add(a, b, sum) ? sum : ~U128(0);
}

const PoolConfig& validated(const PoolConfig& config) {
    config.validate();
    return config;
}

} // namespace

// =============================================================================
// Write Scope (exclusive lock + owning thread marker)
// =============================================================================

class Pool::WriteScope {
public:
    explicit WriteScope(Pool& pool) : pool_(pool), lock_(pool.mutex_) {
        pool_.writer_.store(std::this_thread::get_id());
    }

    ~WriteScope() { release(); }

    WriteScope(const WriteScope&) = delete;
    WriteScope& operator=(const WriteScope&) = delete;

    void release() {
        if (lock_.owns_lock()) {
            pool_.writer_.store(std::thread::id{});
            lock_.unlock();
        }
    }

private:
    Pool& pool_;
    std::unique_lock<std::shared_mutex> lock_;
};

// =============================================================================
// Constructor
// =============================================================================

Pool::Pool(IAssetTransfer& asset_a, IAssetTransfer& asset_b, PoolConfig config)
    : asset_a_(asset_a),
      asset_b_(asset_b),
      config_(validated(config)),
      book_(config_.seed_shares, config_.ratio_tolerance_divisor) {
    if (!config_.log_level.empty()) {
        logging::set_level(config_.log_level);
    }
}

// =============================================================================
// Internal Helpers
// =============================================================================

bool Pool::in_operation() const {
    return writer_.load() == std::this_thread::get_id();
}

// A collaborator called from inside one of our operations already runs under
// the exclusive lock; it reads the pre-commit state without relocking.
std::shared_lock<std::shared_mutex> Pool::read_lock() const {
    if (in_operation()) {
        return std::shared_lock<std::shared_mutex>(mutex_, std::defer_lock);
    }
    return std::shared_lock<std::shared_mutex>(mutex_);
}

bool Pool::pull(Asset which, const Address& from, U128 amount) {
    try {
        if (asset(which).transfer_from(from, config_.pool_address, amount)) {
            return true;
        }
        CPMM_LOG_WARN("transfer of {} {} from {} refused",
                      to_string(amount), asset_name(which), to_hex(from));
    } catch (const std::exception& e) {
        CPMM_LOG_WARN("transfer of {} {} from {} threw: {}",
                      to_string(amount), asset_name(which), to_hex(from), e.what());
    }
    return false;
}

bool Pool::pay(Asset which, const Address& to, U128 amount) {
    try {
        if (asset(which).transfer(to, amount)) {
            return true;
        }
        CPMM_LOG_WARN("payout of {} {} to {} refused",
                      to_string(amount), asset_name(which), to_hex(to));
    } catch (const std::exception& e) {
        CPMM_LOG_WARN("payout of {} {} to {} threw: {}",
                      to_string(amount), asset_name(which), to_hex(to), e.what());
    }
    return false;
}

template <typename Result>
Result Pool::reject(const char* op, const Address& party, Result result) {
    rejected_.fetch_add(1, std::memory_order_relaxed);
    CPMM_LOG_DEBUG("{} by {} rejected: {}", op, to_hex(party), error_name(result.status));
    return result;
}

// =============================================================================
// Add Liquidity
// =============================================================================

LiquidityResult Pool::add_liquidity(const Address& party, U128 amount_a, U128 amount_b) {
    if (in_operation()) {
        return reject("add_liquidity", party, LiquidityResult{errors::REENTRANCY, 0});
    }

    WriteScope scope(*this);

    if (state_ == PoolState::DRAINED && !config_.reseed_on_empty) {
        return reject("add_liquidity", party, LiquidityResult{errors::POOL_TERMINATED, 0});
    }

    ShareQuote quote = book_.shares_for_deposit(ledger_.snapshot(), amount_a, amount_b);
    if (quote.status != errors::OK) {
        return reject("add_liquidity", party, LiquidityResult{quote.status, 0});
    }

    ReserveLedger staged = ledger_;
    int32_t status = staged.apply(amount_a, 0, amount_b, 0);
    if (status != errors::OK) {
        return reject("add_liquidity", party, LiquidityResult{status, 0});
    }

    if (!pull(Asset::A, party, amount_a)) {
        return reject("add_liquidity", party, LiquidityResult{errors::TRANSFER_FAILED, 0});
    }
    if (!pull(Asset::B, party, amount_b)) {
        if (!pay(Asset::A, party, amount_a)) {
            CPMM_LOG_CRITICAL("refund of {} A to {} failed; pool holds unaccounted funds",
                              to_string(amount_a), to_hex(party));
        }
        return reject("add_liquidity", party, LiquidityResult{errors::TRANSFER_FAILED, 0});
    }

    status = book_.mint(party, quote.shares);
    if (status != errors::OK) {
        bool refunded = pay(Asset::A, party, amount_a) && pay(Asset::B, party, amount_b);
        if (!refunded) {
            CPMM_LOG_CRITICAL("refund of deposit to {} failed; pool holds unaccounted funds",
                              to_hex(party));
        }
        return reject("add_liquidity", party, LiquidityResult{status, 0});
    }
    ledger_ = staged;
    state_ = PoolState::ACTIVE;
    deposits_.fetch_add(1, std::memory_order_relaxed);

    LiquidityRecord record{party, LiquidityAction::ADDED, amount_a, amount_b, quote.shares,
                           book_.total_shares(), ledger_.reserve_a(), ledger_.reserve_b(),
                           now_seconds()};
    scope.release();

    notify_liquidity(record);
    return {errors::OK, quote.shares};
}

// =============================================================================
// Swap
// =============================================================================

SwapResult Pool::swap(const Address& party, Asset asset_in, U128 amount_in) {
    if (in_operation()) {
        return reject("swap", party, SwapResult{errors::REENTRANCY, amount_in, 0});
    }

    WriteScope scope(*this);

    if (book_.total_shares() == 0) {
        return reject("swap", party, SwapResult{errors::POOL_NOT_INITIALIZED, amount_in, 0});
    }

    SwapQuote quote = pricing::quote_exact_in(ledger_.snapshot(), asset_in, amount_in);
    if (!quote.ok()) {
        return reject("swap", party, SwapResult{quote.status, amount_in, 0});
    }

    Asset asset_out = other(asset_in);
    ReserveLedger staged = ledger_;
    if (asset_in == Asset::A) {
        staged.commit(quote.reserve_in_after, quote.reserve_out_after);
    } else {
        staged.commit(quote.reserve_out_after, quote.reserve_in_after);
    }

    if (!pull(asset_in, party, amount_in)) {
        return reject("swap", party, SwapResult{errors::TRANSFER_FAILED, amount_in, 0});
    }
    if (!pay(asset_out, party, quote.amount_out)) {
        if (!pay(asset_in, party, amount_in)) {
            CPMM_LOG_CRITICAL("refund of {} {} to {} failed; pool holds unaccounted funds",
                              to_string(amount_in), asset_name(asset_in), to_hex(party));
        }
        return reject("swap", party, SwapResult{errors::TRANSFER_FAILED, amount_in, 0});
    }

    ledger_ = staged;
    U128& volume = asset_in == Asset::A ? volume_a_in_ : volume_b_in_;
    volume = saturating_add(volume, amount_in);
    swaps_.fetch_add(1, std::memory_order_relaxed);

    SwapRecord record{party, asset_in, amount_in, asset_out, quote.amount_out,
                      ledger_.reserve_a(), ledger_.reserve_b(), now_seconds()};
    scope.release();

    notify_swap(record);
    return {errors::OK, amount_in, quote.amount_out};
}

// =============================================================================
// Remove Liquidity
// =============================================================================

WithdrawResult Pool::remove_liquidity(const Address& party, U128 shares) {
    if (in_operation()) {
        return reject("remove_liquidity", party, WithdrawResult{errors::REENTRANCY, 0, 0});
    }

    WriteScope scope(*this);

    if (book_.total_shares() == 0) {
        return reject("remove_liquidity", party, WithdrawResult{errors::POOL_NOT_INITIALIZED, 0, 0});
    }
    if (shares == 0) {
        return reject("remove_liquidity", party, WithdrawResult{errors::INVALID_AMOUNT, 0, 0});
    }
    if (shares > book_.shares_of(party)) {
        return reject("remove_liquidity", party,
                      WithdrawResult{errors::INSUFFICIENT_OWNED_SHARES, 0, 0});
    }

    WithdrawQuote quote = book_.amounts_for_withdraw(ledger_.snapshot(), shares);
    if (quote.status != errors::OK) {
        return reject("remove_liquidity", party, WithdrawResult{quote.status, 0, 0});
    }

    ReserveLedger staged = ledger_;
    int32_t status = staged.apply(0, quote.amount_a, 0, quote.amount_b);
    if (status != errors::OK) {
        return reject("remove_liquidity", party, WithdrawResult{status, 0, 0});
    }

    if (!pay(Asset::A, party, quote.amount_a)) {
        return reject("remove_liquidity", party, WithdrawResult{errors::TRANSFER_FAILED, 0, 0});
    }
    if (!pay(Asset::B, party, quote.amount_b)) {
        if (!pull(Asset::A, party, quote.amount_a)) {
            CPMM_LOG_CRITICAL("reclaim of {} A from {} failed; pool reserves overstated",
                              to_string(quote.amount_a), to_hex(party));
        }
        return reject("remove_liquidity", party, WithdrawResult{errors::TRANSFER_FAILED, 0, 0});
    }

    status = book_.burn(party, shares);
    if (status != errors::OK) {
        bool reclaimed = pull(Asset::A, party, quote.amount_a) &&
                         pull(Asset::B, party, quote.amount_b);
        if (!reclaimed) {
            CPMM_LOG_CRITICAL("reclaim of withdrawal from {} failed; pool reserves overstated",
                              to_hex(party));
        }
        return reject("remove_liquidity", party, WithdrawResult{status, 0, 0});
    }
    ledger_ = staged;
    if (book_.total_shares() == 0) {
        state_ = PoolState::DRAINED;
        CPMM_LOG_INFO("pool drained; {}", config_.reseed_on_empty
                                              ? "next deposit re-seeds"
                                              : "deposits disabled");
    }
    withdrawals_.fetch_add(1, std::memory_order_relaxed);

    LiquidityRecord record{party, LiquidityAction::REMOVED, quote.amount_a, quote.amount_b,
                           shares, book_.total_shares(), ledger_.reserve_a(),
                           ledger_.reserve_b(), now_seconds()};
    scope.release();

    notify_liquidity(record);
    return {errors::OK, quote.amount_a, quote.amount_b};
}

// =============================================================================
// Queries
// =============================================================================

QuoteResult Pool::calculate_token_b_deposit(U128 amount_a) const {
    auto lock = read_lock();
    auto q = pricing::deposit_b_for_a(ledger_.snapshot(), amount_a);
    return {q.status, q.amount};
}

QuoteResult Pool::calculate_token_a_deposit(U128 amount_b) const {
    auto lock = read_lock();
    auto q = pricing::deposit_a_for_b(ledger_.snapshot(), amount_b);
    return {q.status, q.amount};
}

QuoteResult Pool::calculate_token_a_swap(U128 amount_a) const {
    auto lock = read_lock();
    SwapQuote q = pricing::quote_a_to_b(ledger_.snapshot(), amount_a);
    return {q.status, q.ok() ? q.amount_out : 0};
}

QuoteResult Pool::calculate_token_b_swap(U128 amount_b) const {
    auto lock = read_lock();
    SwapQuote q = pricing::quote_b_to_a(ledger_.snapshot(), amount_b);
    return {q.status, q.ok() ? q.amount_out : 0};
}

QuoteResult Pool::calculate_token_a_for_exact_b(U128 amount_b_out) const {
    auto lock = read_lock();
    SwapQuote q = pricing::quote_exact_out(ledger_.snapshot(), Asset::B, amount_b_out);
    return {q.status, q.ok() ? q.amount_in : 0};
}

QuoteResult Pool::calculate_token_b_for_exact_a(U128 amount_a_out) const {
    auto lock = read_lock();
    SwapQuote q = pricing::quote_exact_out(ledger_.snapshot(), Asset::A, amount_a_out);
    return {q.status, q.ok() ? q.amount_in : 0};
}

WithdrawResult Pool::calculate_withdraw_amount(U128 shares) const {
    auto lock = read_lock();
    WithdrawQuote q = book_.amounts_for_withdraw(ledger_.snapshot(), shares);
    return {q.status, q.amount_a, q.amount_b};
}

PoolDetails Pool::details() const {
    auto lock = read_lock();
    return PoolDetails{
        state_,
        ledger_.reserve_a(),
        ledger_.reserve_b(),
        ledger_.constant_product(),
        book_.total_shares(),
        book_.position_count()
    };
}

PoolState Pool::state() const {
    auto lock = read_lock();
    return state_;
}

U128 Pool::shares_of(const Address& party) const {
    auto lock = read_lock();
    return book_.shares_of(party);
}

LiquidityBook::Positions Pool::positions() const {
    auto lock = read_lock();
    return book_.positions();
}

// =============================================================================
// Observers
// =============================================================================

void Pool::add_observer(IPoolObserver* observer) {
    if (!observer) return;
    std::unique_lock lock(observers_mutex_);
    if (std::find(observers_.begin(), observers_.end(), observer) == observers_.end()) {
        observers_.push_back(observer);
    }
}

void Pool::remove_observer(IPoolObserver* observer) {
    std::unique_lock lock(observers_mutex_);
    observers_.erase(std::remove(observers_.begin(), observers_.end(), observer),
                     observers_.end());
}

// Observers may (un)register from inside a callback, so iterate a copy
void Pool::notify_swap(const SwapRecord& record) {
    std::vector<IPoolObserver*> observers;
    {
        std::shared_lock lock(observers_mutex_);
        observers = observers_;
    }
    for (IPoolObserver* observer : observers) {
        observer->on_swap(record);
    }
}

void Pool::notify_liquidity(const LiquidityRecord& record) {
    std::vector<IPoolObserver*> observers;
    {
        std::shared_lock lock(observers_mutex_);
        observers = observers_;
    }
    for (IPoolObserver* observer : observers) {
        if (record.action == LiquidityAction::ADDED) {
            observer->on_liquidity_added(record);
        } else {
            observer->on_liquidity_removed(record);
        }
    }
}

// =============================================================================
// Statistics
// =============================================================================

Pool::Stats Pool::get_stats() const {
    auto lock = read_lock();
    return Stats{
        deposits_.load(std::memory_order_relaxed),
        swaps_.load(std::memory_order_relaxed),
        withdrawals_.load(std::memory_order_relaxed),
        rejected_.load(std::memory_order_relaxed),
        volume_a_in_,
        volume_b_in_
    };
}

} // namespace cpmm
