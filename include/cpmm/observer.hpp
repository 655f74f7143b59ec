#ifndef CPMM_OBSERVER_HPP
#define CPMM_OBSERVER_HPP

#include <nlohmann/json_fwd.hpp>

#include "types.hpp"

namespace cpmm {

// =============================================================================
// Pool Records (handed to observers after each commit)
// =============================================================================

struct SwapRecord {
    Address party;
    Asset asset_in;
    U128 amount_in;
    Asset asset_out;
    U128 amount_out;
    U128 reserve_a;      // post-swap
    U128 reserve_b;      // post-swap
    uint64_t timestamp;  // unix seconds at commit
};

enum class LiquidityAction : uint8_t {
    ADDED = 0,
    REMOVED = 1
};

struct LiquidityRecord {
    Address party;
    LiquidityAction action;
    U128 amount_a;
    U128 amount_b;
    U128 shares;
    U128 total_shares;   // post-commit
    U128 reserve_a;
    U128 reserve_b;
    uint64_t timestamp;
};

// Amounts serialise as decimal strings, addresses as 0x-hex
void to_json(nlohmann::json& j, const SwapRecord& record);
void to_json(nlohmann::json& j, const LiquidityRecord& record);

// =============================================================================
// Observer Interface
// =============================================================================

class IPoolObserver {
public:
    virtual ~IPoolObserver() = default;

    virtual void on_swap(const SwapRecord& record) {}
    virtual void on_liquidity_added(const LiquidityRecord& record) {}
    virtual void on_liquidity_removed(const LiquidityRecord& record) {}
};

// Writes every record to the cpmm logger as a single JSON line
class LoggingObserver : public IPoolObserver {
public:
    void on_swap(const SwapRecord& record) override;
    void on_liquidity_added(const LiquidityRecord& record) override;
    void on_liquidity_removed(const LiquidityRecord& record) override;
};

} // namespace cpmm

#endif // CPMM_OBSERVER_HPP
