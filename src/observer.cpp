// =============================================================================
// observer.cpp - Record serialisation and the logging observer
// =============================================================================

#include "cpmm/observer.hpp"
#include "cpmm/logging.hpp"

#include <nlohmann/json.hpp>

namespace cpmm {

void to_json(nlohmann::json& j, const SwapRecord& record) {
    j = nlohmann::json{
        {"party", to_hex(record.party)},
        {"asset_in", asset_name(record.asset_in)},
        {"amount_in", to_string(record.amount_in)},
        {"asset_out", asset_name(record.asset_out)},
        {"amount_out", to_string(record.amount_out)},
        {"reserve_a", to_string(record.reserve_a)},
        {"reserve_b", to_string(record.reserve_b)},
        {"timestamp", record.timestamp}
    };
}

void to_json(nlohmann::json& j, const LiquidityRecord& record) {
    j = nlohmann::json{
        {"party", to_hex(record.party)},
        {"action", record.action == LiquidityAction::ADDED ? "added" : "removed"},
        {"amount_a", to_string(record.amount_a)},
        {"amount_b", to_string(record.amount_b)},
        {"shares", to_string(record.shares)},
        {"total_shares", to_string(record.total_shares)},
        {"reserve_a", to_string(record.reserve_a)},
        {"reserve_b", to_string(record.reserve_b)},
        {"timestamp", record.timestamp}
    };
}

// =============================================================================
// LoggingObserver
// =============================================================================

void LoggingObserver::on_swap(const SwapRecord& record) {
    CPMM_LOG_INFO("swap {}", nlohmann::json(record).dump());
}

void LoggingObserver::on_liquidity_added(const LiquidityRecord& record) {
    CPMM_LOG_INFO("liquidity {}", nlohmann::json(record).dump());
}

void LoggingObserver::on_liquidity_removed(const LiquidityRecord& record) {
    CPMM_LOG_INFO("liquidity {}", nlohmann::json(record).dump());
}

} // namespace cpmm
