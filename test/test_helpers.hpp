// cpmm - shared test fixtures

#pragma once

#include <catch2/catch_tostring.hpp>
#include <cpmm/pool.hpp>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace Catch {
template <>
struct StringMaker<unsigned __int128> {
    static std::string convert(unsigned __int128 value) {
        return cpmm::to_string(value);
    }
};

template <>
struct StringMaker<cpmm::U256> {
    static std::string convert(const cpmm::U256& value) {
        return cpmm::to_string(value);
    }
};
}  // namespace Catch

namespace cpmm::test {

inline const Address ALICE = addresses::from_id(0xA11CE);
inline const Address BOB = addresses::from_id(0xB0B);
inline const Address CAROL = addresses::from_id(0xCA201);

// InMemoryAsset whose transfers can be made to refuse, throw, or run a hook
class ScriptedAsset : public InMemoryAsset {
public:
    explicit ScriptedAsset(std::string symbol) : InMemoryAsset(std::move(symbol)) {}

    bool refuse_transfer_from = false;
    bool refuse_transfer = false;
    bool throw_on_transfer = false;
    std::function<void()> on_transfer_from;

    bool transfer_from(const Address& from, const Address& to, U128 amount) override {
        ++transfer_from_calls;
        if (on_transfer_from) on_transfer_from();
        if (throw_on_transfer) throw std::runtime_error("asset ledger offline");
        if (refuse_transfer_from) return false;
        return InMemoryAsset::transfer_from(from, to, amount);
    }

    bool transfer(const Address& to, U128 amount) override {
        ++transfer_calls;
        if (throw_on_transfer) throw std::runtime_error("asset ledger offline");
        if (refuse_transfer) return false;
        return InMemoryAsset::transfer(to, amount);
    }

    int transfer_from_calls = 0;
    int transfer_calls = 0;
};

// Collects every record the pool emits
class RecordingObserver : public IPoolObserver {
public:
    void on_swap(const SwapRecord& record) override { swaps.push_back(record); }
    void on_liquidity_added(const LiquidityRecord& record) override { added.push_back(record); }
    void on_liquidity_removed(const LiquidityRecord& record) override { removed.push_back(record); }

    std::vector<SwapRecord> swaps;
    std::vector<LiquidityRecord> added;
    std::vector<LiquidityRecord> removed;
};

// Pool plus its two asset ledgers, every party funded generously
struct PoolFixture {
    explicit PoolFixture(PoolConfig config = PoolConfig{})
        : token_a("TKA"), token_b("TKB"), pool(token_a, token_b, config) {
        for (const Address& party : {ALICE, BOB, CAROL}) {
            token_a.mint(party, 1000000000);
            token_b.mint(party, 1000000000);
        }
    }

    // Every position the pool holds, not just the funded parties
    U128 sum_of_positions() const {
        U128 sum = 0;
        for (const auto& [party, shares] : pool.positions()) {
            sum += shares;
        }
        return sum;
    }

    ScriptedAsset token_a;
    ScriptedAsset token_b;
    Pool pool;
};

}  // namespace cpmm::test
