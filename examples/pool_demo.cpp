// cpmm - Pool Demo
// Seeds a pool, trades against it and redeems the shares again.
// Usage: cpmm_pool_demo [config.json]

#include <cpmm/config.hpp>
#include <cpmm/logging.hpp>
#include <cpmm/pool.hpp>
#include <exception>
#include <iostream>

using namespace cpmm;

namespace {

const Address ALICE = addresses::from_id(1);
const Address BOB = addresses::from_id(2);

void print_pool(const Pool& pool) {
    PoolDetails d = pool.details();
    std::cout << "  state=" << state_name(d.state)
              << " reserveA=" << to_string(d.reserve_a)
              << " reserveB=" << to_string(d.reserve_b)
              << " k=" << to_string(d.constant_product)
              << " shares=" << to_string(d.total_shares)
              << " providers=" << d.providers << "\n";
}

bool check(const char* what, int32_t status) {
    if (status != errors::OK) {
        std::cout << what << " failed: " << error_name(status) << "\n";
        return false;
    }
    return true;
}

}  // namespace

int main(int argc, char** argv) {
    PoolConfig config;
    try {
        if (argc > 1) {
            config = PoolConfig::from_file(argv[1]);
        }
    } catch (const std::exception& e) {
        std::cerr << "config error: " << e.what() << "\n";
        return 1;
    }

    InMemoryAsset token_a("TKA", config.pool_address);
    InMemoryAsset token_b("TKB", config.pool_address);
    if (!token_a.mint(ALICE, 1000000) || !token_b.mint(ALICE, 2000000) ||
        !token_a.mint(BOB, 50000)) {
        std::cerr << "faucet failed\n";
        return 1;
    }

    Pool pool(token_a, token_b, config);
    LoggingObserver logger;
    pool.add_observer(&logger);

    std::cout << "=== Seed ===\n";
    auto seeded = pool.add_liquidity(ALICE, 100000, 200000);
    if (!check("seed deposit", seeded.status)) return 1;
    std::cout << "  alice minted " << to_string(seeded.shares) << " shares\n";
    print_pool(pool);

    std::cout << "=== Proportional deposit ===\n";
    auto b_needed = pool.calculate_token_b_deposit(10000);
    if (!check("deposit quote", b_needed.status)) return 1;
    auto added = pool.add_liquidity(ALICE, 10000, b_needed.amount);
    if (!check("deposit", added.status)) return 1;
    std::cout << "  alice minted " << to_string(added.shares) << " shares\n";
    print_pool(pool);

    std::cout << "=== Swap ===\n";
    auto quote = pool.calculate_token_a_swap(25000);
    if (!check("swap quote", quote.status)) return 1;
    std::cout << "  quote: 25000 A -> " << to_string(quote.amount) << " B\n";
    auto swapped = pool.swap_token_a(BOB, 25000);
    if (!check("swap", swapped.status)) return 1;
    std::cout << "  bob received " << to_string(swapped.amount_out) << " B\n";
    print_pool(pool);

    auto back = pool.swap_token_b(BOB, swapped.amount_out);
    if (!check("swap back", back.status)) return 1;
    std::cout << "  bob swapped back for " << to_string(back.amount_out) << " A\n";
    print_pool(pool);

    std::cout << "=== Withdraw ===\n";
    U128 shares = pool.shares_of(ALICE);
    auto withdrawn = pool.remove_liquidity(ALICE, shares);
    if (!check("withdraw", withdrawn.status)) return 1;
    std::cout << "  alice redeemed " << to_string(shares) << " shares for "
              << to_string(withdrawn.amount_a) << " A + "
              << to_string(withdrawn.amount_b) << " B\n";
    print_pool(pool);

    auto stats = pool.get_stats();
    std::cout << "\nDeposits: " << stats.deposits << ", swaps: " << stats.swaps
              << ", withdrawals: " << stats.withdrawals << ", rejected: " << stats.rejected
              << "\n";
    return 0;
}
