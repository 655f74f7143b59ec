// cpmm - Liquidity Accounting Tests

#include <catch2/catch_test_macros.hpp>
#include "test_helpers.hpp"

using namespace cpmm;
using namespace cpmm::test;

namespace {

// Book and ledger after a seed deposit of (1000, 2000) by ALICE
struct SeededBook {
    SeededBook(U128 tolerance = DEFAULT_RATIO_TOLERANCE) : book(SEED_SHARES, tolerance) {
        auto q = book.shares_for_deposit(ledger.snapshot(), 1000, 2000);
        REQUIRE(q.status == errors::OK);
        REQUIRE(book.mint(ALICE, q.shares) == errors::OK);
        ledger.commit(1000, 2000);
    }

    ReserveLedger ledger;
    LiquidityBook book;
};

}  // namespace

TEST_CASE("Seed issuance", "[liquidity]") {
    LiquidityBook book;
    ReserveLedger ledger;

    SECTION("First deposit mints the seed regardless of ratio") {
        auto q1 = book.shares_for_deposit(ledger.snapshot(), 1000, 2000);
        REQUIRE(q1.status == errors::OK);
        REQUIRE(q1.shares == 100 * PRECISION);

        auto q2 = book.shares_for_deposit(ledger.snapshot(), 1, 999999);
        REQUIRE(q2.shares == 100 * PRECISION);
    }

    SECTION("Zero amounts are refused") {
        REQUIRE(book.shares_for_deposit(ledger.snapshot(), 0, 10).status == errors::INVALID_AMOUNT);
        REQUIRE(book.shares_for_deposit(ledger.snapshot(), 10, 0).status == errors::INVALID_AMOUNT);
    }

    SECTION("Custom seed") {
        LiquidityBook custom(42 * PRECISION);
        REQUIRE(custom.shares_for_deposit(ledger.snapshot(), 5, 5).shares == 42 * PRECISION);
    }

    SECTION("Invalid parameters") {
        REQUIRE_THROWS_AS(LiquidityBook(0), std::invalid_argument);
        REQUIRE_THROWS_AS(LiquidityBook(SEED_SHARES, 0), std::invalid_argument);
    }
}

TEST_CASE("Proportional deposit", "[liquidity]") {
    SeededBook s;

    SECTION("Ten percent of reserves mints ten percent of shares") {
        auto q = s.book.shares_for_deposit(s.ledger.snapshot(), 100, 200);
        REQUIRE(q.status == errors::OK);
        REQUIRE(q.shares == 10 * PRECISION);
    }

    SECTION("Wrong ratio is rejected") {
        auto q = s.book.shares_for_deposit(s.ledger.snapshot(), 100, 150);
        REQUIRE(q.status == errors::RATIO_MISMATCH);
        REQUIRE(q.shares == 0);
    }

    SECTION("Deposit too small for one share unit") {
        ReserveLedger big;
        big.commit(U128(1) << 100, U128(1) << 100);
        auto q = s.book.shares_for_deposit(big.snapshot(), 1, 1);
        REQUIRE(q.status == errors::DEPOSIT_TOO_SMALL);
    }

    SECTION("Share arithmetic overflow") {
        auto q = s.book.shares_for_deposit(s.ledger.snapshot(), U128(1) << 100, U128(1) << 101);
        REQUIRE(q.status == errors::ARITHMETIC_OVERFLOW);
    }
}

TEST_CASE("Ratio tolerance divisor", "[liquidity]") {
    SECTION("A coarse divisor accepts skewed deposits") {
        // sharesA = 1e19, sharesB = 7.5e18; both truncate to 0 at 1e20
        SeededBook s(100 * PRECISION);
        auto q = s.book.shares_for_deposit(s.ledger.snapshot(), 100, 150);
        REQUIRE(q.status == errors::OK);
        REQUIRE(q.shares == 10 * PRECISION);
    }

    SECTION("Asset A figure is minted when both agree") {
        // sharesA = 1e19, sharesB = 1.005e19; equal once divided by 1e17
        SeededBook s(PRECISION / 10);
        auto q = s.book.shares_for_deposit(s.ledger.snapshot(), 100, 201);
        REQUIRE(q.status == errors::OK);
        REQUIRE(q.shares == 10 * PRECISION);
    }

    SECTION("A fine divisor rejects truncation noise") {
        // sharesB = 1e20 * 201 / 2000 = 1.005e19 differs from sharesA = 1e19 at divisor 1
        SeededBook s(1);
        auto q = s.book.shares_for_deposit(s.ledger.snapshot(), 100, 201);
        REQUIRE(q.status == errors::RATIO_MISMATCH);
    }
}

TEST_CASE("Withdrawal amounts", "[liquidity]") {
    SeededBook s;

    SECTION("Full redemption returns the full reserves") {
        auto q = s.book.amounts_for_withdraw(s.ledger.snapshot(), s.book.total_shares());
        REQUIRE(q.status == errors::OK);
        REQUIRE(q.amount_a == 1000);
        REQUIRE(q.amount_b == 2000);
    }

    SECTION("Partial redemption floors") {
        // one third of the shares: 1000/3 and 2000/3 truncated
        auto q = s.book.amounts_for_withdraw(s.ledger.snapshot(), s.book.total_shares() / 3);
        REQUIRE(q.status == errors::OK);
        REQUIRE(q.amount_a == 333);
        REQUIRE(q.amount_b == 666);
    }

    SECTION("More than the pool has") {
        auto q = s.book.amounts_for_withdraw(s.ledger.snapshot(), s.book.total_shares() + 1);
        REQUIRE(q.status == errors::INSUFFICIENT_POOL_SHARES);
    }

    SECTION("Empty book") {
        LiquidityBook empty;
        REQUIRE(empty.amounts_for_withdraw(s.ledger.snapshot(), 1).status ==
                errors::POOL_NOT_INITIALIZED);
    }
}

TEST_CASE("Positions", "[liquidity]") {
    SeededBook s;
    LiquidityBook& book = s.book;

    REQUIRE(book.mint(BOB, 10 * PRECISION) == errors::OK);
    REQUIRE(book.total_shares() == 110 * PRECISION);
    REQUIRE(book.shares_of(ALICE) + book.shares_of(BOB) == book.total_shares());
    REQUIRE(book.position_count() == 2);

    SECTION("Burning more than owned fails without effect") {
        REQUIRE(book.burn(BOB, 10 * PRECISION + 1) == errors::INSUFFICIENT_OWNED_SHARES);
        REQUIRE(book.burn(CAROL, 1) == errors::INSUFFICIENT_OWNED_SHARES);
        REQUIRE(book.shares_of(BOB) == 10 * PRECISION);
        REQUIRE(book.total_shares() == 110 * PRECISION);
    }

    SECTION("Burning everything erases the position") {
        REQUIRE(book.burn(BOB, 10 * PRECISION) == errors::OK);
        REQUIRE(book.shares_of(BOB) == 0);
        REQUIRE(book.position_count() == 1);
        REQUIRE(book.total_shares() == 100 * PRECISION);
    }

    SECTION("Mint that would wrap the total") {
        REQUIRE(book.mint(CAROL, ~U128(0)) == errors::ARITHMETIC_OVERFLOW);
        REQUIRE(book.shares_of(CAROL) == 0);
    }
}

TEST_CASE("Share arithmetic at 18-decimal amounts", "[liquidity][scale]") {
    // shares * reserve exceeds 128 bits long before the results do
    const U128 FOUR_TOKENS = 4 * PRECISION;
    LiquidityBook book;
    ReserveLedger ledger;

    auto seed = book.shares_for_deposit(ledger.snapshot(), FOUR_TOKENS, FOUR_TOKENS);
    REQUIRE(seed.shares == SEED_SHARES);
    REQUIRE(book.mint(ALICE, seed.shares) == errors::OK);
    ledger.commit(FOUR_TOKENS, FOUR_TOKENS);

    SECTION("Full redemption") {
        auto q = book.amounts_for_withdraw(ledger.snapshot(), SEED_SHARES);
        REQUIRE(q.status == errors::OK);
        REQUIRE(q.amount_a == FOUR_TOKENS);
        REQUIRE(q.amount_b == FOUR_TOKENS);
    }

    SECTION("Proportional deposit") {
        auto q = book.shares_for_deposit(ledger.snapshot(), FOUR_TOKENS, FOUR_TOKENS);
        REQUIRE(q.status == errors::OK);
        REQUIRE(q.shares == SEED_SHARES);
    }

    SECTION("Quarter redemption of a billion-token pool") {
        const U128 BILLION = PRECISION * 1000000000;
        ReserveLedger deep;
        deep.commit(BILLION, 3 * BILLION);
        auto q = book.amounts_for_withdraw(deep.snapshot(), SEED_SHARES / 4);
        REQUIRE(q.status == errors::OK);
        REQUIRE(q.amount_a == BILLION / 4);
        REQUIRE(q.amount_b == 3 * BILLION / 4);
    }
}
