// cpmm - Swap Pricing Tests

#include <catch2/catch_test_macros.hpp>
#include "test_helpers.hpp"

using namespace cpmm;

namespace {

ReserveSnapshot reserves(U128 a, U128 b) {
    return ReserveSnapshot{a, b, u256::mul(a, b)};
}

}  // namespace

TEST_CASE("Exact-input quotes", "[pricing]") {
    auto r = reserves(1000, 1000);

    SECTION("Constant-product output") {
        // k / 1100 = 909.09 -> 909; out = 1000 - 909
        auto q = pricing::quote_a_to_b(r, 100);
        REQUIRE(q.ok());
        REQUIRE(q.asset_in == Asset::A);
        REQUIRE(q.amount_out == 91);
        REQUIRE(q.reserve_in_after == 1100);
        REQUIRE(q.reserve_out_after == 909);
    }

    SECTION("Directions are symmetric on balanced reserves") {
        REQUIRE(pricing::quote_a_to_b(r, 250).amount_out ==
                pricing::quote_b_to_a(r, 250).amount_out);
    }

    SECTION("Skewed reserves") {
        // (1000, 2000): k / 1100 = 1818.18 -> 1818
        auto q = pricing::quote_a_to_b(reserves(1000, 2000), 100);
        REQUIRE(q.amount_out == 182);
        auto back = pricing::quote_b_to_a(reserves(1000, 2000), 200);
        // k / 2200 = 909.09 -> 909
        REQUIRE(back.amount_out == 91);
    }

    SECTION("Input that would take the whole reserve is clamped one below it") {
        // k / 1001000 == 0, so the raw output equals the reserve
        auto q = pricing::quote_a_to_b(r, 1000000);
        REQUIRE(q.ok());
        REQUIRE(q.amount_out == 999);
        REQUIRE(q.reserve_out_after == 1);
    }

    SECTION("Output never reaches the opposite reserve") {
        U128 inputs[] = {1, 10, 999, 1000, 5000, 123456, 999999, 1000001, U128(1) << 90};
        for (U128 in : inputs) {
            auto q = pricing::quote_a_to_b(r, in);
            REQUIRE(q.ok());
            REQUIRE(q.amount_out < r.reserve_b);
        }
    }

    SECTION("Errors") {
        REQUIRE(pricing::quote_a_to_b(r, 0).status == errors::INVALID_AMOUNT);
        REQUIRE(pricing::quote_a_to_b(reserves(0, 0), 10).status == errors::POOL_NOT_INITIALIZED);
        REQUIRE(pricing::quote_a_to_b(r, ~U128(0)).status == errors::ARITHMETIC_OVERFLOW);
    }

    SECTION("Product inconsistent with reserves is refused") {
        ReserveSnapshot bad{1000, 1000, U256(2000000)};
        REQUIRE(pricing::quote_a_to_b(bad, 1).status == errors::ARITHMETIC_OVERFLOW);
    }
}

TEST_CASE("Quotes are monotonic in the input", "[pricing]") {
    auto r = reserves(1000, 3000);
    U128 previous = 0;
    for (U128 in = 1; in <= 20000; in += 7) {
        auto q = pricing::quote_a_to_b(r, in);
        REQUIRE(q.ok());
        REQUIRE(q.amount_out >= previous);
        REQUIRE(q.amount_out < r.reserve_b);
        previous = q.amount_out;
    }
}

TEST_CASE("Exact-output quotes", "[pricing]") {
    auto r = reserves(1000, 1000);

    SECTION("Input required for an output") {
        // reserve_out_after = 909, k / 909 = 1100.1 -> 1100
        auto q = pricing::quote_exact_out(r, Asset::B, 91);
        REQUIRE(q.ok());
        REQUIRE(q.asset_in == Asset::A);
        REQUIRE(q.amount_in == 100);
        REQUIRE(pricing::quote_a_to_b(r, q.amount_in).amount_out == 91);
    }

    SECTION("Whole reserve cannot be bought") {
        REQUIRE(pricing::quote_exact_out(r, Asset::A, 1000).status == errors::POOL_DRAINAGE);
        REQUIRE(pricing::quote_exact_out(r, Asset::A, 5000).status == errors::POOL_DRAINAGE);
        REQUIRE(pricing::quote_exact_out(r, Asset::A, 999).ok());
    }

    SECTION("Errors") {
        REQUIRE(pricing::quote_exact_out(r, Asset::B, 0).status == errors::INVALID_AMOUNT);
        REQUIRE(pricing::quote_exact_out(reserves(0, 0), Asset::B, 1).status ==
                errors::POOL_NOT_INITIALIZED);
    }
}

TEST_CASE("Deposit ratio quotes", "[pricing]") {
    auto r = reserves(1000, 2000);

    REQUIRE(pricing::deposit_b_for_a(r, 100).amount == 200);
    REQUIRE(pricing::deposit_a_for_b(r, 200).amount == 100);
    REQUIRE(pricing::deposit_a_for_b(r, 3).amount == 1);  // 1.5 truncated
    REQUIRE(pricing::deposit_b_for_a(reserves(0, 0), 1).status == errors::POOL_NOT_INITIALIZED);
    REQUIRE(pricing::deposit_b_for_a(r, ~U128(0)).status == errors::ARITHMETIC_OVERFLOW);
}

TEST_CASE("Quotes against a product beyond 128 bits", "[pricing][scale]") {
    const U128 E24 = PRECISION * 1000000;
    auto r = reserves(E24, E24);

    auto q = pricing::quote_a_to_b(r, E24);
    REQUIRE(q.ok());
    REQUIRE(q.amount_out == E24 / 2);

    auto need = pricing::quote_exact_out(r, Asset::B, E24 / 2);
    REQUIRE(need.ok());
    REQUIRE(need.amount_in == E24);

    // Buying all but one unit needs an input the amount type cannot hold
    REQUIRE(pricing::quote_exact_out(r, Asset::B, E24 - 1).status ==
            errors::ARITHMETIC_OVERFLOW);
}
