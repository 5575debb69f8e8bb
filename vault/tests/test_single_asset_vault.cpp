#include "../../strategy/tests/test_support.hpp"
#include "../src/single_asset_vault.hpp"

TEST_CASE("Single-asset vault", "[single_asset_vault]") {
    int64_t now = 5000;
    auto journal = std::make_shared<StateJournal>();
    auto bank = std::make_shared<TokenBank>(journal);
    SingleAssetVault pool("pool", "owner", "usd", journal, bank, [&now] { return now; }, 3600);

    bank->mint("usd", "alice", u("100"));
    bank->mint("usd", "bob", u("100"));
    bank->mint(NATIVE_COIN, "carol", u("50"));

    REQUIRE(pool.deposit("alice", u("100")) == u("100"));
    REQUIRE(pool.unlock_time() == 5000 + 3600);

    SECTION("Native swaps accumulate and are paid out pro rata") {
        REQUIRE(pool.swap_native_for_asset("carol", u("10")) == u("10"));
        REQUIRE(bank->balance_of("usd", "carol") == u("10"));
        REQUIRE(pool.total_assets() == u("100"));

        now += 3600;
        WithdrawResult r = pool.withdraw("alice", u("100"), "alice");
        REQUIRE(r.settlement_out == u("90"));
        REQUIRE(r.native_out == u("10"));
        REQUIRE(bank->balance_of(NATIVE_COIN, "alice") == u("10"));
        REQUIRE(pool.total_supply() == 0);
    }

    SECTION("Lock is pool-wide") {
        now += 3000;
        pool.deposit("bob", u("50"));
        REQUIRE(pool.unlock_time() == 8000 + 3600);

        now += 600;
        REQUIRE(error_of([&] { pool.withdraw("alice", u("100"), "alice"); }) == Errc::ComeBackLater);

        now = pool.unlock_time();
        pool.withdraw("alice", u("100"), "alice");
        REQUIRE(bank->balance_of("usd", "alice") == u("100"));
    }

    SECTION("Direct transfers do not move pricing") {
        pool.swap_native_for_asset("carol", u("20"));
        bank->transfer(NATIVE_COIN, "carol", "pool", u("25"));
        bank->transfer("usd", "bob", "pool", u("30"));

        REQUIRE(pool.held() == u("80"));
        REQUIRE(pool.native_held() == u("20"));
        REQUIRE(pool.deposit("bob", u("50")) == u("50"));

        now += 3600;
        WithdrawResult r = pool.withdraw("bob", u("50"), "bob");
        REQUIRE(r.settlement_out == u("43.333333333333333333"));
        REQUIRE(r.native_out == u("6.666666666666666666"));
    }

    SECTION("Swap limits") {
        REQUIRE(error_of([&] { pool.swap_native_for_asset("carol", 0); }) == Errc::TooSmall);
        REQUIRE(error_of([&] { pool.swap_native_for_asset("carol", u("101")); })
                == Errc::InsufficientBalance);
        REQUIRE(error_of([&] { pool.swap_native_for_asset("alice", u("1")); })
                == Errc::FailedToSendETH);
        REQUIRE(bank->balance_of("usd", "pool") == u("100"));
    }

    SECTION("Rejected native payout reverts the withdrawal") {
        pool.swap_native_for_asset("carol", u("10"));
        bank->set_rejects_native("alice", true);
        now += 3600;

        REQUIRE(error_of([&] { pool.withdraw("alice", u("100"), "alice"); }) == Errc::FailedToSendETH);
        REQUIRE(pool.balance_of("alice") == u("100"));
        REQUIRE(bank->balance_of("usd", "pool") == u("90"));
    }

    SECTION("Lock period is owner-controlled") {
        REQUIRE(error_of([&] { pool.set_lock_period("alice", 0); }) == Errc::Unauthorized);
        pool.set_lock_period("owner", 60);
        pool.deposit("bob", u("10"));
        REQUIRE(pool.unlock_time() == 5000 + 60);
    }
}

TEST_CASE("Single-asset vault resists a first-depositor donation", "[single_asset_vault]") {
    int64_t now = 5000;
    auto journal = std::make_shared<StateJournal>();
    auto bank = std::make_shared<TokenBank>(journal);
    SingleAssetVault pool("pool", "owner", "usd", journal, bank, [&now] { return now; }, 3600);

    bank->mint("usd", "mallory", u("101"));
    bank->mint("usd", "carol", u("150"));

    REQUIRE(pool.deposit("mallory", Amount(1)) == Amount(1));
    bank->transfer("usd", "mallory", "pool", u("100"));
    REQUIRE(pool.total_assets() == Amount(1));

    Amount shares = pool.deposit("carol", u("150"));
    REQUIRE(shares == u("150"));

    now += 3600;
    WithdrawResult r = pool.withdraw("carol", shares, "carol");
    Amount diff = u("150") - r.settlement_out;
    REQUIRE(diff <= u("0.0005"));
    REQUIRE(bank->balance_of("usd", "pool") >= u("100"));

    SECTION("A minimum deposit turns away dust-sized first deposits") {
        SingleAssetVault floored("floored", "owner", "usd", journal, bank, [&now] { return now; },
                                 3600, u("1"));
        REQUIRE(error_of([&] { floored.deposit("mallory", Amount(1)); }) == Errc::TooSmall);
        REQUIRE(floored.total_supply() == 0);

        REQUIRE(error_of([&] { floored.set_min_deposit("mallory", 0); }) == Errc::Unauthorized);
        floored.set_min_deposit("owner", 0);
        REQUIRE(floored.deposit("mallory", Amount(1)) == Amount(1));
    }
}
