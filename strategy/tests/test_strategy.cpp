#include "test_support.hpp"
#include "../../adapters/src/ratio_wrapper.hpp"

TEST_CASE("Strategy deposit", "[strategy]") {
    StrategyFixture f;

    SECTION("Settlement deposits are staked into the registry") {
        REQUIRE(f.deposit("usd", "100") == u("100"));

        REQUIRE(f.strategy->reserves("usd") == 0);
        REQUIRE(f.strategy->reserves("susd") == u("100"));
        REQUIRE(f.bank->balance_of("susd", "strategy") == u("100"));
        REQUIRE(f.strategy->total_assets() == u("100"));
    }

    SECTION("Other underlyings are held as-is and priced by their feed") {
        f.deposit("weth", "1.5");

        REQUIRE(f.strategy->reserves("weth") == u("1.5"));
        REQUIRE(f.strategy->total_assets() == u("3000"));

        f.weth_feed->set_rate(u("2100"));
        REQUIRE(f.strategy->total_assets() == u("3150"));
    }

    SECTION("Unknown asset is rejected and nothing stays booked") {
        REQUIRE(error_of([&] { f.deposit("doge", "5"); }) == Errc::UnknownAsset);

        REQUIRE(f.strategy->reserves("doge") == 0);
        REQUIRE(f.bank->balance_of("doge", "strategy") == 0);
        REQUIRE(f.bank->balance_of("doge", "vault") == u("5"));
        REQUIRE(f.journal->pending() == 0);
    }

    SECTION("Minimum deposit is inclusive") {
        REQUIRE(error_of([&] { f.deposit("weth", "0.009999"); }) == Errc::TooSmall);
        REQUIRE(f.strategy->reserves("weth") == 0);

        REQUIRE(f.deposit("weth", "0.01") == u("0.01"));
    }

    SECTION("Ceiling applies to the post-deposit reserve") {
        f.deposit("weth", "100");
        REQUIRE(f.strategy->reserves("weth") == u("100"));

        REQUIRE(error_of([&] { f.deposit("weth", "0.01"); }) == Errc::ExceedsDepositCeiling);
        REQUIRE(f.strategy->reserves("weth") == u("100"));

        f.strategy->set_deposit_ceiling("owner", "weth", 0);
        f.deposit("weth", "0.01");
        REQUIRE(f.strategy->reserves("weth") == u("100.01"));
    }

    SECTION("Only the bound vault may deposit") {
        f.bank->mint("usd", "strategy", u("10"));
        REQUIRE(error_of([&] { f.strategy->deposit("mallory", "usd", u("10"), false); })
                == Errc::Unauthorized);
    }

    SECTION("Sell flag converts to settlement and stakes it") {
        f.deposit("weth", "1", true);

        REQUIRE(f.strategy->reserves("weth") == 0);
        REQUIRE(f.strategy->reserves("susd") == u("2000"));
        REQUIRE(f.bank->balance_of("weth", "dex-pool") == u("1"));
        REQUIRE(f.strategy->total_assets() == u("2000"));
    }

    SECTION("Sell flag without a default route fails") {
        auto wbtc_feed = std::make_shared<PriceFeed>(u("60000"));
        f.valuation->set_rate_provider("wbtc", wbtc_feed);
        f.strategy->set_underlying_asset("owner", "wbtc", {0, 0});

        REQUIRE(error_of([&] { f.deposit("wbtc", "1", true); }) == Errc::NotSupportedSwapper);
        REQUIRE(f.strategy->reserves("wbtc") == 0);

        f.deposit("wbtc", "1", false);
        REQUIRE(f.strategy->reserves("wbtc") == u("1"));
    }
}

TEST_CASE("Strategy wraps non-canonical deposits", "[strategy]") {
    StrategyFixture f;
    auto wrapper = std::make_shared<RatioWrapper>("wrapper", "steth", "wsteth", f.bank, u("1.1"));

    f.strategy->add_wrapper("owner", wrapper);
    f.strategy->set_underlying_asset("owner", "wsteth", {0, 0});

    REQUIRE(f.deposit("steth", "11") == u("10"));
    REQUIRE(f.strategy->reserves("wsteth") == u("10"));
    REQUIRE(f.strategy->reserves("steth") == 0);
    REQUIRE(f.bank->balance_of("wsteth", "strategy") == u("10"));
    REQUIRE(f.bank->balance_of("steth", "wrapper") == u("11"));
    REQUIRE(f.strategy->total_assets() == u("11"));
}

TEST_CASE("Strategy holding order", "[strategy]") {
    StrategyFixture f;

    std::vector<Asset> expected = {"usd", "susd", "native", "weth"};
    REQUIRE(f.strategy->holding_assets() == expected);

    SECTION("Removing an underlying with reserves keeps it held") {
        f.deposit("weth", "1");
        f.strategy->remove_underlying_asset("owner", "weth");

        REQUIRE_FALSE(f.strategy->is_underlying("weth"));
        REQUIRE(f.strategy->holding_assets() == expected);
        REQUIRE(error_of([&] { f.deposit("weth", "1"); }) == Errc::UnknownAsset);
    }

    SECTION("Removing an empty underlying drops it") {
        f.strategy->remove_underlying_asset("owner", "weth");

        std::vector<Asset> core = {"usd", "susd", "native"};
        REQUIRE(f.strategy->holding_assets() == core);
    }

    SECTION("Underlyings need a rate") {
        REQUIRE(error_of([&] { f.strategy->set_underlying_asset("owner", "doge", {0, 0}); })
                == Errc::UnknownAsset);
    }
}

TEST_CASE("Strategy withdraw", "[strategy]") {
    SECTION("Pays each holding pro rata") {
        StrategyFixture f;
        f.deposit("usd", "100");
        f.deposit("weth", "1");

        WithdrawResult r = f.strategy->withdraw("vault", 1, 4, "alice");

        REQUIRE(r.settlement_out == u("25"));
        REQUIRE(r.native_out == u("0.25"));
        REQUIRE(f.bank->balance_of("usd", "alice") == u("25"));
        REQUIRE(f.bank->balance_of("native", "alice") == u("0.25"));

        REQUIRE(f.strategy->reserves("susd") == u("75"));
        REQUIRE(f.strategy->reserves("weth") == u("0.75"));
        REQUIRE(f.strategy->reserves("usd") == 0);
        REQUIRE(f.strategy->reserves("native") == 0);
    }

    SECTION("Rounds each leg down") {
        StrategyFixture f;
        f.deposit("usd", "100");

        WithdrawResult r = f.strategy->withdraw("vault", 1, 3, "alice");

        REQUIRE(r.settlement_out == Amount("33333333333333333333"));
        REQUIRE(f.strategy->reserves("susd") == Amount("66666666666666666667"));
    }

    SECTION("Receipt legs under the dust floor stay in reserve") {
        StrategyConfig config;
        config.registry_dust_floor = u("1");
        StrategyFixture f(config);
        f.deposit("usd", "100");

        WithdrawResult r = f.strategy->withdraw("vault", 1, 1000, "alice");

        REQUIRE(r.settlement_out == 0);
        REQUIRE(r.native_out == 0);
        REQUIRE(f.strategy->reserves("susd") == u("100"));
    }

    SECTION("Registry fee: ledger credits proceeds, debits the requested receipt") {
        StrategyFixture f;
        f.registry->set_withdraw_fee_bps(100);
        f.deposit("usd", "100");

        WithdrawResult r = f.strategy->withdraw("vault", 1, 2, "alice");

        REQUIRE(r.settlement_out == u("49.5"));
        REQUIRE(f.bank->balance_of("usd", "alice") == u("49.5"));
        REQUIRE(f.strategy->reserves("susd") == u("50"));
        REQUIRE(f.strategy->reserves("usd") == 0);
    }

    SECTION("Accrued receipt redeems at the new rate") {
        StrategyFixture f;
        f.deposit("usd", "100");
        f.registry->accrue(u("1.1"));

        REQUIRE(f.strategy->total_assets() == u("110"));

        WithdrawResult r = f.strategy->withdraw("vault", 1, 2, "alice");
        REQUIRE(r.settlement_out == u("55"));
        REQUIRE(f.strategy->total_assets() == u("55"));
    }

    SECTION("Ineligible registry withdrawal reverts everything") {
        StrategyFixture f;
        f.deposit("usd", "100");
        f.deposit("weth", "1");
        f.registry->set_paused(true);

        REQUIRE(error_of([&] { f.strategy->withdraw("vault", 1, 2, "alice"); })
                == Errc::WithdrawNotEligible);

        REQUIRE(f.strategy->reserves("susd") == u("100"));
        REQUIRE(f.strategy->reserves("weth") == u("1"));
        REQUIRE(f.bank->balance_of("usd", "alice") == 0);
    }

    SECTION("Rejected native payout reverts everything") {
        StrategyFixture f;
        f.deposit("usd", "100");
        f.deposit("weth", "1");
        f.bank->set_rejects_native("alice", true);

        REQUIRE(error_of([&] { f.strategy->withdraw("vault", 1, 2, "alice"); })
                == Errc::FailedToSendETH);

        REQUIRE(f.strategy->reserves("susd") == u("100"));
        REQUIRE(f.strategy->reserves("weth") == u("1"));
        REQUIRE(f.bank->balance_of("usd", "alice") == 0);
        REQUIRE(f.bank->balance_of("native", "dex-pool") == u("1000"));
    }

    SECTION("Argument checks") {
        StrategyFixture f;
        f.deposit("usd", "100");

        REQUIRE(error_of([&] { f.strategy->withdraw("alice", 1, 2, "alice"); }) == Errc::Unauthorized);
        REQUIRE(error_of([&] { f.strategy->withdraw("vault", 1, 2, ""); }) == Errc::ZeroAddress);
        REQUIRE(error_of([&] { f.strategy->withdraw("vault", 0, 2, "alice"); }) == Errc::TooSmall);
        REQUIRE(error_of([&] { f.strategy->withdraw("vault", 3, 2, "alice"); })
                == Errc::InsufficientBalance);
    }
}

TEST_CASE("Strategy manual swaps", "[strategy]") {
    StrategyFixture f;
    f.deposit("weth", "1");

    SECTION("Manager swap into settlement is staked") {
        REQUIRE(f.strategy->invoke_swap("owner", "dex", "weth", u("0.5"), "usd", 0) == u("1000"));

        REQUIRE(f.strategy->reserves("weth") == u("0.5"));
        REQUIRE(f.strategy->reserves("susd") == u("1000"));
        REQUIRE(f.strategy->reserves("usd") == 0);
    }

    SECTION("Minimum output is enforced") {
        REQUIRE(error_of([&] {
            f.strategy->invoke_swap("owner", "dex", "weth", u("0.5"), "usd", u("1500"));
        }) == Errc::InsufficientOutput);
        REQUIRE(f.strategy->reserves("weth") == u("1"));
    }

    SECTION("Only the manager may swap") {
        REQUIRE(error_of([&] {
            f.strategy->invoke_swap("mallory", "dex", "weth", u("0.5"), "usd", 0);
        }) == Errc::Unauthorized);

        f.strategy->set_manager("owner", "desk");
        REQUIRE(f.strategy->invoke_swap("desk", "dex", "weth", u("0.5"), "usd", 0) == u("1000"));
    }

    SECTION("Swapper must be enabled for the pair") {
        REQUIRE(error_of([&] {
            f.strategy->invoke_swap("owner", "other", "weth", u("0.5"), "usd", 0);
        }) == Errc::InvalidSwapper);
    }

    SECTION("Output must be a holding asset") {
        f.dex->set_rate("weth", "dai", u("2000"));
        f.strategy->add_swapper("owner", "weth", "dai", f.dex);

        REQUIRE(error_of([&] {
            f.strategy->invoke_swap("owner", "dex", "weth", u("0.5"), "dai", 0);
        }) == Errc::UnknownAsset);
    }
}

TEST_CASE("Strategy swapper administration", "[strategy]") {
    StrategyFixture f;
    auto dex2 = std::make_shared<FixedRateSwapper>("dex2", "dex2-pool", f.bank);

    SECTION("Default swapper cannot be removed") {
        REQUIRE(error_of([&] { f.strategy->remove_swapper("owner", "weth", "usd", "dex"); })
                == Errc::SetDefaultSwapperBefore);
        REQUIRE(f.strategy->is_swapper_enabled("weth", "usd", "dex"));
    }

    SECTION("Default must be enabled first") {
        REQUIRE(error_of([&] { f.strategy->set_default_swapper("owner", "weth", "usd", "dex2"); })
                == Errc::NotSupportedSwapper);
    }

    SECTION("Switching the default frees the old swapper") {
        f.strategy->add_swapper("owner", "weth", "usd", dex2);
        f.strategy->set_default_swapper("owner", "weth", "usd", "dex2");
        f.strategy->remove_swapper("owner", "weth", "usd", "dex");

        REQUIRE(f.strategy->default_swapper("weth", "usd") == "dex2");
        REQUIRE_FALSE(f.strategy->is_swapper_enabled("weth", "usd", "dex"));
        REQUIRE(f.strategy->is_swapper_enabled("weth", "native", "dex"));
    }

    SECTION("Administration is owner-only") {
        REQUIRE(error_of([&] { f.strategy->add_swapper("mallory", "weth", "usd", dex2); })
                == Errc::Unauthorized);
        REQUIRE(error_of([&] { f.strategy->set_min_deposit("mallory", "weth", 0); })
                == Errc::Unauthorized);
        REQUIRE(error_of([&] { f.strategy->set_vault("owner", "other-vault"); })
                == Errc::Unauthorized);
    }
}

TEST_CASE("Strategy migration", "[strategy]") {
    StrategyFixture f;
    f.deposit("usd", "100");
    f.deposit("weth", "1");
    auto next = f.make_strategy("strategy-2");
    next->remove_underlying_asset("owner", "weth");

    SECTION("Moves every reserve and books it on the other side") {
        Amount before = f.strategy->total_assets();

        MigrationManifest manifest = f.strategy->migrate_funds("vault", "strategy-2");
        next->accept_migration("vault", "strategy", manifest);

        REQUIRE(manifest.size() == 2);
        REQUIRE(f.strategy->total_assets() == 0);
        REQUIRE(f.strategy->reserves("susd") == 0);
        REQUIRE(next->reserves("susd") == u("100"));
        REQUIRE(next->reserves("weth") == u("1"));
        REQUIRE(next->total_assets() == before);
        REQUIRE(f.bank->balance_of("susd", "strategy-2") == u("100"));
        REQUIRE(f.bank->balance_of("weth", "strategy-2") == u("1"));

        // Held but no longer accepted for deposit
        REQUIRE(next->holding_assets().back() == "weth");
        REQUIRE_FALSE(next->is_underlying("weth"));
    }

    SECTION("Registry refusal keeps funds in place") {
        f.registry->set_paused(true);

        REQUIRE(error_of([&] { f.strategy->migrate_funds("vault", "strategy-2"); })
                == Errc::WithdrawNotEligible);
        REQUIRE(f.strategy->reserves("weth") == u("1"));
        REQUIRE(f.bank->balance_of("weth", "strategy-2") == 0);
    }

    SECTION("Vault-only") {
        REQUIRE(error_of([&] { f.strategy->migrate_funds("owner", "strategy-2"); })
                == Errc::Unauthorized);
        REQUIRE(error_of([&] { next->accept_migration("owner", "strategy", {}); })
                == Errc::Unauthorized);
    }
}
