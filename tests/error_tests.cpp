// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <courier/core/error.hpp>
#include <courier/engine/error.hpp>
#include <courier/store/error.hpp>

using namespace courier;

TEST_CASE("Error codes", "[error]") {
    SECTION("Courier errors convert implicitly") {
        std::error_code ec = core::CourierErrc::invalid_state;
        CHECK(ec);
        CHECK(ec == core::CourierErrc::invalid_state);
        CHECK(std::string(ec.category().name()) == "courier::core");
        CHECK(ec.message() == "Invalid state");
    }

    SECTION("Success is falsy") {
        std::error_code ec = core::CourierErrc::success;
        CHECK_FALSE(ec);
    }

    SECTION("Engine and store categories are distinct") {
        std::error_code engine_ec = engine::EngineErrc::not_found;
        std::error_code store_ec = store::StoreErrc::open_failed;
        CHECK(engine_ec.category() != store_ec.category());
        CHECK(engine_ec.value() == store_ec.value());
        CHECK(engine_ec != store_ec);
        CHECK(engine_ec.message() == "No such download");
        CHECK(store_ec.message() == "Cannot open database");
    }

    SECTION("Unknown values still produce a message") {
        std::error_code ec(99, core::courier_errc_category());
        CHECK(ec.message() == "Unknown error");
    }
}
