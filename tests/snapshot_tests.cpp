// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <courier/store/error.hpp>
#include <courier/store/snapshot.hpp>
#include <nlohmann/json.hpp>

using namespace courier;
using namespace courier::store;

TEST_CASE("Snapshot::serialize", "[snapshot]") {
    Snapshot snap;
    snap.id = 12;
    snap.external_id = 7;
    snap.state = core::DownloadState::paused;
    snap.position = 3;
    snap.written = 1024;
    snap.total_size = 4096;
    snap.server_name = "a.iso";
    snap.url = "https://example.com/a.iso";
    snap.dest = "/tmp/a.iso";

    SECTION("Uses the stored key names") {
        auto j = nlohmann::json::parse(snap.serialize());
        CHECK(j.at("manId") == 7);
        CHECK(j.at("state") == "paused");
        CHECK(j.at("position") == 3);
        CHECK(j.at("error") == "");
        CHECK(j.at("written") == 1024);
        CHECK(j.at("totalSize") == 4096);
        CHECK(j.at("serverName") == "a.iso");
        CHECK(j.at("url") == "https://example.com/a.iso");
        CHECK(j.at("dest") == "/tmp/a.iso");
    }

    SECTION("Local id stays out of the body") {
        auto j = nlohmann::json::parse(snap.serialize());
        CHECK_FALSE(j.contains("id"));
    }

    SECTION("Optional request fields only when present") {
        auto plain = nlohmann::json::parse(snap.serialize());
        CHECK_FALSE(plain.contains("postData"));
        CHECK_FALSE(plain.contains("referrer"));

        snap.post_data = "";
        snap.referrer = "https://example.com/";
        auto full = nlohmann::json::parse(snap.serialize());
        CHECK(full.at("postData") == "");
        CHECK(full.at("referrer") == "https://example.com/");
    }
}

TEST_CASE("Snapshot::serialize tolerates non-UTF-8 text", "[snapshot]") {
    Snapshot snap;
    snap.url = "https://example.com/caf";
    snap.server_name = "caf\xe9.zip";
    snap.error = "bad \xff byte";

    std::string body;
    REQUIRE_NOTHROW(body = snap.serialize());

    auto back = Snapshot::deserialize(body);
    REQUIRE(back.has_value());
    CHECK(back->server_name == "caf\xEF\xBF\xBD.zip");
    CHECK(back->error == "bad \xEF\xBF\xBD byte");
    CHECK(back->url == "https://example.com/caf");
}

TEST_CASE("Snapshot::deserialize", "[snapshot]") {
    SECTION("Reads a stored body") {
        auto snap = Snapshot::deserialize(
            R"({"manId":9,"state":"done","position":4,"error":"","written":10,)"
            R"("totalSize":10,"serverName":"b.bin","url":"https://example.com/b.bin",)"
            R"("dest":"/tmp/b.bin","postData":"q=1"})");
        REQUIRE(snap.has_value());
        CHECK(snap->id == -1);
        CHECK(snap->external_id == 9);
        CHECK(snap->state == core::DownloadState::done);
        CHECK(snap->position == 4);
        CHECK(snap->server_name == "b.bin");
        CHECK(snap->post_data == std::optional<std::string>("q=1"));
        CHECK(snap->referrer.empty());
    }

    SECTION("Missing optional keys take defaults") {
        auto snap = Snapshot::deserialize(R"({"state":"queued","url":"https://example.com/"})");
        REQUIRE(snap.has_value());
        CHECK(snap->external_id == 0);
        CHECK(snap->position == -1);
        CHECK_FALSE(snap->post_data.has_value());
    }

    SECTION("Corrupt bodies") {
        CHECK(Snapshot::deserialize("").error() == StoreErrc::corrupt_record);
        CHECK(Snapshot::deserialize("{").error() == StoreErrc::corrupt_record);
        CHECK(Snapshot::deserialize("[]").error() == StoreErrc::corrupt_record);
        CHECK(Snapshot::deserialize(R"({"state":"queued"})").error() == StoreErrc::corrupt_record);
        CHECK(Snapshot::deserialize(R"({"url":"x","state":"exploded"})").error() == StoreErrc::corrupt_record);
        CHECK(Snapshot::deserialize(R"({"url":"x","state":3})").error() == StoreErrc::corrupt_record);
    }
}
