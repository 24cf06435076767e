#include "lanwatch/event_codec.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>

#include "lanwatch/util/time_format.hpp"

using namespace lanwatch::control;

namespace {

const TimePoint kNow = Clock::from_time_t(1'700'000'000);

DeviceView sample_view() {
    DeviceView view;
    view.record.hardware_id = "aa:bb:cc:00:00:10";
    view.record.address = "192.168.1.10";
    view.record.note = "kitchen tv";
    view.record.total_scans = 3;
    view.record.scans_online = 2;
    view.record.consecutive_offline = 1;
    view.record.first_seen = kNow - std::chrono::minutes(1);
    view.record.last_seen = kNow;
    view.status = Status::Online;
    view.category = Category::New;
    view.presence = Presence::Existing;
    return view;
}

}  // namespace

TEST_CASE("Timestamps are ISO-8601 UTC", "[codec]") {
    CHECK(lanwatch::util::to_iso8601(kNow) == "2023-11-14T22:13:20Z");
    CHECK(lanwatch::util::from_iso8601("2023-11-14T22:13:20Z") == kNow);
    REQUIRE_THROWS(lanwatch::util::from_iso8601("yesterday"));
}

TEST_CASE("Device objects carry every published field", "[codec]") {
    const auto node = codec::device_to_json(sample_view());
    CHECK(node.at("ip") == "192.168.1.10");
    CHECK(node.at("mac") == "aa:bb:cc:00:00:10");
    CHECK(node.at("hostname").is_null());
    CHECK(node.at("notes") == "kitchen tv");
    CHECK(node.at("status") == "online");
    CHECK(node.at("category") == "new");
    CHECK(node.at("device_status") == "existing");
    CHECK(node.at("first_seen") == "2023-11-14T22:12:20Z");
    CHECK(node.at("last_seen") == "2023-11-14T22:13:20Z");
    CHECK(node.at("last_seen_online").is_null());
    CHECK(node.at("total_scans") == 3);
    CHECK(node.at("scans_seen_online") == 2);
    CHECK(node.at("consecutive_offline") == 1);
}

TEST_CASE("Scan updates carry the cycle counts", "[codec]") {
    Snapshot snapshot;
    snapshot.devices.push_back(sample_view());
    snapshot.timestamp = kNow;
    snapshot.next_scan = kNow + std::chrono::seconds(30);
    snapshot.cycle = 4;
    snapshot.counts = CycleCounts{.online_count = 1, .new_count = 0, .offline_count = 0, .back_online_count = 1};

    const auto update = codec::make_scan_update(snapshot);
    CHECK(update.at("type") == "scan_update");
    CHECK(update.at("count") == 1);
    CHECK(update.at("timestamp") == "2023-11-14T22:13:20Z");
    CHECK(update.at("next_scan") == "2023-11-14T22:13:50Z");
    CHECK(update.at("scan_interval") == 30);
    CHECK(update.at("scanning") == false);
    CHECK(update.at("back_online_count") == 1);

    const auto initial = codec::make_initial_state(Snapshot{});
    CHECK(initial.at("type") == "initial_state");
    CHECK(initial.at("timestamp").is_null());
    CHECK(initial.at("devices").empty());
    CHECK_FALSE(initial.contains("online_count"));
}

TEST_CASE("History statistics report rates in percent", "[codec]") {
    HistoryStats stats;
    stats.total_devices = 1;
    stats.total_scans = 3;
    stats.active_24h = 1;
    stats.devices.push_back(DeviceHistory{.record = sample_view().record, .category = Category::New});

    const auto node = codec::make_history_stats(stats);
    CHECK(node.at("success") == true);
    CHECK(node.at("total_scans") == 3);
    CHECK(node.at("devices")[0].at("appearance_rate") == 66.7);
}
