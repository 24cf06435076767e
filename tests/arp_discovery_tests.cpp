#include "lanwatch/arp_discovery.hpp"

#include <catch2/catch_test_macros.hpp>

#include <fstream>
#include <mutex>
#include <sstream>
#include <thread>
#include <vector>

#include "lanwatch/subnet.hpp"
#include "test_support.hpp"

using namespace lanwatch::control;

namespace {

const char* kTable =
    "IP address       HW type     Flags       HW address            Mask     Device\n"
    "192.168.1.1      0x1         0x2         AA:BB:CC:00:00:01     *        eth0\n"
    "192.168.1.20     0x1         0x2         aa:bb:cc:00:00:02     *        eth0\n"
    "192.168.1.21     0x1         0x0         00:00:00:00:00:00     *        eth0\n"
    "192.168.1.22     0x1         0x2         ff:ff:ff:ff:ff:ff     *        eth0\n"
    "192.168.1.23     0x1         0x2         01:00:5e:00:00:fb     *        eth0\n"
    "192.168.1.24     0x1         0x0         aa:bb:cc:00:00:24     *        eth0\n"
    "10.0.0.5         0x1         0x2         aa:bb:cc:00:00:05     *        eth1\n"
    "192.168.1.20     0x1         0x2         aa:bb:cc:00:00:02     *        wlan0\n"
    "garbage\n";

}  // namespace

TEST_CASE("Neighbour table parsing keeps complete entries on the subnet", "[discovery]") {
    std::istringstream input(kTable);
    const auto hosts = ArpDiscovery::parse_arp_table(input, Subnet::parse("192.168.1.0/24"));

    REQUIRE(hosts.size() == 2);
    CHECK(hosts[0].address == "192.168.1.1");
    CHECK(hosts[0].hardware_id == "aa:bb:cc:00:00:01");
    CHECK(hosts[1].address == "192.168.1.20");
    CHECK(hosts[1].hardware_id == "aa:bb:cc:00:00:02");
    CHECK_FALSE(hosts[0].name);
}

TEST_CASE("Neighbour table parsing drops link-local addresses", "[discovery]") {
    std::istringstream input(
        "IP address       HW type     Flags       HW address            Mask     Device\n"
        "169.254.3.4      0x1         0x2         aa:bb:cc:00:00:09     *        eth0\n");
    CHECK(ArpDiscovery::parse_arp_table(input, Subnet::parse("169.254.3.0/24")).empty());
}

TEST_CASE("ArpDiscovery reads the neighbour table without probing", "[discovery]") {
    lanwatch::testing::TempDir dir("lanwatch-arp");
    const auto table = dir.path() / "arp";
    std::ofstream(table) << kTable;

    ArpDiscovery discovery(ArpDiscovery::Options{
        .arp_table = table,
        .probe_port = 9,
        .active_probe = false,
        .resolve_hostnames = false,
        .include_local_host = false});
    const auto result = discovery.discover(Subnet::parse("192.168.1.0/24"), std::chrono::milliseconds(500), 0);
    CHECK(result.method == "arp_cache");
    CHECK(result.hosts.size() == 2);
}

TEST_CASE("ArpDiscovery reports a missing neighbour table", "[discovery]") {
    ArpDiscovery discovery(ArpDiscovery::Options{
        .arp_table = "/nonexistent/arp",
        .probe_port = 9,
        .active_probe = false,
        .resolve_hostnames = false,
        .include_local_host = false});
    REQUIRE_THROWS_AS(discovery.discover(Subnet::parse("192.168.1.0/24"), std::chrono::milliseconds(500), 0),
                      DiscoveryError);
}

TEST_CASE("Hostname lookups are bounded by the discovery deadline", "[discovery]") {
    using namespace std::chrono_literals;
    lanwatch::testing::TempDir dir("lanwatch-arp");
    const auto table = dir.path() / "arp";
    std::ofstream(table) << kTable;

    std::mutex mutex;
    std::vector<std::chrono::milliseconds> budgets;
    auto options = ArpDiscovery::Options{.arp_table = table,
                                         .probe_port = 9,
                                         .active_probe = false,
                                         .resolve_hostnames = true,
                                         .hostname_timeout = 400ms,
                                         .include_local_host = false};

    SECTION("lookups that use their whole budget") {
        options.name_lookup = [&](const boost::asio::ip::address_v4&, std::chrono::milliseconds budget) {
            {
                std::lock_guard lock(mutex);
                budgets.push_back(budget);
            }
            std::this_thread::sleep_for(budget);
            return std::optional<std::string>();
        };
        ArpDiscovery discovery(std::move(options));

        const auto started = std::chrono::steady_clock::now();
        DiscoveryResult result;
        REQUIRE_NOTHROW(result = discovery.discover(Subnet::parse("192.168.1.0/24"), 500ms, 0));
        const auto elapsed = std::chrono::steady_clock::now() - started;

        CHECK(result.hosts.size() == 2);
        REQUIRE_FALSE(budgets.empty());
        for (const auto budget : budgets) {
            CHECK(budget <= 400ms);
            CHECK(budget > 0ms);
        }
        CHECK(elapsed < 1500ms);
    }

    SECTION("a lookup that stalls past the deadline") {
        options.name_lookup = [&](const boost::asio::ip::address_v4&, std::chrono::milliseconds budget) {
            {
                std::lock_guard lock(mutex);
                budgets.push_back(budget);
            }
            std::this_thread::sleep_for(1s);
            return std::optional<std::string>("stalled.lan");
        };
        ArpDiscovery discovery(std::move(options));

        DiscoveryResult result;
        REQUIRE_NOTHROW(result = discovery.discover(Subnet::parse("192.168.1.0/24"), 500ms, 0));
        REQUIRE(result.hosts.size() == 2);
        CHECK(result.hosts[0].name == std::optional<std::string>("stalled.lan"));
        CHECK_FALSE(result.hosts[1].name);
        CHECK(budgets.size() == 1);
    }
}

TEST_CASE("Names supplied by the lookup are attached to hosts", "[discovery]") {
    lanwatch::testing::TempDir dir("lanwatch-arp");
    const auto table = dir.path() / "arp";
    std::ofstream(table) << kTable;

    ArpDiscovery discovery(ArpDiscovery::Options{
        .arp_table = table,
        .probe_port = 9,
        .active_probe = false,
        .resolve_hostnames = true,
        .name_lookup = [](const boost::asio::ip::address_v4& address, std::chrono::milliseconds) {
            return std::optional<std::string>("host-" + address.to_string());
        },
        .include_local_host = false});
    const auto result = discovery.discover(Subnet::parse("192.168.1.0/24"), std::chrono::milliseconds(500), 0);
    REQUIRE(result.hosts.size() == 2);
    CHECK(result.hosts[0].name == std::optional<std::string>("host-192.168.1.1"));
    CHECK(result.hosts[1].name == std::optional<std::string>("host-192.168.1.20"));
}

TEST_CASE("The local host is listed first unless the table already has it", "[discovery]") {
    std::istringstream input(kTable);
    auto hosts = ArpDiscovery::parse_arp_table(input, Subnet::parse("192.168.1.0/24"));
    REQUIRE(hosts.size() == 2);

    SECTION("a new local host") {
        ArpDiscovery::add_local_host(
            hosts, DiscoveredHost{.address = "192.168.1.5", .hardware_id = "aa:bb:cc:00:00:99", .name = "This Device"});
        REQUIRE(hosts.size() == 3);
        CHECK(hosts[0].address == "192.168.1.5");
        CHECK(hosts[0].hardware_id == "aa:bb:cc:00:00:99");
        CHECK(hosts[0].name == std::optional<std::string>("This Device"));
        CHECK(hosts[1].address == "192.168.1.1");
    }

    SECTION("an address already in the table") {
        ArpDiscovery::add_local_host(
            hosts, DiscoveredHost{.address = "192.168.1.20", .hardware_id = "aa:bb:cc:00:00:99", .name = {}});
        CHECK(hosts.size() == 2);
    }

    SECTION("a hardware id already in the table") {
        ArpDiscovery::add_local_host(
            hosts, DiscoveredHost{.address = "192.168.1.5", .hardware_id = "aa:bb:cc:00:00:01", .name = {}});
        CHECK(hosts.size() == 2);
        CHECK(hosts[0].address == "192.168.1.1");
    }
}

TEST_CASE("No local host is found outside the attached networks", "[discovery]") {
    // 192.0.2.0/24 is reserved for documentation.
    CHECK_FALSE(ArpDiscovery::find_local_host(Subnet::parse("192.0.2.0/24")));
}

TEST_CASE("Subnet parsing and host enumeration", "[discovery]") {
    const auto subnet = Subnet::parse("192.168.1.77/24");
    CHECK(subnet.to_string() == "192.168.1.0/24");
    CHECK(subnet.contains(boost::asio::ip::make_address_v4("192.168.1.200")));
    CHECK_FALSE(subnet.contains(boost::asio::ip::make_address_v4("192.168.2.1")));

    const auto hosts = subnet.hosts();
    REQUIRE(hosts.size() == 254);
    CHECK(hosts.front().to_string() == "192.168.1.1");
    CHECK(hosts.back().to_string() == "192.168.1.254");

    REQUIRE_THROWS_AS(Subnet::parse("192.168.1.0/33"), std::invalid_argument);
    REQUIRE_THROWS_AS(Subnet::parse("192.168.1.0"), std::invalid_argument);
}

TEST_CASE("Hardware ids are normalised", "[discovery]") {
    CHECK(normalize_hardware_id("AA-BB-CC-DD-EE-FF") == "aa:bb:cc:dd:ee:ff");
    CHECK(normalize_hardware_id("aabb.ccdd.eeff") == "aa:bb:cc:dd:ee:ff");
    CHECK(normalize_hardware_id("aa:bb:cc:dd:ee:ff") == "aa:bb:cc:dd:ee:ff");
    CHECK(normalize_hardware_id("not-a-mac") == "notamac");
}
