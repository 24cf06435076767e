#include "lanwatch/util/config_loader.hpp"

#include <catch2/catch_test_macros.hpp>

#include <fstream>

#include "test_support.hpp"

using namespace lanwatch::control;

TEST_CASE("Config defaults apply to an empty document", "[config]") {
    const auto config = load_config_from_string("");
    CHECK(config.server.host == "0.0.0.0");
    CHECK(config.server.port == 8000);
    CHECK(config.scan.interval == std::chrono::seconds(30));
    CHECK(config.scan.grace_limit == 3);
    CHECK(config.scan.subnet == "auto");
    CHECK(config.scan.timeout == std::chrono::milliseconds(3000));
    CHECK(config.scan.retries == 3);
    CHECK(config.scan.include_local_host);
    CHECK(config.scan.arp_table.string() == "/proc/net/arp");
    CHECK(config.broadcast.send_timeout == std::chrono::milliseconds(2000));
    CHECK(config.broadcast.max_pending == 8);
    CHECK(config.storage.data_dir.string() == "./data");
    CHECK(config.logging.level == "info");
    CHECK(config.logging.file.empty());
}

TEST_CASE("Config file overrides individual keys", "[config]") {
    lanwatch::testing::TempDir dir("lanwatch-config");
    const auto path = dir.path() / "lanwatch.yaml";
    {
        std::ofstream output(path);
        REQUIRE(output.good());
        output << R"(
server:
  port: 9001
scan:
  interval_seconds: 10
  grace_limit: 5
  subnet: 10.0.7.12/24
  resolve_hostnames: false
  include_local_host: false
  retries: 10
broadcast:
  max_pending: 2
storage:
  data_dir: /var/lib/lanwatch
logging:
  level: debug
)";
    }

    const auto config = load_config(path.string());
    CHECK(config.server.host == "0.0.0.0");
    CHECK(config.server.port == 9001);
    CHECK(config.scan.interval == std::chrono::seconds(10));
    CHECK(config.scan.grace_limit == 5);
    CHECK(config.scan.subnet == "10.0.7.12/24");
    CHECK_FALSE(config.scan.resolve_hostnames);
    CHECK_FALSE(config.scan.include_local_host);
    CHECK(config.scan.retries == 10);
    CHECK(config.scan.timeout == std::chrono::milliseconds(3000));
    CHECK(config.broadcast.max_pending == 2);
    CHECK(config.storage.data_dir.string() == "/var/lib/lanwatch");
    CHECK(config.logging.level == "debug");
}

TEST_CASE("Config rejects invalid values", "[config]") {
    SECTION("interval below one second") {
        REQUIRE_THROWS_AS(load_config_from_string("scan: { interval_seconds: 0 }"), ConfigError);
    }
    SECTION("zero grace limit") {
        REQUIRE_THROWS_AS(load_config_from_string("scan: { grace_limit: 0 }"), ConfigError);
    }
    SECTION("port out of range") {
        REQUIRE_THROWS_AS(load_config_from_string("server: { port: 70000 }"), ConfigError);
    }
    SECTION("retries above the cap") {
        REQUIRE_THROWS_AS(load_config_from_string("scan: { retries: 11 }"), ConfigError);
    }
    SECTION("negative retries") {
        REQUIRE_THROWS_AS(load_config_from_string("scan: { retries: -1 }"), ConfigError);
    }
    SECTION("retries large enough to overflow") {
        REQUIRE_THROWS_AS(load_config_from_string("scan: { retries: 2147483647 }"), ConfigError);
    }
    SECTION("malformed subnet") {
        REQUIRE_THROWS_AS(load_config_from_string("scan: { subnet: not-a-network }"), ConfigError);
    }
    SECTION("subnet too large to sweep") {
        REQUIRE_THROWS_AS(load_config_from_string("scan: { subnet: 10.0.0.0/8 }"), ConfigError);
    }
    SECTION("non-numeric timeout") {
        REQUIRE_THROWS_AS(load_config_from_string("scan: { timeout_ms: soon }"), ConfigError);
    }
    SECTION("section that is not a mapping value") {
        REQUIRE_THROWS_AS(load_config_from_string("scan: { interval_seconds: [1, 2] }"), ConfigError);
    }
    SECTION("missing file") {
        REQUIRE_THROWS_AS(load_config("/nonexistent/lanwatch.yaml"), ConfigError);
    }
}
