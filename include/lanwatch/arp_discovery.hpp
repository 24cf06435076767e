#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <istream>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address_v4.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "lanwatch/discovery_provider.hpp"

namespace lanwatch::control {

// Reverse DNS bounded by a per-call budget. A lookup that outlives its budget
// keeps running in the resolver thread; its late answer is discarded.
class HostnameResolver {
public:
    HostnameResolver();

    HostnameResolver(const HostnameResolver&) = delete;
    HostnameResolver& operator=(const HostnameResolver&) = delete;

    std::optional<std::string> resolve(const boost::asio::ip::address_v4& address, std::chrono::milliseconds budget);

private:
    boost::asio::io_context io_context_;
    boost::asio::ip::tcp::resolver resolver_;
};

// Sweeps the subnet with UDP datagrams so the kernel ARPs every address, then
// reads the neighbour table. Once the table has been read the hosts are
// always returned; name lookups only fill in what the remaining budget allows.
class ArpDiscovery : public DiscoveryProvider {
public:
    using NameLookup =
        std::function<std::optional<std::string>(const boost::asio::ip::address_v4&, std::chrono::milliseconds)>;

    static constexpr int kMaxRetries = 10;

    struct Options {
        std::filesystem::path arp_table{"/proc/net/arp"};
        std::uint16_t probe_port{9};
        bool active_probe{true};
        bool resolve_hostnames{true};
        std::chrono::milliseconds hostname_timeout{500};
        // Replaces reverse DNS when set.
        NameLookup name_lookup;
        bool include_local_host{true};
    };

    explicit ArpDiscovery(Options options);

    DiscoveryResult discover(const Subnet& subnet, std::chrono::milliseconds timeout, int retries) override;

    // Parses the /proc/net/arp layout and applies the address filters.
    static std::vector<DiscoveredHost> parse_arp_table(std::istream& input, const Subnet& subnet);

    // The kernel never lists its own addresses in the neighbour table. Finds
    // the interface address inside `subnet` and its hardware address.
    static std::optional<DiscoveredHost> find_local_host(const Subnet& subnet);

    // Puts `local` first unless its address or hardware id is already listed.
    static void add_local_host(std::vector<DiscoveredHost>& hosts, DiscoveredHost local);

private:
    bool probe(const Subnet& subnet);
    std::vector<DiscoveredHost> read_table(const Subnet& subnet) const;
    void resolve_names(std::vector<DiscoveredHost>& hosts, std::chrono::steady_clock::time_point deadline);

    Options options_;
    std::optional<HostnameResolver> resolver_;
    NameLookup lookup_;
};

}  // namespace lanwatch::control
