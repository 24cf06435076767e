#include "lanwatch/arp_discovery.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <memory>
#include <sstream>
#include <thread>
#include <unordered_set>

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <sys/ioctl.h>
#include <sys/socket.h>
#include <unistd.h>

#include <boost/asio/ip/host_name.hpp>
#include <boost/asio/ip/udp.hpp>

#include "lanwatch/device_types.hpp"
#include "lanwatch/util/logging.hpp"

namespace lanwatch::control {

namespace asio = boost::asio;

namespace {

constexpr unsigned long kArpFlagComplete = 0x2;
// Sending the probe datagrams of a large subnet may run a little past the deadline.
constexpr auto kDeadlineSlack = std::chrono::milliseconds(250);

bool is_filtered_address(const asio::ip::address_v4& address) {
    const auto bytes = address.to_bytes();
    const bool link_local = bytes[0] == 169 && bytes[1] == 254;
    return link_local || address.is_multicast() || address.is_unspecified();
}

bool is_filtered_hardware_id(const std::string& hardware_id) {
    return hardware_id == "00:00:00:00:00:00" || hardware_id == "ff:ff:ff:ff:ff:ff" ||
           hardware_id.rfind("01:00:5e", 0) == 0;
}

}  // namespace

HostnameResolver::HostnameResolver() : io_context_(), resolver_(io_context_) {}

std::optional<std::string> HostnameResolver::resolve(const asio::ip::address_v4& address,
                                                     std::chrono::milliseconds budget) {
    auto result = std::make_shared<std::optional<std::string>>();
    const auto numeric = address.to_string();
    resolver_.async_resolve(asio::ip::tcp::endpoint(address, 0),
                            [result, numeric](const boost::system::error_code& ec,
                                              asio::ip::tcp::resolver::results_type results) {
                                if (ec || results.empty()) {
                                    return;
                                }
                                auto host = results.begin()->host_name();
                                if (!host.empty() && host != numeric) {
                                    *result = std::move(host);
                                }
                            });
    io_context_.restart();
    io_context_.run_for(budget);
    resolver_.cancel();
    return *result;
}

ArpDiscovery::ArpDiscovery(Options options) : options_(std::move(options)) {
    if (options_.name_lookup) {
        lookup_ = options_.name_lookup;
    } else if (options_.resolve_hostnames) {
        resolver_.emplace();
        lookup_ = [this](const asio::ip::address_v4& address, std::chrono::milliseconds budget) {
            return resolver_->resolve(address, budget);
        };
    }
}

DiscoveryResult ArpDiscovery::discover(const Subnet& subnet, std::chrono::milliseconds timeout, int retries) {
    const auto started = std::chrono::steady_clock::now();
    const auto deadline = started + timeout;
    const int attempts = std::clamp(retries, 0, kMaxRetries) + 1;
    // Half of the budget is spent waiting for replies, the rest is left for the
    // table read and name lookups.
    const auto settle = timeout / (2 * attempts);

    DiscoveryResult result;
    result.method = options_.active_probe ? "arp_probe" : "arp_cache";

    if (options_.active_probe) {
        for (int attempt = 0; attempt < attempts; ++attempt) {
            if (!probe(subnet)) {
                util::log::warn("ARP probe unavailable, falling back to the neighbour table only");
                result.method = "arp_cache";
                break;
            }
            const auto remaining = deadline - std::chrono::steady_clock::now();
            if (remaining <= std::chrono::steady_clock::duration::zero()) {
                break;
            }
            std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(settle, remaining));
        }
        if (std::chrono::steady_clock::now() > deadline + kDeadlineSlack) {
            throw DiscoveryTimeout("ARP probing of " + subnet.to_string() + " exceeded " +
                                   std::to_string(timeout.count()) + " ms");
        }
    }

    result.hosts = read_table(subnet);
    if (options_.include_local_host) {
        if (auto local = find_local_host(subnet)) {
            add_local_host(result.hosts, std::move(*local));
        }
    }
    if (lookup_) {
        resolve_names(result.hosts, deadline);
    }
    return result;
}

void ArpDiscovery::resolve_names(std::vector<DiscoveredHost>& hosts, std::chrono::steady_clock::time_point deadline) {
    std::size_t skipped = 0;
    for (auto& host : hosts) {
        if (host.name) {
            continue;
        }
        const auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (remaining <= std::chrono::milliseconds::zero()) {
            ++skipped;
            continue;
        }
        boost::system::error_code ec;
        const auto address = asio::ip::make_address_v4(host.address, ec);
        if (!ec) {
            host.name = lookup_(address, std::min(options_.hostname_timeout, remaining));
        }
    }
    if (skipped > 0) {
        util::log::debug("Hostname lookups skipped for " + std::to_string(skipped) +
                         " hosts, discovery deadline reached");
    }
}

std::optional<DiscoveredHost> ArpDiscovery::find_local_host(const Subnet& subnet) {
    ifaddrs* interfaces = nullptr;
    if (getifaddrs(&interfaces) != 0) {
        util::log::debug(std::string("getifaddrs failed: ") + std::strerror(errno));
        return std::nullopt;
    }

    std::optional<DiscoveredHost> local;
    for (auto* entry = interfaces; entry && !local; entry = entry->ifa_next) {
        if (!entry->ifa_addr || entry->ifa_addr->sa_family != AF_INET) {
            continue;
        }
        if (!(entry->ifa_flags & IFF_UP) || (entry->ifa_flags & IFF_LOOPBACK)) {
            continue;
        }
        const auto* in = reinterpret_cast<const sockaddr_in*>(entry->ifa_addr);
        const asio::ip::address_v4 address(ntohl(in->sin_addr.s_addr));
        if (!subnet.contains(address)) {
            continue;
        }

        const int fd = ::socket(AF_INET, SOCK_DGRAM, 0);
        if (fd < 0) {
            break;
        }
        ifreq request{};
        std::strncpy(request.ifr_name, entry->ifa_name, IFNAMSIZ - 1);
        const bool have_hwaddr = ::ioctl(fd, SIOCGIFHWADDR, &request) == 0;
        ::close(fd);
        if (!have_hwaddr) {
            continue;
        }

        const auto* bytes = reinterpret_cast<const unsigned char*>(request.ifr_hwaddr.sa_data);
        char text[18];
        std::snprintf(text, sizeof(text), "%02x:%02x:%02x:%02x:%02x:%02x", bytes[0], bytes[1], bytes[2], bytes[3],
                      bytes[4], bytes[5]);
        auto hardware_id = normalize_hardware_id(text);
        if (is_filtered_hardware_id(hardware_id)) {
            continue;
        }
        boost::system::error_code ec;
        auto host_name = asio::ip::host_name(ec);
        local = DiscoveredHost{.address = address.to_string(),
                               .hardware_id = std::move(hardware_id),
                               .name = ec ? std::string("This Device") : host_name + " (This Device)"};
    }
    freeifaddrs(interfaces);
    return local;
}

void ArpDiscovery::add_local_host(std::vector<DiscoveredHost>& hosts, DiscoveredHost local) {
    for (const auto& host : hosts) {
        if (host.address == local.address || host.hardware_id == local.hardware_id) {
            return;
        }
    }
    hosts.insert(hosts.begin(), std::move(local));
}

bool ArpDiscovery::probe(const Subnet& subnet) {
    asio::io_context io_context;
    asio::ip::udp::socket socket(io_context);
    boost::system::error_code ec;
    socket.open(asio::ip::udp::v4(), ec);
    if (ec) {
        util::log::warn("Failed to open probe socket: " + ec.message());
        return false;
    }

    const std::array<char, 1> payload{};
    std::size_t failures = 0;
    const auto hosts = subnet.hosts();
    for (const auto& host : hosts) {
        socket.send_to(asio::buffer(payload.data(), 0),
                       asio::ip::udp::endpoint(host, options_.probe_port), 0, ec);
        if (ec) {
            ++failures;
        }
    }
    if (!hosts.empty() && failures == hosts.size()) {
        util::log::warn("Every probe datagram to " + subnet.to_string() + " failed: " + ec.message());
        return false;
    }
    return true;
}

std::vector<DiscoveredHost> ArpDiscovery::read_table(const Subnet& subnet) const {
    std::ifstream input(options_.arp_table);
    if (!input) {
        throw DiscoveryError("Failed to open neighbour table: " + options_.arp_table.string());
    }
    return parse_arp_table(input, subnet);
}

std::vector<DiscoveredHost> ArpDiscovery::parse_arp_table(std::istream& input, const Subnet& subnet) {
    std::vector<DiscoveredHost> hosts;
    std::unordered_set<std::string> seen;
    std::string line;

    // Header: "IP address  HW type  Flags  HW address  Mask  Device"
    std::getline(input, line);
    while (std::getline(input, line)) {
        std::istringstream fields(line);
        std::string ip;
        std::string hw_type;
        std::string flags;
        std::string hw_address;
        if (!(fields >> ip >> hw_type >> flags >> hw_address)) {
            continue;
        }

        boost::system::error_code ec;
        const auto address = asio::ip::make_address_v4(ip, ec);
        if (ec || !subnet.contains(address) || is_filtered_address(address)) {
            continue;
        }

        unsigned long flag_bits = 0;
        try {
            flag_bits = std::stoul(flags, nullptr, 16);
        } catch (const std::exception&) {
            continue;
        }
        if ((flag_bits & kArpFlagComplete) == 0) {
            continue;
        }

        auto hardware_id = normalize_hardware_id(hw_address);
        if (hardware_id.size() != 17 || is_filtered_hardware_id(hardware_id)) {
            continue;
        }
        // The same neighbour can be listed once per interface.
        if (!seen.insert(hardware_id).second) {
            continue;
        }
        hosts.push_back(DiscoveredHost{.address = ip, .hardware_id = std::move(hardware_id), .name = std::nullopt});
    }
    return hosts;
}

}  // namespace lanwatch::control
