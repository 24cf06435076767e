#include "lanwatch/subnet.hpp"

#include <stdexcept>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>

#include "lanwatch/util/logging.hpp"

namespace lanwatch::control {

namespace asio = boost::asio;

Subnet::Subnet(asio::ip::address_v4 network, unsigned prefix_length)
    : network_(), prefix_length_(prefix_length) {
    if (prefix_length_ > 32) {
        throw std::invalid_argument("Prefix length must be between 0 and 32");
    }
    network_ = asio::ip::address_v4(network.to_uint() & mask());
}

Subnet Subnet::parse(const std::string& cidr) {
    const auto slash = cidr.find('/');
    if (slash == std::string::npos) {
        throw std::invalid_argument("Subnet must be in CIDR form: " + cidr);
    }

    boost::system::error_code ec;
    const auto address = asio::ip::make_address_v4(cidr.substr(0, slash), ec);
    if (ec) {
        throw std::invalid_argument("Invalid subnet address: " + cidr);
    }

    const auto prefix_text = cidr.substr(slash + 1);
    if (prefix_text.empty() || prefix_text.size() > 2 ||
        prefix_text.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument("Invalid subnet prefix: " + cidr);
    }
    return Subnet(address, static_cast<unsigned>(std::stoul(prefix_text)));
}

Subnet Subnet::detect_local() {
    try {
        asio::io_context io_context;
        asio::ip::udp::socket socket(io_context);
        // Connecting a datagram socket sends nothing; it only selects a route.
        socket.connect(asio::ip::udp::endpoint(asio::ip::make_address_v4("8.8.8.8"), 80));
        const auto local = socket.local_endpoint().address().to_v4();
        return Subnet(local, 24);
    } catch (const std::exception& ex) {
        util::log::warn(std::string("Could not detect local subnet, using loopback: ") + ex.what());
        return Subnet(asio::ip::address_v4::loopback(), 24);
    }
}

std::uint32_t Subnet::mask() const {
    if (prefix_length_ == 0) {
        return 0;
    }
    return ~std::uint32_t{0} << (32 - prefix_length_);
}

bool Subnet::contains(const asio::ip::address_v4& address) const {
    return (address.to_uint() & mask()) == network_.to_uint();
}

std::vector<asio::ip::address_v4> Subnet::hosts() const {
    std::vector<asio::ip::address_v4> result;
    const std::uint32_t base = network_.to_uint();
    const std::uint64_t size = std::uint64_t{1} << (32 - prefix_length_);
    if (size <= 2) {
        for (std::uint64_t i = 0; i < size; ++i) {
            result.emplace_back(static_cast<std::uint32_t>(base + i));
        }
        return result;
    }

    result.reserve(static_cast<std::size_t>(size - 2));
    // Skip the network and broadcast addresses.
    for (std::uint64_t i = 1; i + 1 < size; ++i) {
        result.emplace_back(static_cast<std::uint32_t>(base + i));
    }
    return result;
}

std::string Subnet::to_string() const {
    return network_.to_string() + "/" + std::to_string(prefix_length_);
}

}  // namespace lanwatch::control
