#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <boost/asio/ip/address_v4.hpp>

namespace lanwatch::control {

class Subnet {
public:
    Subnet(boost::asio::ip::address_v4 network, unsigned prefix_length);

    // "192.168.1.0/24"; host bits are masked off. Throws std::invalid_argument.
    static Subnet parse(const std::string& cidr);

    // /24 around the address the host uses for its default route; 127.0.0.0/24
    // when no route can be determined.
    static Subnet detect_local();

    boost::asio::ip::address_v4 network() const { return network_; }
    unsigned prefix_length() const { return prefix_length_; }

    bool contains(const boost::asio::ip::address_v4& address) const;
    std::vector<boost::asio::ip::address_v4> hosts() const;
    std::string to_string() const;

private:
    std::uint32_t mask() const;

    boost::asio::ip::address_v4 network_;
    unsigned prefix_length_;
};

}  // namespace lanwatch::control
