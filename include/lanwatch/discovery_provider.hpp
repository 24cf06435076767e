#pragma once

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "lanwatch/subnet.hpp"

namespace lanwatch::control {

class DiscoveryError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class DiscoveryTimeout : public DiscoveryError {
public:
    using DiscoveryError::DiscoveryError;
};

struct DiscoveredHost {
    std::string address;
    std::string hardware_id;
    std::optional<std::string> name;
};

struct DiscoveryResult {
    std::vector<DiscoveredHost> hosts;
    std::string method;
};

// Finds the hosts currently answering on a subnet. Implementations must return
// or throw DiscoveryTimeout within `timeout`; they must not touch engine state.
class DiscoveryProvider {
public:
    virtual ~DiscoveryProvider() = default;

    virtual DiscoveryResult discover(const Subnet& subnet, std::chrono::milliseconds timeout, int retries) = 0;
};

}  // namespace lanwatch::control
