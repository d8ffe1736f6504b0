#pragma once

#include "types.hpp"
#include <stdexcept>
#include <string>
#include <vector>

class BootstrapError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Full pool listing for a chain, used once per chain to bootstrap the registry.
// Implementations throw BootstrapError when the source is unreachable or its
// data cannot be decoded.
class PoolSource {
public:
    virtual ~PoolSource() = default;

    virtual std::vector<Pool> fetch_pools(const std::string& chain) = 0;
};
