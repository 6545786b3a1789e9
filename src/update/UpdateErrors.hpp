#pragma once

#include <stdexcept>
#include <string>

namespace configdesk {

// Querying the update endpoints failed (network, HTTP status, bad manifest)
class UpdateCheckError : public std::runtime_error {
public:
    explicit UpdateCheckError(const std::string& what) : std::runtime_error(what) {}
};

// Downloading, verifying or swapping in the new binary failed
class InstallError : public std::runtime_error {
public:
    explicit InstallError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace configdesk
