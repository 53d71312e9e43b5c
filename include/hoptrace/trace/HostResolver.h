// SPDX-License-Identifier: BSD-2-Clause

#pragma once

#include <stdexcept>
#include <string>

namespace hoptrace {

/**
 * @brief Raised when a destination cannot be turned into an IPv4 address.
 */
class ResolutionFailure : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Forward lookup collaborator used once per trace.
 */
class HostResolver {
public:
    virtual ~HostResolver() = default;

    /**
     * @return Dotted-quad IPv4 address for @p host (literals pass through).
     * @throws ResolutionFailure when nothing usable is found.
     */
    virtual std::string resolve(const std::string& host) = 0;
};

/**
 * @brief getaddrinfo(3)-backed resolver returning the first IPv4 result.
 */
class SystemHostResolver final : public HostResolver {
public:
    std::string resolve(const std::string& host) override;
};

} // namespace hoptrace
