// SPDX-License-Identifier: BSD-2-Clause

#include "hoptrace/trace/HostResolver.h"

#include "hoptrace/net/Ipv4.h"

#include <arpa/inet.h>
#include <netdb.h>
#include <sys/socket.h>
#include <sys/types.h>

namespace hoptrace {

std::string SystemHostResolver::resolve(const std::string& host) {
    if (host.empty()) {
        throw ResolutionFailure("empty destination");
    }
    if (net::parse_ipv4_host(host)) {
        return host;
    }

    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_DGRAM;
    addrinfo* res = nullptr;

    const int status = ::getaddrinfo(host.c_str(), nullptr, &hints, &res);
    if (status != 0) {
        throw ResolutionFailure("could not resolve " + host + ": " + gai_strerror(status));
    }

    std::string address;
    for (auto* p = res; p != nullptr; p = p->ai_next) {
        if (p->ai_family != AF_INET) continue;
        const auto* sin = reinterpret_cast<const sockaddr_in*>(p->ai_addr);
        address = net::network_to_string(sin->sin_addr.s_addr);
        break;
    }
    ::freeaddrinfo(res);

    if (address.empty()) {
        throw ResolutionFailure(host + " has no IPv4 address");
    }
    return address;
}

} // namespace hoptrace
