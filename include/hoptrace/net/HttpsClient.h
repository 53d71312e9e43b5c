// SPDX-License-Identifier: BSD-2-Clause

#pragma once

#include <chrono>
#include <stdexcept>
#include <string>

namespace hoptrace::net {

struct HttpResponse {
    long status = 0;
    std::string body;
};

class HttpError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Process-wide libcurl setup. Construct one in main() before any
 * thread issues a request.
 */
class CurlGlobal {
public:
    CurlGlobal();
    ~CurlGlobal();

    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

/**
 * @brief Blocking HTTP(S) GET over libcurl.
 *
 * Each call uses its own easy handle, so one client may be shared between
 * threads. Certificate verification is left at libcurl's defaults. The
 * whole transfer is bounded by the timeout given at construction.
 */
class HttpsClient {
public:
    explicit HttpsClient(std::chrono::milliseconds timeout);

    /// @throws HttpError on DNS, connect, TLS or transfer failure.
    HttpResponse get(const std::string& url) const;

private:
    std::chrono::milliseconds timeout_;
};

} // namespace hoptrace::net
