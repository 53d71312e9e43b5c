// SPDX-License-Identifier: BSD-2-Clause

#include "hoptrace/net/HttpsClient.h"

#include "hoptrace/log/Log.h"

#include <curl/curl.h>

#include <memory>

namespace hoptrace::net {

namespace {

size_t append_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

struct EasyDeleter {
    void operator()(CURL* c) const { curl_easy_cleanup(c); }
};

} // namespace

CurlGlobal::CurlGlobal() {
    const CURLcode rc = curl_global_init(CURL_GLOBAL_ALL);
    if (rc != CURLE_OK) {
        throw HttpError(std::string("curl_global_init: ") + curl_easy_strerror(rc));
    }
}

CurlGlobal::~CurlGlobal() {
    curl_global_cleanup();
}

HttpsClient::HttpsClient(std::chrono::milliseconds timeout) : timeout_(timeout) {}

HttpResponse HttpsClient::get(const std::string& url) const {
    std::unique_ptr<CURL, EasyDeleter> curl(curl_easy_init());
    if (!curl) {
        throw HttpError("curl_easy_init failed");
    }

    HttpResponse resp;
    char errbuf[CURL_ERROR_SIZE] = {0};
    const long timeout_ms = static_cast<long>(timeout_.count());

    curl_easy_setopt(curl.get(), CURLOPT_URL,               url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPGET,           1L);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION,     append_cb);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA,         &resp.body);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS,        timeout_ms);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, timeout_ms);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER,       errbuf);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT,         "hoptrace/0.1");
    curl_easy_setopt(curl.get(), CURLOPT_ACCEPT_ENCODING,   "");
    // Worker threads must not be interrupted by libcurl's alarm-based DNS timeout.
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL,          1L);

    const CURLcode rc = curl_easy_perform(curl.get());
    if (rc != CURLE_OK) {
        throw HttpError(errbuf[0] != '\0' ? std::string(errbuf) : std::string(curl_easy_strerror(rc)));
    }
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &resp.status);

    HTLOG_TRACE("GET %s -> HTTP %ld (%zu bytes)", url.c_str(), resp.status, resp.body.size());
    return resp;
}

} // namespace hoptrace::net
