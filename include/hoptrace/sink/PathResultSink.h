// SPDX-License-Identifier: BSD-2-Clause

#pragma once

#include "hoptrace/trace/PathResult.h"

#include <nlohmann/json.hpp>

#include <fstream>
#include <mutex>
#include <string>

namespace hoptrace::sink {

/**
 * @brief Consumer of sealed Path Results.
 */
class PathResultSink {
public:
    virtual ~PathResultSink() = default;

    /// @throws std::runtime_error when the result cannot be stored.
    virtual void write(const PathResult& result) = 0;
};

/**
 * @brief Structured form of a Path Result.
 *
 * Carries the measurement fields (timestamp, source_region, destination,
 * destination_ip, bgp_as_path, latency_ms, traceroute_result, success)
 * followed by terminal_reason, error and the per-probe hop list.
 * latency_ms is null when no hop produced a latency.
 */
nlohmann::json to_json(const PathResult& result, const std::string& source_region);

/**
 * @brief Appends one JSON object per line to a file.
 *
 * Thread-safe; every write is flushed so a crash loses at most the line
 * being written.
 */
class JsonLinesSink final : public PathResultSink {
public:
    /// @throws std::runtime_error if @p path cannot be opened for append.
    JsonLinesSink(const std::string& path, std::string source_region);

    void write(const PathResult& result) override;

private:
    std::string path_;
    std::string source_region_;
    std::mutex mtx_;
    std::ofstream out_;
};

} // namespace hoptrace::sink
