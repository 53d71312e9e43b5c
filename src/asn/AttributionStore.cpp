// SPDX-License-Identifier: BSD-2-Clause

#include "hoptrace/asn/AttributionStore.h"

#include "hoptrace/log/Log.h"

#include <nlohmann/json.hpp>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <stdexcept>
#include <utility>

namespace hoptrace::asn {

namespace {

nlohmann::json entry_to_json(const AttributionEntry& e) {
    nlohmann::json j;
    j["address"] = e.address;
    j["label"] = e.label;
    j["resolved"] = e.resolved;
    j["looked_up_at"] = std::chrono::duration_cast<std::chrono::seconds>(
        e.looked_up_at.time_since_epoch()).count();
    return j;
}

AttributionEntry entry_from_json(const nlohmann::json& j) {
    AttributionEntry e;
    e.address = j.at("address").get<std::string>();
    e.label = j.at("label").get<std::string>();
    e.resolved = j.value("resolved", true);
    e.looked_up_at = std::chrono::system_clock::time_point(
        std::chrono::seconds(j.value("looked_up_at", static_cast<int64_t>(0))));
    return e;
}

// Exclusive flock on "<path>.lock", held for the object's lifetime. The
// data file itself is replaced by compact(), so it cannot carry the lock.
class FileLock {
public:
    explicit FileLock(const std::string& data_path) {
        const std::string lock_path = data_path + ".lock";
        fd_ = ::open(lock_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
        if (fd_ < 0) {
            throw std::runtime_error("cannot open " + lock_path + ": " + std::strerror(errno));
        }
        while (::flock(fd_, LOCK_EX) != 0) {
            if (errno == EINTR) continue;
            const int err = errno;
            ::close(fd_);
            throw std::runtime_error("cannot lock " + lock_path + ": " + std::strerror(err));
        }
    }
    ~FileLock() {
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
    }

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

private:
    int fd_ = -1;
};

} // namespace

std::vector<AttributionEntry> MemoryAttributionStore::load() {
    std::lock_guard<std::mutex> lk(mtx_);
    std::vector<AttributionEntry> out;
    out.reserve(entries_.size());
    for (const auto& kv : entries_) out.push_back(kv.second);
    return out;
}

void MemoryAttributionStore::put(const AttributionEntry& entry) {
    std::lock_guard<std::mutex> lk(mtx_);
    entries_[entry.address] = entry;
}

std::size_t MemoryAttributionStore::size() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return entries_.size();
}

JsonlAttributionStore::JsonlAttributionStore(std::string path) : path_(std::move(path)) {}

std::vector<AttributionEntry> JsonlAttributionStore::load() {
    std::lock_guard<std::mutex> lk(mtx_);
    return load_locked();
}

std::vector<AttributionEntry> JsonlAttributionStore::load_locked() {
    std::ifstream in(path_);
    if (!in) {
        return {};
    }

    std::unordered_map<std::string, std::size_t> index;
    std::vector<AttributionEntry> out;
    std::string line;
    std::size_t lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        if (line.empty()) continue;
        try {
            AttributionEntry e = entry_from_json(nlohmann::json::parse(line));
            auto it = index.find(e.address);
            if (it == index.end()) {
                index.emplace(e.address, out.size());
                out.push_back(std::move(e));
            } else {
                out[it->second] = std::move(e);
            }
        } catch (const nlohmann::json::exception& ex) {
            HTLOG_WARN("%s:%zu: skipping malformed cache line (%s)", path_.c_str(), lineno, ex.what());
        }
    }
    return out;
}

void JsonlAttributionStore::put(const AttributionEntry& entry) {
    std::lock_guard<std::mutex> lk(mtx_);
    FileLock file_lock(path_);
    std::ofstream out(path_, std::ios::app);
    if (!out) {
        throw std::runtime_error("cannot open attribution cache " + path_);
    }
    out << entry_to_json(entry).dump() << '\n';
    out.flush();
    if (!out) {
        throw std::runtime_error("write to attribution cache " + path_ + " failed");
    }
}

void JsonlAttributionStore::compact() {
    std::lock_guard<std::mutex> lk(mtx_);
    FileLock file_lock(path_);
    const auto entries = load_locked();
    const std::string tmp = path_ + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            throw std::runtime_error("cannot create " + tmp);
        }
        for (const auto& e : entries) {
            out << entry_to_json(e).dump() << '\n';
        }
        out.flush();
        if (!out) {
            throw std::runtime_error("write to " + tmp + " failed");
        }
    }
    if (std::rename(tmp.c_str(), path_.c_str()) != 0) {
        std::remove(tmp.c_str());
        throw std::runtime_error("cannot replace " + path_);
    }
    HTLOG_DEBUG("compacted %s to %zu entries", path_.c_str(), entries.size());
}

} // namespace hoptrace::asn
