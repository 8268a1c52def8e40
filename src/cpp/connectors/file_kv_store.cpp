#include "file_kv_store.hpp"
#include "../utils/logger.hpp"
#include <fstream>
#include <nlohmann/json.hpp>

namespace kvload {

bool FileKvStore::connect() {
    std::ofstream probe(path_, std::ios::app);
    if (!probe.is_open()) {
        LOG_ERR("[file] Cannot open %s for writing", path_.c_str());
        return false;
    }
    std::lock_guard<std::mutex> lock(mu_);
    connected_ = true;
    LOG_INF("[file] Exporting key/value pairs to %s", path_.c_str());
    return true;
}

void FileKvStore::disconnect() {
    std::lock_guard<std::mutex> lock(mu_);
    connected_ = false;
}

bool FileKvStore::is_connected() const {
    std::lock_guard<std::mutex> lock(mu_);
    return connected_;
}

bool FileKvStore::put(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = index_.find(key);
    if (it != index_.end()) {
        // Same key again: last write wins, position unchanged
        entries_[it->second].value = value;
        return true;
    }
    index_.emplace(key, entries_.size());
    entries_.push_back({key, value});
    return true;
}

bool FileKvStore::flush() {
    std::lock_guard<std::mutex> lock(mu_);
    nlohmann::json out = nlohmann::json::array();
    for (const auto& e : entries_) {
        out.push_back({{"key", e.key}, {"value", e.value}});
    }

    std::ofstream f(path_, std::ios::trunc);
    if (!f.is_open()) {
        LOG_ERR("[file] Cannot open %s for writing", path_.c_str());
        return false;
    }
    f << out.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    f.close();
    if (!f) {
        LOG_ERR("[file] Write to %s failed", path_.c_str());
        return false;
    }
    LOG_INF("[file] Wrote %zu keys to %s", entries_.size(), path_.c_str());
    return true;
}

size_t FileKvStore::size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return entries_.size();
}

std::optional<std::string> FileKvStore::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = index_.find(key);
    if (it == index_.end()) return std::nullopt;
    return entries_[it->second].value;
}

} // namespace kvload
