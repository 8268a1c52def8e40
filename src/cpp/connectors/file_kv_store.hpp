#pragma once
// Bulk-export "store": collects key/value pairs in memory and writes them as
//   [{"key": "...", "value": "..."}, ...]
// which is the input format of `wrangler kv bulk put`. Used for offline
// uploads and as a dry run that never touches the network.
#include <map>
#include <mutex>
#include <optional>
#include <utility>
#include "kv_store.hpp"

namespace kvload {

class FileKvStore : public KvStore {
public:
    explicit FileKvStore(std::string path) : path_(std::move(path)) {}

    // Checks that the output file can be created
    bool connect() override;
    void disconnect() override;
    [[nodiscard]] bool is_connected() const override;

    bool put(const std::string& key, const std::string& value) override;

    // Writes all collected entries, in first-write order
    bool flush() override;

    [[nodiscard]] const char* store_name() const override { return "file"; }

    [[nodiscard]] size_t size() const;
    [[nodiscard]] std::optional<std::string> get(const std::string& key) const;

private:
    std::string path_;
    bool connected_ = false;
    mutable std::mutex mu_;
    std::vector<KvEntry> entries_;
    std::map<std::string, size_t> index_;   // key -> position in entries_
};

} // namespace kvload
