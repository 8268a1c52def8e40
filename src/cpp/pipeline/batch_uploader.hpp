#pragma once
// =============================================================================
// Batch Uploader -- writes normalized problems to a KvStore
//
// Problems are cut into contiguous batches of at most batch_size, in input
// order. A batch is NOT a transaction: every record is its own write
// ("problem:<id>" -> compact JSON) and its outcome is tallied on its own. A
// failed write (false, exception, timeout) is logged with its key and counted;
// it never stops sibling writes or later batches.
//
// concurrency == 1: each batch goes through KvStore::put_bulk().
// concurrency  > 1: each batch is spread over min(concurrency, batch size)
//                   worker threads; every key is attempted exactly once.
//
// attempted() grows monotonically while an upload runs, for liveness reports.
// =============================================================================

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "../connectors/kv_store.hpp"
#include "problem_record.hpp"

namespace kvload {

struct UploadTally {
    int64_t success = 0;
    int64_t failed = 0;
    int64_t attempted = 0;
    int64_t batches = 0;
    int64_t write_time_us = 0;              // summed per-write latency
    std::vector<std::string> failed_keys;   // for operator retry

    void merge(const UploadTally& other);
};

// (attempted so far, total planned) -- called after every batch
using ProgressFn = std::function<void(int64_t attempted, int64_t total)>;

class BatchUploader {
public:
    explicit BatchUploader(KvStore& store, size_t concurrency = 1);

    void set_progress_callback(ProgressFn fn) { progress_ = std::move(fn); }

    // [begin, end) index ranges; throws std::invalid_argument if batch_size == 0
    static std::vector<std::pair<size_t, size_t>> partition(size_t count, size_t batch_size);

    UploadTally upload_all(const std::vector<Problem>& problems, size_t batch_size);

    // One extra independently tallied write (the essentials entry)
    UploadTally upload_entry(const std::string& key, const std::string& value);

    [[nodiscard]] int64_t attempted() const { return attempted_.load(); }

private:
    KvStore& store_;
    size_t concurrency_;
    ProgressFn progress_;
    std::atomic<int64_t> attempted_{0};

    bool write_one(const KvEntry& entry, int64_t& write_time_us);

    void run_sequential(const std::vector<KvEntry>& entries, UploadTally& tally);
    void run_parallel(const std::vector<KvEntry>& entries, UploadTally& tally);
};

} // namespace kvload
