#include "batch_uploader.hpp"
#include "../utils/logger.hpp"
#include "../utils/timer.hpp"
#include <algorithm>
#include <exception>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace kvload {

void UploadTally::merge(const UploadTally& other) {
    success += other.success;
    failed += other.failed;
    attempted += other.attempted;
    batches += other.batches;
    write_time_us += other.write_time_us;
    failed_keys.insert(failed_keys.end(), other.failed_keys.begin(), other.failed_keys.end());
}

BatchUploader::BatchUploader(KvStore& store, size_t concurrency)
    : store_(store), concurrency_(std::max<size_t>(concurrency, 1)) {}

std::vector<std::pair<size_t, size_t>> BatchUploader::partition(size_t count, size_t batch_size) {
    if (batch_size == 0) {
        throw std::invalid_argument("batch_size must be at least 1");
    }
    std::vector<std::pair<size_t, size_t>> ranges;
    ranges.reserve((count + batch_size - 1) / batch_size);
    for (size_t begin = 0; begin < count; begin += batch_size) {
        ranges.emplace_back(begin, std::min(begin + batch_size, count));
    }
    return ranges;
}

bool BatchUploader::write_one(const KvEntry& entry, int64_t& write_time_us) {
    attempted_.fetch_add(1);
    try {
        ScopedTimer st(write_time_us);
        bool ok = store_.put(entry.key, entry.value);
        if (!ok) LOG_ERR("Failed to upload key %s", entry.key.c_str());
        return ok;
    } catch (const std::exception& e) {
        LOG_ERR("Exception uploading key %s: %s", entry.key.c_str(), e.what());
    } catch (...) {
        LOG_ERR("Exception uploading key %s: unknown error", entry.key.c_str());
    }
    return false;
}

void BatchUploader::run_sequential(const std::vector<KvEntry>& entries, UploadTally& tally) {
    std::vector<bool> results;
    bool threw = true;
    try {
        ScopedTimer st(tally.write_time_us);
        results = store_.put_bulk(entries);
        threw = false;
    } catch (const std::exception& e) {
        LOG_ERR("Bulk write of %zu keys threw: %s", entries.size(), e.what());
    } catch (...) {
        LOG_ERR("Bulk write of %zu keys threw: unknown error", entries.size());
    }
    // Outcome of every entry is unknown after a throw -- all of them need a retry
    if (threw) results.clear();
    attempted_.fetch_add(static_cast<int64_t>(entries.size()));

    for (size_t i = 0; i < entries.size(); ++i) {
        bool ok = i < results.size() && results[i];
        if (ok) {
            tally.success++;
        } else {
            if (threw) {
                LOG_ERR("Failed to upload key %s: bulk write aborted", entries[i].key.c_str());
            } else {
                LOG_ERR("Failed to upload key %s", entries[i].key.c_str());
            }
            tally.failed++;
            tally.failed_keys.push_back(entries[i].key);
        }
    }
}

void BatchUploader::run_parallel(const std::vector<KvEntry>& entries, UploadTally& tally) {
    std::atomic<size_t> next{0};
    std::atomic<int64_t> success{0};
    std::atomic<int64_t> failed{0};
    std::atomic<int64_t> write_time_us{0};
    std::mutex failed_mutex;
    std::vector<size_t> failed_idx;

    auto worker = [&]() {
        int64_t local_us = 0;
        for (size_t i = next.fetch_add(1); i < entries.size(); i = next.fetch_add(1)) {
            if (write_one(entries[i], local_us)) {
                success.fetch_add(1);
            } else {
                failed.fetch_add(1);
                std::lock_guard<std::mutex> lock(failed_mutex);
                failed_idx.push_back(i);
            }
        }
        write_time_us.fetch_add(local_us);
    };

    size_t n_threads = std::min(concurrency_, entries.size());
    std::vector<std::thread> workers;
    workers.reserve(n_threads);
    for (size_t t = 0; t < n_threads; ++t) {
        workers.emplace_back(worker);
    }
    for (auto& w : workers) w.join();

    tally.success += success.load();
    tally.failed += failed.load();
    tally.write_time_us += write_time_us.load();
    // Workers finish out of order; keep the report in input order
    std::sort(failed_idx.begin(), failed_idx.end());
    for (size_t i : failed_idx) {
        tally.failed_keys.push_back(entries[i].key);
    }
}

UploadTally BatchUploader::upload_all(const std::vector<Problem>& problems, size_t batch_size) {
    auto ranges = partition(problems.size(), batch_size);
    const auto total = static_cast<int64_t>(problems.size());

    UploadTally tally;
    LOG_INF("Uploading %zu problems in %zu batches of up to %zu (%s, %zu worker%s)",
        problems.size(), ranges.size(), batch_size, store_.store_name(),
        concurrency_, concurrency_ == 1 ? "" : "s");

    for (size_t b = 0; b < ranges.size(); ++b) {
        const auto [begin, end] = ranges[b];

        std::vector<KvEntry> entries;
        entries.reserve(end - begin);
        for (size_t i = begin; i < end; ++i) {
            entries.push_back({problems[i].storage_key(), to_compact_json(problems[i].to_json())});
        }

        UploadTally batch;
        if (concurrency_ > 1 && entries.size() > 1) {
            run_parallel(entries, batch);
        } else {
            run_sequential(entries, batch);
        }
        batch.attempted = static_cast<int64_t>(entries.size());
        batch.batches = 1;
        tally.merge(batch);

        LOG_DBG("Batch %zu/%zu: %lld ok, %lld failed", b + 1, ranges.size(),
            static_cast<long long>(batch.success), static_cast<long long>(batch.failed));
        if (progress_) progress_(tally.attempted, total);
    }

    LOG_INF("Problem upload finished: %lld ok, %lld failed",
        static_cast<long long>(tally.success), static_cast<long long>(tally.failed));
    return tally;
}

UploadTally BatchUploader::upload_entry(const std::string& key, const std::string& value) {
    UploadTally tally;
    tally.attempted = 1;
    if (write_one({key, value}, tally.write_time_us)) {
        tally.success = 1;
    } else {
        tally.failed = 1;
        tally.failed_keys.push_back(key);
    }
    return tally;
}

} // namespace kvload
