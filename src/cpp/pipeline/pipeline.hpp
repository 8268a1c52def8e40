#pragma once
// Orchestrates one load run:
//   read + sniff input -> normalize every row -> upload "problem:<id>" batches
//   -> build + stamp + upload "essentials" -> flush the store -> report
// Aborts (RunStatus::FATAL) before any write when the input is unusable, no
// row survives normalization, or the store rejects the connection.
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "../connectors/kv_store.hpp"
#include "batch_uploader.hpp"
#include "input_reader.hpp"
#include "record_normalizer.hpp"
#include "run_report.hpp"

namespace kvload {

struct PipelineOptions {
    size_t batch_size = 50;
    size_t concurrency = 1;
    bool skip_essentials = false;
};

// Outcome of a parse-only dry check
struct ValidationReport {
    int64_t rows_checked = 0;
    int64_t parsed = 0;
    int64_t skipped = 0;
    int64_t essentials_count = 0;
    std::string error;

    [[nodiscard]] bool ok() const { return error.empty() && parsed > 0; }
};

class Pipeline {
public:
    Pipeline(KvStore& store, RecordNormalizer normalizer, PipelineOptions opts = {});

    void set_progress_callback(ProgressFn fn) { progress_ = std::move(fn); }

    RunReport run(const std::string& path);

    // Same as run(), for input already loaded (used by tests)
    RunReport run_input(const LoadedInput& input);

    // Parse the first sample_size rows without touching the store
    ValidationReport validate(const std::string& path, size_t sample_size);

    // Normalize every row of the input; rejected rows are simply absent
    std::vector<Problem> normalize_all(const LoadedInput& input) const;

private:
    KvStore& store_;
    RecordNormalizer normalizer_;
    PipelineOptions opts_;
    ProgressFn progress_;

    std::optional<Problem> normalize_row(const LoadedInput& input, size_t i) const;
};

} // namespace kvload
