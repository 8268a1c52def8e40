#pragma once
// Outcome of one pipeline run, as reported to the operator
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "batch_uploader.hpp"
#include "input_reader.hpp"

namespace kvload {

enum class RunStatus {
    SUCCESS,    // every key written
    DEGRADED,   // finished, some keys failed -- retry them out-of-band
    FATAL       // aborted (bad input, store unreachable, nothing to upload)
};

inline const char* run_status_str(RunStatus s) {
    switch (s) {
        case RunStatus::SUCCESS:  return "success";
        case RunStatus::DEGRADED: return "degraded";
        case RunStatus::FATAL:    return "fatal";
    }
    return "??";
}

// Process exit code: 0 success, 2 degraded, 1 fatal
inline int exit_code_for(RunStatus s) {
    switch (s) {
        case RunStatus::SUCCESS:  return 0;
        case RunStatus::DEGRADED: return 2;
        case RunStatus::FATAL:    return 1;
    }
    return 1;
}

struct RunReport {
    RunStatus status = RunStatus::FATAL;
    std::string error;                  // fatal diagnostic
    InputFormat format = InputFormat::TABULAR;
    int64_t rows_seen = 0;              // candidate rows read from the input
    int64_t parsed = 0;                 // valid, eligible problems
    UploadTally problems;               // "problem:<id>" writes
    UploadTally essentials;             // the "essentials" write (if not skipped)
    bool essentials_skipped = false;
    double elapsed_sec = 0.0;
    std::string timestamp;

    [[nodiscard]] int64_t success() const { return problems.success + essentials.success; }
    [[nodiscard]] int64_t failed() const { return problems.failed + essentials.failed; }
    [[nodiscard]] int64_t write_time_us() const { return problems.write_time_us + essentials.write_time_us; }
    [[nodiscard]] double success_rate() const;
    // Mean time per attempted write, 0 when nothing was written
    [[nodiscard]] double avg_write_ms() const;
    [[nodiscard]] std::vector<std::string> failed_keys() const;

    nlohmann::json to_json() const;

    void log_summary() const;

    // {"failed_keys": [...], "count": N, ...} for a later targeted retry
    bool write_failed_keys(const std::string& path) const;
};

} // namespace kvload
