#include "run_report.hpp"
#include "../utils/logger.hpp"
#include <fstream>

namespace kvload {

double RunReport::success_rate() const {
    int64_t total = success() + failed();
    if (total == 0) return 0.0;
    return 100.0 * static_cast<double>(success()) / static_cast<double>(total);
}

double RunReport::avg_write_ms() const {
    int64_t total = success() + failed();
    if (total == 0) return 0.0;
    return static_cast<double>(write_time_us()) / 1000.0 / static_cast<double>(total);
}

std::vector<std::string> RunReport::failed_keys() const {
    std::vector<std::string> keys = problems.failed_keys;
    keys.insert(keys.end(), essentials.failed_keys.begin(), essentials.failed_keys.end());
    return keys;
}

nlohmann::json RunReport::to_json() const {
    auto keys = failed_keys();
    nlohmann::json j = {
        {"status", run_status_str(status)},
        {"timestamp", timestamp},
        {"input_format", input_format_str(format)},
        {"rows_seen", rows_seen},
        {"parsed", parsed},
        {"skipped_rows", rows_seen - parsed},
        {"success", success()},
        {"failed", failed()},
        {"success_rate", success_rate()},
        {"essentials_skipped", essentials_skipped},
        {"elapsed_sec", elapsed_sec},
        {"write_time_ms", static_cast<double>(write_time_us()) / 1000.0},
        {"avg_write_ms", avg_write_ms()},
        {"failed_keys", keys},
        {"count", keys.size()}
    };
    if (!error.empty()) j["error"] = error;
    return j;
}

void RunReport::log_summary() const {
    LOG_INF("==================================================");
    LOG_INF("UPLOAD SUMMARY");
    LOG_INF("==================================================");
    LOG_INF("Rows seen:              %lld", static_cast<long long>(rows_seen));
    LOG_INF("Valid problems:         %lld (%lld rows skipped)",
        static_cast<long long>(parsed), static_cast<long long>(rows_seen - parsed));
    LOG_INF("Keys attempted:         %lld", static_cast<long long>(success() + failed()));
    LOG_INF("Successful uploads:     %lld", static_cast<long long>(success()));
    LOG_INF("Failed uploads:         %lld", static_cast<long long>(failed()));
    if (success() + failed() > 0) {
        LOG_INF("Success rate:           %.1f%%", success_rate());
        LOG_INF("Avg write latency:      %.2f ms", avg_write_ms());
    }
    if (essentials_skipped) {
        LOG_INF("Essentials entry:       skipped");
    }
    LOG_INF("Elapsed:                %.1f s", elapsed_sec);
    LOG_INF("==================================================");

    switch (status) {
        case RunStatus::SUCCESS:
            LOG_INF("All uploads completed successfully");
            break;
        case RunStatus::DEGRADED:
            LOG_WRN("%lld uploads failed. Keys to retry:", static_cast<long long>(failed()));
            for (const auto& k : failed_keys()) {
                LOG_WRN("  %s", k.c_str());
            }
            break;
        case RunStatus::FATAL:
            LOG_ERR("Run aborted: %s", error.c_str());
            break;
    }
}

bool RunReport::write_failed_keys(const std::string& path) const {
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        LOG_ERR("Cannot open %s for writing", path.c_str());
        return false;
    }
    out << to_json().dump(2);
    out.close();
    if (!out) {
        LOG_ERR("Write to %s failed", path.c_str());
        return false;
    }
    LOG_INF("Failed-key report saved to %s", path.c_str());
    return true;
}

} // namespace kvload
