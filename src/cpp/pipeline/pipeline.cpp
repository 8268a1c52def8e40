#include "pipeline.hpp"
#include "essentials_builder.hpp"
#include "../utils/logger.hpp"
#include "../utils/timer.hpp"
#include <algorithm>
#include <stdexcept>

namespace kvload {

Pipeline::Pipeline(KvStore& store, RecordNormalizer normalizer, PipelineOptions opts)
    : store_(store), normalizer_(std::move(normalizer)), opts_(opts) {}

std::optional<Problem> Pipeline::normalize_row(const LoadedInput& input, size_t i) const {
    if (input.format == InputFormat::TABULAR) {
        return normalizer_.normalize_tabular(input.rows[i]);
    }
    return normalizer_.normalize_structured(input.objects[i]);
}

std::vector<Problem> Pipeline::normalize_all(const LoadedInput& input) const {
    std::vector<Problem> problems;
    problems.reserve(input.size());
    for (size_t i = 0; i < input.size(); ++i) {
        auto p = normalize_row(input, i);
        if (p) problems.push_back(std::move(*p));
    }
    return problems;
}

RunReport Pipeline::run(const std::string& path) {
    LOG_INF("Loading problems from %s", path.c_str());
    LoadedInput input = InputReader::load(path);
    return run_input(input);
}

RunReport Pipeline::run_input(const LoadedInput& input) {
    Timer timer;
    timer.start();

    RunReport report;
    report.timestamp = utc_timestamp();
    report.format = input.format;
    report.essentials_skipped = opts_.skip_essentials;

    auto finish = [&](RunStatus status) {
        timer.stop();
        report.elapsed_sec = timer.elapsed_sec();
        report.status = status;
        return report;
    };

    if (!input.error.empty()) {
        report.error = input.error;
        return finish(RunStatus::FATAL);
    }

    report.rows_seen = static_cast<int64_t>(input.size());
    std::vector<Problem> problems = normalize_all(input);
    report.parsed = static_cast<int64_t>(problems.size());
    LOG_INF("Parsed %lld valid problems from %lld rows (%s, filter: %s)",
        static_cast<long long>(report.parsed), static_cast<long long>(report.rows_seen),
        input_format_str(input.format), normalizer_.filter().describe().c_str());

    if (problems.empty()) {
        report.error = "No valid problems found in input";
        return finish(RunStatus::FATAL);
    }

    if (!store_.is_connected()) {
        LOG_INF("Connecting to %s store...", store_.store_name());
        if (!store_.connect()) {
            report.error = std::string("Cannot connect to ") + store_.store_name() + " store";
            return finish(RunStatus::FATAL);
        }
    }

    BatchUploader uploader(store_, opts_.concurrency);
    if (progress_) uploader.set_progress_callback(progress_);

    try {
        report.problems = uploader.upload_all(problems, opts_.batch_size);
    } catch (const std::invalid_argument& e) {
        report.error = e.what();
        return finish(RunStatus::FATAL);
    }

    if (!opts_.skip_essentials) {
        EssentialsIndex index = build_essentials(problems);
        index.last_updated = unix_seconds_str();
        LOG_INF("Uploading essentials index (%lld problems)", static_cast<long long>(index.count));
        report.essentials = uploader.upload_entry(ESSENTIALS_KEY, to_compact_json(index.to_json()));
        if (report.essentials.success) {
            LOG_INF("Essentials index uploaded");
        }
    } else {
        LOG_INF("Skipping essentials index");
    }

    if (!store_.flush()) {
        report.error = std::string("Failed to persist writes to ") + store_.store_name() + " store";
        return finish(RunStatus::FATAL);
    }

    return finish(report.failed() > 0 ? RunStatus::DEGRADED : RunStatus::SUCCESS);
}

ValidationReport Pipeline::validate(const std::string& path, size_t sample_size) {
    ValidationReport vr;
    LoadedInput input = InputReader::load(path);
    if (!input.error.empty()) {
        vr.error = input.error;
        LOG_ERR("%s", vr.error.c_str());
        return vr;
    }
    LOG_INF("Loaded %zu rows (%s)", input.size(), input_format_str(input.format));

    std::vector<Problem> sample;
    size_t n = std::min(sample_size, input.size());
    for (size_t i = 0; i < n; ++i) {
        vr.rows_checked++;
        auto p = normalize_row(input, i);
        if (!p) {
            vr.skipped++;
            LOG_INF("Row %zu: skipped (malformed or filtered out)", i + 1);
            continue;
        }
        vr.parsed++;
        std::string value = to_compact_json(p->to_json());
        LOG_INF("Row %zu: %s \"%s\" [%s] topics=%zu solutions=%zu, %zu bytes",
            i + 1, p->storage_key().c_str(), p->title.c_str(), p->difficulty.c_str(),
            p->metadata.topics.size(), p->solution_code.size(), value.size());
        sample.push_back(std::move(*p));
    }

    EssentialsIndex index = build_essentials(sample);
    vr.essentials_count = index.count;
    LOG_INF("Essentials would hold %lld entries", static_cast<long long>(index.count));
    for (size_t i = 0; i < index.problems.size() && i < 3; ++i) {
        const auto& e = index.problems[i];
        LOG_INF("  %lld: %s (%s)", static_cast<long long>(e.id), e.title.c_str(), e.difficulty.c_str());
    }

    LOG_INF("Validation: %lld parsed, %lld skipped of %lld checked",
        static_cast<long long>(vr.parsed), static_cast<long long>(vr.skipped),
        static_cast<long long>(vr.rows_checked));
    if (vr.parsed == 0) {
        vr.error = "No valid problems in sample";
    }
    return vr;
}

} // namespace kvload
