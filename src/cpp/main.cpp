// =============================================================================
// kvload -- coding-interview problem dataset -> key-value store loader
//
// Reads a CSV or JSON problem dataset, normalizes every row into a canonical
// Problem record, and writes each as "problem:<id>" (compact JSON) to a KV
// store: Cloudflare Workers KV, Redis, or a bulk-export file. A compact
// "essentials" index of all loaded problems is written last.
//
// Exit codes: 0 all keys written, 2 finished with failed keys, 1 aborted.
// =============================================================================

#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <curl/curl.h>

#include "config.hpp"
#include "utils/logger.hpp"
#include "connectors/kv_store.hpp"
#include "connectors/cloudflare_kv_store.hpp"
#include "connectors/redis_kv_store.hpp"
#include "connectors/file_kv_store.hpp"
#include "pipeline/filter_policy.hpp"
#include "pipeline/record_normalizer.hpp"
#include "pipeline/pipeline.hpp"
#include "pipeline/run_report.hpp"

static void print_usage(const char* prog) {
    std::fprintf(stderr,
        "Usage: %s --input PATH [OPTIONS]\n"
        "\n"
        "Input:\n"
        "  --input PATH          Problem dataset (CSV or JSON, detected from content)\n"
        "  --config PATH         JSON config file (default: config.json if present)\n"
        "\n"
        "Store:\n"
        "  --backend NAME        cloudflare | redis | file (default: cloudflare)\n"
        "  --account-id ID       Cloudflare account id      (env CF_ACCOUNT_ID)\n"
        "  --api-token TOKEN     Cloudflare API token       (env CF_API_TOKEN)\n"
        "  --namespace-id ID     Workers KV namespace id    (env CF_NAMESPACE_ID)\n"
        "  --api-base URL        Cloudflare API base URL\n"
        "  --redis-host HOST     Redis host (default: 127.0.0.1)\n"
        "  --redis-port N        Redis port (default: 6379)\n"
        "  --redis-password PW   Redis password\n"
        "  --key-prefix P        Prefix for every Redis key\n"
        "  --export PATH         Write a bulk-import file instead of uploading\n"
        "                        (implies --backend file)\n"
        "\n"
        "Upload:\n"
        "  --batch-size N        Records per batch (default: 50)\n"
        "  --concurrency N       Parallel writes per batch (default: 1)\n"
        "  --timeout SEC         Per-write timeout in seconds (default: 30)\n"
        "  --skip-essentials     Do not write the essentials index\n"
        "\n"
        "Filter:\n"
        "  --min-id N            Lowest id uploaded (default: 1931, 0 = no bound)\n"
        "  --include-ids LIST    Comma-separated ids always uploaded (default: 1262)\n"
        "  --no-filter           Upload every valid row\n"
        "\n"
        "Other:\n"
        "  --validate [N]        Parse the first N rows (default: 5) and exit, no writes\n"
        "  --failed-keys PATH    Write failed keys as JSON for a later retry\n"
        "  --log-file PATH       Also append log lines to PATH\n"
        "  --log-level LEVEL     DEBUG | INFO | WARN | ERROR (default: INFO)\n"
        "  --verbose             Same as --log-level DEBUG\n"
        "  --help                Show this help\n"
        "\n"
        "Exit codes: 0 success, 2 some keys failed, 1 fatal error.\n",
        prog);
}

static std::vector<int64_t> parse_id_list(const std::string& list) {
    std::vector<int64_t> ids;
    std::stringstream ss(list);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (item.empty()) continue;
        ids.push_back(std::stoll(item));
    }
    return ids;
}

static bool is_number(const char* s) {
    if (!s || !*s) return false;
    for (; *s; ++s) {
        if (!std::isdigit(static_cast<unsigned char>(*s))) return false;
    }
    return true;
}

static std::unique_ptr<kvload::KvStore> make_store(const kvload::LoaderConfig& cfg) {
    switch (cfg.backend) {
        case kvload::StoreBackend::CLOUDFLARE:
            return std::make_unique<kvload::CloudflareKvStore>(cfg.cloudflare, cfg.write_timeout_sec);
        case kvload::StoreBackend::REDIS:
            return std::make_unique<kvload::RedisKvStore>(cfg.redis, cfg.write_timeout_sec);
        case kvload::StoreBackend::FILE:
            return std::make_unique<kvload::FileKvStore>(cfg.export_path);
    }
    return nullptr;
}

// Global libcurl state for the lifetime of main()
struct CurlGlobal {
    CURLcode rc;
    CurlGlobal() : rc(curl_global_init(CURL_GLOBAL_DEFAULT)) {}
    ~CurlGlobal() { if (rc == CURLE_OK) curl_global_cleanup(); }
};

int main(int argc, char* argv[]) {
    std::string input_path;
    std::string config_path = "config.json";
    bool config_explicit = false;
    bool validate_only = false;
    size_t validate_rows = 5;

    // CLI values are collected first and applied over config file + env
    std::string backend_name;
    std::string account_id, api_token, namespace_id, api_base;
    std::string redis_host, redis_password, key_prefix;
    std::string export_path;
    std::string failed_keys_path, log_file, log_level;
    long redis_port = -1;
    long batch_size = -1, concurrency = -1, timeout_sec = -1;
    long long min_id = -1;
    std::string include_ids;
    bool skip_essentials = false;
    bool no_filter = false;
    bool verbose = false;

    try {
        for (int i = 1; i < argc; i++) {
            if (std::strcmp(argv[i], "--help") == 0) {
                print_usage(argv[0]);
                return 0;
            } else if (std::strcmp(argv[i], "--input") == 0 && i + 1 < argc) {
                input_path = argv[++i];
            } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
                config_path = argv[++i];
                config_explicit = true;
            } else if (std::strcmp(argv[i], "--backend") == 0 && i + 1 < argc) {
                backend_name = argv[++i];
            } else if (std::strcmp(argv[i], "--account-id") == 0 && i + 1 < argc) {
                account_id = argv[++i];
            } else if (std::strcmp(argv[i], "--api-token") == 0 && i + 1 < argc) {
                api_token = argv[++i];
            } else if (std::strcmp(argv[i], "--namespace-id") == 0 && i + 1 < argc) {
                namespace_id = argv[++i];
            } else if (std::strcmp(argv[i], "--api-base") == 0 && i + 1 < argc) {
                api_base = argv[++i];
            } else if (std::strcmp(argv[i], "--redis-host") == 0 && i + 1 < argc) {
                redis_host = argv[++i];
            } else if (std::strcmp(argv[i], "--redis-port") == 0 && i + 1 < argc) {
                redis_port = std::stol(argv[++i]);
            } else if (std::strcmp(argv[i], "--redis-password") == 0 && i + 1 < argc) {
                redis_password = argv[++i];
            } else if (std::strcmp(argv[i], "--key-prefix") == 0 && i + 1 < argc) {
                key_prefix = argv[++i];
            } else if (std::strcmp(argv[i], "--export") == 0 && i + 1 < argc) {
                export_path = argv[++i];
            } else if (std::strcmp(argv[i], "--batch-size") == 0 && i + 1 < argc) {
                batch_size = std::stol(argv[++i]);
            } else if (std::strcmp(argv[i], "--concurrency") == 0 && i + 1 < argc) {
                concurrency = std::stol(argv[++i]);
            } else if (std::strcmp(argv[i], "--timeout") == 0 && i + 1 < argc) {
                timeout_sec = std::stol(argv[++i]);
            } else if (std::strcmp(argv[i], "--skip-essentials") == 0) {
                skip_essentials = true;
            } else if (std::strcmp(argv[i], "--min-id") == 0 && i + 1 < argc) {
                min_id = std::stoll(argv[++i]);
            } else if (std::strcmp(argv[i], "--include-ids") == 0 && i + 1 < argc) {
                include_ids = argv[++i];
            } else if (std::strcmp(argv[i], "--no-filter") == 0) {
                no_filter = true;
            } else if (std::strcmp(argv[i], "--validate") == 0) {
                validate_only = true;
                if (i + 1 < argc && is_number(argv[i + 1])) {
                    validate_rows = std::stoul(argv[++i]);
                }
            } else if (std::strcmp(argv[i], "--failed-keys") == 0 && i + 1 < argc) {
                failed_keys_path = argv[++i];
            } else if (std::strcmp(argv[i], "--log-file") == 0 && i + 1 < argc) {
                log_file = argv[++i];
            } else if (std::strcmp(argv[i], "--log-level") == 0 && i + 1 < argc) {
                log_level = argv[++i];
            } else if (std::strcmp(argv[i], "--verbose") == 0) {
                verbose = true;
            } else {
                std::fprintf(stderr, "Unknown option: %s\n", argv[i]);
                print_usage(argv[0]);
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::fprintf(stderr, "Invalid numeric argument: %s\n", e.what());
        return 1;
    }

    if (!log_level.empty()) kvload::g_log_level = kvload::parse_log_level(log_level);
    if (verbose) kvload::g_log_level = kvload::LogLevel::DEBUG;

    if (input_path.empty()) {
        std::fprintf(stderr, "Missing required option: --input PATH\n");
        print_usage(argv[0]);
        return 1;
    }

    // Configuration: file, then environment, then command line
    kvload::LoaderConfig cfg;
    if (config_explicit || std::ifstream(config_path).good()) {
        cfg = kvload::LoaderConfig::from_json(config_path);
    }
    cfg.apply_env();

    if (!backend_name.empty() && !kvload::parse_store_backend(backend_name, cfg.backend)) {
        std::fprintf(stderr, "Unknown backend: %s\n", backend_name.c_str());
        return 1;
    }
    if (!account_id.empty()) cfg.cloudflare.account_id = account_id;
    if (!api_token.empty()) cfg.cloudflare.api_token = api_token;
    if (!namespace_id.empty()) cfg.cloudflare.namespace_id = namespace_id;
    if (!api_base.empty()) cfg.cloudflare.api_base = api_base;
    if (!redis_host.empty()) cfg.redis.host = redis_host;
    if (redis_port > 0) cfg.redis.port = static_cast<uint16_t>(redis_port);
    if (!redis_password.empty()) cfg.redis.password = redis_password;
    if (!key_prefix.empty()) cfg.redis.key_prefix = key_prefix;
    if (!export_path.empty()) {
        cfg.export_path = export_path;
        cfg.backend = kvload::StoreBackend::FILE;
    }
    if (batch_size >= 0) cfg.batch_size = static_cast<size_t>(batch_size);
    if (concurrency >= 0) cfg.concurrency = static_cast<size_t>(concurrency);
    if (timeout_sec >= 0) cfg.write_timeout_sec = timeout_sec;
    if (skip_essentials) cfg.skip_essentials = true;
    if (min_id >= 0) cfg.filter.min_id = min_id;
    if (no_filter) cfg.filter.enabled = false;
    if (!failed_keys_path.empty()) cfg.failed_keys_path = failed_keys_path;
    if (!log_file.empty()) cfg.log_file = log_file;
    if (!include_ids.empty()) {
        try {
            cfg.filter.include_ids = parse_id_list(include_ids);
        } catch (const std::exception&) {
            std::fprintf(stderr, "Invalid --include-ids list: %s\n", include_ids.c_str());
            return 1;
        }
    }

    if (!cfg.log_file.empty() && !kvload::open_log_file(cfg.log_file)) {
        LOG_WRN("Cannot open log file %s -- logging to stderr only", cfg.log_file.c_str());
    }

    LOG_INF("=== kvload ===");

    kvload::RecordNormalizer normalizer(kvload::FilterPolicy::from_config(cfg.filter),
                                        cfg.solution_languages);

    if (validate_only) {
        kvload::FileKvStore offline(cfg.export_path);
        kvload::Pipeline pipeline(offline, std::move(normalizer));
        auto vr = pipeline.validate(input_path, validate_rows);
        kvload::close_log_file();
        return vr.ok() ? 0 : 1;
    }

    std::string problem = cfg.validate();
    if (!problem.empty()) {
        LOG_ERR("Configuration error: %s", problem.c_str());
        kvload::close_log_file();
        return 1;
    }

    CurlGlobal curl_global;
    if (curl_global.rc != CURLE_OK) {
        LOG_ERR("curl_global_init failed: %s", curl_easy_strerror(curl_global.rc));
        kvload::close_log_file();
        return 1;
    }

    auto store = make_store(cfg);
    LOG_INF("Backend: %s, batch size %zu, concurrency %zu, timeout %ld s",
        kvload::store_backend_str(cfg.backend), cfg.batch_size, cfg.concurrency,
        cfg.write_timeout_sec);

    kvload::PipelineOptions opts;
    opts.batch_size = cfg.batch_size;
    opts.concurrency = cfg.concurrency;
    opts.skip_essentials = cfg.skip_essentials;

    kvload::Pipeline pipeline(*store, std::move(normalizer), opts);
    pipeline.set_progress_callback([](int64_t attempted, int64_t total) {
        LOG_INF("Progress: %lld/%lld", static_cast<long long>(attempted), static_cast<long long>(total));
    });

    kvload::RunReport report = pipeline.run(input_path);
    store->disconnect();

    report.log_summary();
    if (!cfg.failed_keys_path.empty() && report.status != kvload::RunStatus::FATAL) {
        if (!report.write_failed_keys(cfg.failed_keys_path)) {
            LOG_WRN("Failed-key report not written");
        }
    }

    kvload::close_log_file();
    return kvload::exit_code_for(report.status);
}
