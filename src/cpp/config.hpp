#pragma once
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "utils/logger.hpp"

namespace kvload {

// Key-value store backend the pipeline writes to
enum class StoreBackend { CLOUDFLARE, REDIS, FILE };

inline const char* store_backend_str(StoreBackend b) {
    switch (b) {
        case StoreBackend::CLOUDFLARE: return "cloudflare";
        case StoreBackend::REDIS:      return "redis";
        case StoreBackend::FILE:       return "file";
    }
    return "??";
}

inline bool parse_store_backend(const std::string& s, StoreBackend& out) {
    if (s == "cloudflare") { out = StoreBackend::CLOUDFLARE; return true; }
    if (s == "redis")      { out = StoreBackend::REDIS;      return true; }
    if (s == "file")       { out = StoreBackend::FILE;       return true; }
    return false;
}

// Cloudflare Workers KV namespace
struct CloudflareConfig {
    std::string account_id;
    std::string api_token;
    std::string namespace_id;
    std::string api_base = "https://api.cloudflare.com/client/v4";
};

// Redis target -- keys are written as key_prefix + key
struct RedisConfig {
    std::string host = "127.0.0.1";
    uint16_t port = 6379;
    std::string user;
    std::string password;
    std::string key_prefix;
};

// Which problem ids are uploaded. Default: id 1262 plus everything from 1931 on.
struct FilterConfig {
    bool enabled = true;
    std::vector<int64_t> include_ids = {1262};
    int64_t min_id = 1931;    // <= 0 disables the lower bound
};

struct LoaderConfig {
    StoreBackend backend = StoreBackend::CLOUDFLARE;
    CloudflareConfig cloudflare;
    RedisConfig redis;
    std::string export_path = "kv_bulk_data.json";   // FILE backend output

    // Upload behavior
    size_t batch_size = 50;
    size_t concurrency = 1;
    long write_timeout_sec = 30;
    bool skip_essentials = false;

    FilterConfig filter;
    std::vector<std::string> solution_languages = {"python", "java", "cpp"};

    // Operator outputs
    std::string log_file;
    std::string failed_keys_path;

    static LoaderConfig from_json(const std::string& path);

    // Fill empty Cloudflare credentials from CF_ACCOUNT_ID / CF_API_TOKEN / CF_NAMESPACE_ID
    void apply_env();

    // Returns an empty string when the config is usable, else the reason
    [[nodiscard]] std::string validate() const;
};

inline LoaderConfig LoaderConfig::from_json(const std::string& path) {
    LoaderConfig cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        LOG_WRN("Config file %s not found -- using defaults", path.c_str());
        return cfg;
    }

    nlohmann::json j;
    try {
        f >> j;
    } catch (const nlohmann::json::exception& e) {
        LOG_ERR("Config file %s is not valid JSON: %s -- using defaults", path.c_str(), e.what());
        return cfg;
    }

    // A wrongly typed field makes the whole file unusable
    try {
        if (j.contains("backend")) {
            std::string b = j["backend"].get<std::string>();
            if (!parse_store_backend(b, cfg.backend)) {
                LOG_WRN("Unknown backend '%s' in %s -- keeping %s",
                    b.c_str(), path.c_str(), store_backend_str(cfg.backend));
            }
        }

        // Flat keys as written by the credential setup helper (config.json)
        cfg.cloudflare.account_id = j.value("account_id", cfg.cloudflare.account_id);
        cfg.cloudflare.api_token = j.value("api_token", cfg.cloudflare.api_token);
        cfg.cloudflare.namespace_id = j.value("namespace_id", cfg.cloudflare.namespace_id);

        if (j.contains("cloudflare")) {
            const auto& cf = j["cloudflare"];
            cfg.cloudflare.account_id = cf.value("account_id", cfg.cloudflare.account_id);
            cfg.cloudflare.api_token = cf.value("api_token", cfg.cloudflare.api_token);
            cfg.cloudflare.namespace_id = cf.value("namespace_id", cfg.cloudflare.namespace_id);
            cfg.cloudflare.api_base = cf.value("api_base", cfg.cloudflare.api_base);
        }

        if (j.contains("redis")) {
            const auto& r = j["redis"];
            cfg.redis.host = r.value("host", cfg.redis.host);
            cfg.redis.port = r.value("port", cfg.redis.port);
            cfg.redis.user = r.value("user", cfg.redis.user);
            cfg.redis.password = r.value("password", cfg.redis.password);
            cfg.redis.key_prefix = r.value("key_prefix", cfg.redis.key_prefix);
        }

        cfg.export_path = j.value("export_path", cfg.export_path);
        cfg.batch_size = j.value("batch_size", cfg.batch_size);
        cfg.concurrency = j.value("concurrency", cfg.concurrency);
        cfg.write_timeout_sec = j.value("write_timeout_sec", cfg.write_timeout_sec);
        cfg.skip_essentials = j.value("skip_essentials", cfg.skip_essentials);
        cfg.log_file = j.value("log_file", cfg.log_file);
        cfg.failed_keys_path = j.value("failed_keys_path", cfg.failed_keys_path);

        if (j.contains("filter")) {
            const auto& fl = j["filter"];
            cfg.filter.enabled = fl.value("enabled", cfg.filter.enabled);
            cfg.filter.min_id = fl.value("min_id", cfg.filter.min_id);
            if (fl.contains("include_ids")) {
                cfg.filter.include_ids = fl["include_ids"].get<std::vector<int64_t>>();
            }
        }

        if (j.contains("solution_languages")) {
            cfg.solution_languages = j["solution_languages"].get<std::vector<std::string>>();
        }
    } catch (const nlohmann::json::type_error& e) {
        LOG_ERR("Config file %s has a field of the wrong type: %s -- using defaults", path.c_str(), e.what());
        return LoaderConfig{};
    }

    return cfg;
}

inline void LoaderConfig::apply_env() {
    auto fill = [](std::string& field, const char* var) {
        if (!field.empty()) return;
        const char* v = std::getenv(var);
        if (v && *v) field = v;
    };
    fill(cloudflare.account_id, "CF_ACCOUNT_ID");
    fill(cloudflare.api_token, "CF_API_TOKEN");
    fill(cloudflare.namespace_id, "CF_NAMESPACE_ID");
}

inline std::string LoaderConfig::validate() const {
    if (batch_size == 0) return "batch_size must be at least 1";
    if (concurrency == 0) return "concurrency must be at least 1";
    if (write_timeout_sec <= 0) return "write_timeout_sec must be positive";

    switch (backend) {
        case StoreBackend::CLOUDFLARE:
            if (cloudflare.account_id.empty()) return "Cloudflare account id missing (--account-id or CF_ACCOUNT_ID)";
            if (cloudflare.api_token.empty()) return "Cloudflare API token missing (--api-token or CF_API_TOKEN)";
            if (cloudflare.namespace_id.empty()) return "KV namespace id missing (--namespace-id or CF_NAMESPACE_ID)";
            break;
        case StoreBackend::REDIS:
            if (redis.host.empty()) return "Redis host missing";
            break;
        case StoreBackend::FILE:
            if (export_path.empty()) return "export path missing";
            break;
    }
    return "";
}

} // namespace kvload
