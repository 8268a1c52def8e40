#include "redis_kv_store.hpp"
#include "../utils/logger.hpp"
#include <utility>

#ifdef HAS_HIREDIS
#include <hiredis/hiredis.h>
#endif

namespace kvload {

RedisKvStore::RedisKvStore(RedisConfig cfg, long timeout_sec)
    : cfg_(std::move(cfg)), timeout_sec_(timeout_sec) {}

bool RedisKvStore::connect() {
    std::lock_guard<std::mutex> lock(mu_);
    return connect_locked();
}

bool RedisKvStore::connect_locked() {
#ifdef HAS_HIREDIS
    struct timeval timeout{};
    timeout.tv_sec = timeout_sec_;
    auto* c = redisConnectWithTimeout(cfg_.host.c_str(), cfg_.port, timeout);
    if (!c || c->err) {
        LOG_ERR("[redis] Connection to %s:%u failed: %s",
            cfg_.host.c_str(), cfg_.port, c ? c->errstr : "null context");
        if (c) redisFree(c);
        return false;
    }
    // Bound every later command by the same timeout
    redisSetTimeout(c, timeout);
    ctx_ = c;

    // Authenticate if credentials are provided (Redis 6+ ACL)
    if (!cfg_.password.empty()) {
        redisReply* auth = nullptr;
        if (!cfg_.user.empty()) {
            auth = static_cast<redisReply*>(
                redisCommand(c, "AUTH %s %s", cfg_.user.c_str(), cfg_.password.c_str()));
        } else {
            auth = static_cast<redisReply*>(redisCommand(c, "AUTH %s", cfg_.password.c_str()));
        }
        if (!auth || auth->type == REDIS_REPLY_ERROR) {
            LOG_ERR("[redis] AUTH failed: %s", auth ? auth->str : c->errstr);
            if (auth) freeReplyObject(auth);
            free_context_locked();
            return false;
        }
        freeReplyObject(auth);
        LOG_INF("[redis] Authenticated%s%s", cfg_.user.empty() ? "" : " as ",
            cfg_.user.c_str());
    }

    auto* reply = static_cast<redisReply*>(redisCommand(c, "PING"));
    if (!reply || reply->type == REDIS_REPLY_ERROR) {
        LOG_ERR("[redis] PING failed: %s", reply ? reply->str : c->errstr);
        if (reply) freeReplyObject(reply);
        free_context_locked();
        return false;
    }
    freeReplyObject(reply);

    LOG_INF("[redis] Connected to %s:%u (key prefix: \"%s\")",
        cfg_.host.c_str(), cfg_.port, cfg_.key_prefix.c_str());
    connected_ = true;
    return true;
#else
    LOG_ERR("[redis] hiredis not available, Redis store disabled");
    return false;
#endif
}

void RedisKvStore::free_context_locked() {
#ifdef HAS_HIREDIS
    if (ctx_) {
        redisFree(static_cast<redisContext*>(ctx_));
        ctx_ = nullptr;
    }
#endif
    connected_ = false;
}

void RedisKvStore::disconnect() {
    std::lock_guard<std::mutex> lock(mu_);
    free_context_locked();
}

bool RedisKvStore::is_connected() const {
    std::lock_guard<std::mutex> lock(mu_);
    return connected_;
}

bool RedisKvStore::ensure_connected_locked() {
#ifdef HAS_HIREDIS
    auto* c = static_cast<redisContext*>(ctx_);
    if (c && !c->err) return true;
    if (c) {
        LOG_WRN("[redis] Connection broken (%s) -- reconnecting", c->errstr);
    }
    free_context_locked();
    return connect_locked();
#else
    return false;
#endif
}

bool RedisKvStore::put(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mu_);
#ifdef HAS_HIREDIS
    if (!ensure_connected_locked()) {
        LOG_ERR("[redis] SET %s failed: not connected", key.c_str());
        return false;
    }
    auto* c = static_cast<redisContext*>(ctx_);
    std::string full_key = cfg_.key_prefix + key;

    auto* reply = static_cast<redisReply*>(
        redisCommand(c, "SET %b %b", full_key.data(), full_key.size(),
                     value.data(), value.size()));
    if (!reply) {
        LOG_ERR("[redis] SET %s failed: %s", key.c_str(), c->errstr);
        return false;
    }
    bool ok = reply->type == REDIS_REPLY_STATUS;
    if (!ok) {
        LOG_ERR("[redis] SET %s failed: %s", key.c_str(),
            reply->type == REDIS_REPLY_ERROR ? reply->str : "unexpected reply type");
    }
    freeReplyObject(reply);
    return ok;
#else
    LOG_ERR("[redis] SET %s failed: hiredis not available", key.c_str());
    (void)value;
    return false;
#endif
}

std::vector<bool> RedisKvStore::put_bulk(const std::vector<KvEntry>& entries) {
    std::vector<bool> results(entries.size(), false);
    std::lock_guard<std::mutex> lock(mu_);
#ifdef HAS_HIREDIS
    if (!ensure_connected_locked()) {
        LOG_ERR("[redis] Bulk SET of %zu keys failed: not connected", entries.size());
        return results;
    }
    auto* c = static_cast<redisContext*>(ctx_);

    size_t appended = 0;
    for (const auto& e : entries) {
        std::string full_key = cfg_.key_prefix + e.key;
        if (redisAppendCommand(c, "SET %b %b", full_key.data(), full_key.size(),
                               e.value.data(), e.value.size()) != REDIS_OK) {
            LOG_ERR("[redis] Cannot queue SET %s: %s", e.key.c_str(), c->errstr);
            break;
        }
        appended++;
    }

    // Replies arrive in command order; a transport error fails the rest
    for (size_t i = 0; i < appended; ++i) {
        void* raw = nullptr;
        if (redisGetReply(c, &raw) != REDIS_OK || !raw) {
            LOG_ERR("[redis] SET %s failed: %s", entries[i].key.c_str(), c->errstr);
            for (size_t k = i + 1; k < appended; ++k) {
                LOG_ERR("[redis] SET %s failed: pipeline aborted", entries[k].key.c_str());
            }
            break;
        }
        auto* reply = static_cast<redisReply*>(raw);
        results[i] = reply->type == REDIS_REPLY_STATUS;
        if (!results[i]) {
            LOG_ERR("[redis] SET %s failed: %s", entries[i].key.c_str(),
                reply->type == REDIS_REPLY_ERROR ? reply->str : "unexpected reply type");
        }
        freeReplyObject(reply);
    }
    for (size_t k = appended; k < entries.size(); ++k) {
        LOG_ERR("[redis] SET %s failed: not sent", entries[k].key.c_str());
    }
#endif
    return results;
}

} // namespace kvload
