#pragma once
#include <mutex>
#include "kv_store.hpp"
#include "../config.hpp"

namespace kvload {

// Redis connector -- plain SET per key, optional key prefix for namespacing.
// A single redisContext is shared, so all commands go through mu_.
class RedisKvStore : public KvStore {
public:
    RedisKvStore(RedisConfig cfg, long timeout_sec);
    ~RedisKvStore() override { disconnect(); }

    bool connect() override;
    void disconnect() override;
    [[nodiscard]] bool is_connected() const override;

    bool put(const std::string& key, const std::string& value) override;

    // Pipelined SETs: all commands are appended, then one reply is read per key
    std::vector<bool> put_bulk(const std::vector<KvEntry>& entries) override;

    [[nodiscard]] const char* store_name() const override { return "redis"; }

private:
    RedisConfig cfg_;
    long timeout_sec_;
    void* ctx_ = nullptr;  // redisContext*
    bool connected_ = false;
    mutable std::mutex mu_;

    bool connect_locked();
    void free_context_locked();
    // Re-establish the connection after a transport error (one attempt)
    bool ensure_connected_locked();
};

} // namespace kvload
