#pragma once
// Abstract key-value store the loader writes to.
//
// A store only has to provide single writes. put_bulk() is NOT atomic: it
// returns one success flag per entry, and the default implementation simply
// issues put() for each entry in order. Backends with a native pipelined
// primitive (Redis) override it.
//
// Implementations bound every write by a timeout, log the cause of a failed
// write themselves, and are safe to call from several upload workers at once.
#include <exception>
#include <string>
#include <vector>
#include "../utils/logger.hpp"

namespace kvload {

struct KvEntry {
    std::string key;
    std::string value;
};

class KvStore {
public:
    virtual ~KvStore() = default;

    // Verify reachability and credentials. A false return is fatal for the run.
    virtual bool connect() = 0;
    virtual void disconnect() = 0;
    [[nodiscard]] virtual bool is_connected() const = 0;

    // Single write. False on non-success status, transport error or timeout.
    virtual bool put(const std::string& key, const std::string& value) = 0;

    virtual std::vector<bool> put_bulk(const std::vector<KvEntry>& entries) {
        std::vector<bool> results;
        results.reserve(entries.size());
        for (const auto& e : entries) {
            results.push_back(put_guarded(e));
        }
        return results;
    }

    // Persist anything buffered. Stores that write through return true.
    virtual bool flush() { return true; }

    [[nodiscard]] virtual const char* store_name() const = 0;

protected:
    // put() with a thrown exception turned into a logged failure, so one bad
    // entry cannot stop the rest of a bulk call
    bool put_guarded(const KvEntry& e) {
        try {
            return put(e.key, e.value);
        } catch (const std::exception& ex) {
            LOG_ERR("[%s] Exception writing key %s: %s", store_name(), e.key.c_str(), ex.what());
        } catch (...) {
            LOG_ERR("[%s] Exception writing key %s: unknown error", store_name(), e.key.c_str());
        }
        return false;
    }
};

} // namespace kvload
