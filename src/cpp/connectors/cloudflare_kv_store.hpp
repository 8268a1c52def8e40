#pragma once
// Cloudflare Workers KV connector -- REST API over libcurl
// One easy handle per request, so concurrent put() calls are safe as long as
// curl_global_init() ran once before the first worker started.
#include "kv_store.hpp"
#include "../config.hpp"

struct curl_slist;

namespace kvload {

class CloudflareKvStore : public KvStore {
public:
    CloudflareKvStore(CloudflareConfig cfg, long timeout_sec);
    ~CloudflareKvStore() override { disconnect(); }

    bool connect() override;
    void disconnect() override;
    [[nodiscard]] bool is_connected() const override;

    bool put(const std::string& key, const std::string& value) override;

    [[nodiscard]] const char* store_name() const override { return "cloudflare"; }

    // .../accounts/{account}/storage/kv/namespaces/{namespace}
    [[nodiscard]] const std::string& namespace_url() const { return namespace_url_; }

private:
    CloudflareConfig cfg_;
    long timeout_sec_;
    std::string namespace_url_;
    bool connected_ = false;

    // Returns CURL* as void* to avoid #include <curl/curl.h> in header
    void* setup_request(const std::string& method, const std::string& url,
                        std::string* response, struct curl_slist** out_headers) const;
};

} // namespace kvload
