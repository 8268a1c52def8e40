#include "cloudflare_kv_store.hpp"
#include "../utils/logger.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <utility>

namespace kvload {

// ---- curl write callback ----
static size_t curl_write_cb(char* ptr, size_t size, size_t nmemb, std::string* data) {
    data->append(ptr, size * nmemb);
    return size * nmemb;
}

// Response bodies can be whole HTML error pages; keep log lines readable
static std::string snippet(const std::string& body) {
    constexpr size_t kMax = 300;
    if (body.size() <= kMax) return body;
    return body.substr(0, kMax) + "...";
}

CloudflareKvStore::CloudflareKvStore(CloudflareConfig cfg, long timeout_sec)
    : cfg_(std::move(cfg)), timeout_sec_(timeout_sec) {
    namespace_url_ = cfg_.api_base + "/accounts/" + cfg_.account_id
                   + "/storage/kv/namespaces/" + cfg_.namespace_id;
}

void* CloudflareKvStore::setup_request(const std::string& method, const std::string& url,
                                       std::string* response,
                                       struct curl_slist** out_headers) const {
    CURL* curl = curl_easy_init();
    if (!curl) return nullptr;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, method.c_str());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_sec_);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, std::min(timeout_sec_, 10L));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);  // worker threads
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, curl_write_cb);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, response);

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, ("Authorization: Bearer " + cfg_.api_token).c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);

    *out_headers = headers;
    return curl;
}

// ---- Connection ----

bool CloudflareKvStore::connect() {
    // Namespace metadata lookup: proves the token is valid AND can see the namespace
    std::string response;
    struct curl_slist* headers = nullptr;
    CURL* curl = static_cast<CURL*>(setup_request("GET", namespace_url_, &response, &headers));
    if (!curl) {
        LOG_ERR("[cloudflare] curl_easy_init failed");
        return false;
    }

    CURLcode res = curl_easy_perform(curl);
    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        LOG_ERR("[cloudflare] Namespace check failed: %s", curl_easy_strerror(res));
        return false;
    }
    if (http_code == 401 || http_code == 403) {
        LOG_ERR("[cloudflare] Credentials rejected (http %ld): %s",
            http_code, snippet(response).c_str());
        return false;
    }
    if (http_code != 200) {
        LOG_ERR("[cloudflare] Namespace %s not accessible (http %ld): %s",
            cfg_.namespace_id.c_str(), http_code, snippet(response).c_str());
        return false;
    }

    connected_ = true;
    LOG_INF("[cloudflare] Connected to namespace %s (account %s)",
        cfg_.namespace_id.c_str(), cfg_.account_id.c_str());
    return true;
}

void CloudflareKvStore::disconnect() {
    connected_ = false;
}

bool CloudflareKvStore::is_connected() const { return connected_; }

// ---- Writes ----

bool CloudflareKvStore::put(const std::string& key, const std::string& value) {
    CURL* escaper = curl_easy_init();
    if (!escaper) {
        LOG_ERR("[cloudflare] curl_easy_init failed for key %s", key.c_str());
        return false;
    }
    char* escaped = curl_easy_escape(escaper, key.c_str(), static_cast<int>(key.size()));
    std::string url = namespace_url_ + "/values/" + (escaped ? escaped : key);
    if (escaped) curl_free(escaped);
    curl_easy_cleanup(escaper);

    std::string response;
    struct curl_slist* headers = nullptr;
    CURL* curl = static_cast<CURL*>(setup_request("PUT", url, &response, &headers));
    if (!curl) {
        LOG_ERR("[cloudflare] curl_easy_init failed for key %s", key.c_str());
        return false;
    }

    headers = curl_slist_append(headers, "Content-Type: application/octet-stream");
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, value.data());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(value.size()));

    CURLcode res = curl_easy_perform(curl);
    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        LOG_ERR("[cloudflare] PUT %s failed: %s%s", key.c_str(), curl_easy_strerror(res),
            res == CURLE_OPERATION_TIMEDOUT ? " (timeout)" : "");
        return false;
    }
    if (http_code != 200 && http_code != 201) {
        LOG_ERR("[cloudflare] PUT %s failed: http %ld - %s",
            key.c_str(), http_code, snippet(response).c_str());
        return false;
    }
    return true;
}

} // namespace kvload
