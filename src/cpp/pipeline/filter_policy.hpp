#pragma once
// Decides which problem ids are uploaded. Pure and stateless once built;
// the normalizer only ever asks is_eligible().
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include "../config.hpp"

namespace kvload {

class FilterPolicy {
public:
    // Eligible iff id is explicitly included OR id >= min_id (when set)
    FilterPolicy(std::set<int64_t> include_ids, std::optional<int64_t> min_id)
        : include_ids_(std::move(include_ids)), min_id_(min_id), accept_all_(false) {}

    static FilterPolicy accept_all() {
        FilterPolicy p({}, std::nullopt);
        p.accept_all_ = true;
        return p;
    }

    static FilterPolicy from_config(const FilterConfig& cfg) {
        if (!cfg.enabled) return accept_all();
        std::optional<int64_t> min_id;
        if (cfg.min_id > 0) min_id = cfg.min_id;
        return FilterPolicy(std::set<int64_t>(cfg.include_ids.begin(), cfg.include_ids.end()),
                            min_id);
    }

    [[nodiscard]] bool is_eligible(int64_t id) const {
        if (accept_all_) return true;
        if (include_ids_.count(id)) return true;
        return min_id_ && id >= *min_id_;
    }

    [[nodiscard]] std::string describe() const {
        if (accept_all_) return "all ids";
        std::string s;
        for (auto id : include_ids_) {
            if (!s.empty()) s += ", ";
            s += "id == " + std::to_string(id);
        }
        if (min_id_) {
            if (!s.empty()) s += ", ";
            s += "id >= " + std::to_string(*min_id_);
        }
        return s.empty() ? "no ids" : s;
    }

private:
    std::set<int64_t> include_ids_;
    std::optional<int64_t> min_id_;
    bool accept_all_;
};

} // namespace kvload
