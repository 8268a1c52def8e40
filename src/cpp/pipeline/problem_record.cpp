#include "problem_record.hpp"

namespace kvload {

nlohmann::json ProblemMetadata::to_json() const {
    nlohmann::json j = {
        {"category", category},
        {"topics", topics},
        {"hints", hints},
        {"likes", likes},
        {"dislikes", dislikes}
    };

    // Absent acceptance rate stays a visible null
    if (acceptance_rate) j["acceptance_rate"] = *acceptance_rate;
    else j["acceptance_rate"] = nullptr;

    if (!similar_questions.empty()) j["similar_questions"] = similar_questions;

    for (const auto& [key, value] : extra) {
        if (!j.contains(key)) j[key] = value;
    }
    return j;
}

std::string Problem::storage_key() const {
    return PROBLEM_KEY_PREFIX + std::to_string(id);
}

nlohmann::json Problem::to_json() const {
    nlohmann::json j = {
        {"id", id},
        {"difficulty", difficulty},
        {"title", title},
        {"titleSlug", title_slug},
        {"url", url},
        {"description", description},
        {"metadata", metadata.to_json()}
    };
    for (const auto& [lang, code] : solution_code) {
        j["solution_code_" + lang] = code;
    }
    return j;
}

nlohmann::json EssentialEntry::to_json() const {
    return {
        {"id", id},
        {"title", title},
        {"difficulty", difficulty},
        {"category", category},
        {"topics", topics}
    };
}

nlohmann::json EssentialsIndex::to_json() const {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& p : problems) {
        list.push_back(p.to_json());
    }
    nlohmann::json j = {
        {"problems", std::move(list)},
        {"count", count}
    };
    if (last_updated) j["last_updated"] = *last_updated;
    else j["last_updated"] = nullptr;
    return j;
}

std::string to_compact_json(const nlohmann::json& j) {
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace kvload
