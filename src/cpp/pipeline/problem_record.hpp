#pragma once
// =============================================================================
// Problem records -- the canonical unit stored in the key-value store
//
// Built once per run from raw input rows, held in memory for the upload, then
// discarded. A Problem only exists fully formed: the normalizer either returns
// a complete record or nothing.
//
// Wire format is compact JSON with raw UTF-8 (no \u escapes). Object keys are
// emitted in lexicographic order, so identical records serialize identically.
// =============================================================================

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace kvload {

inline constexpr const char* PROBLEM_KEY_PREFIX = "problem:";
inline constexpr const char* ESSENTIALS_KEY = "essentials";

struct ProblemMetadata {
    std::string category;
    std::vector<std::string> topics;            // source order
    std::vector<std::string> hints;             // source order
    std::optional<double> acceptance_rate;      // percent, 0-100
    int64_t likes = 0;
    int64_t dislikes = 0;
    std::vector<std::string> similar_questions; // emitted only when non-empty

    // Unrecognized non-empty source columns, kept for forward compatibility.
    // Folded into the metadata object on output; never shadows a known key.
    std::map<std::string, std::string> extra;

    nlohmann::json to_json() const;
};

struct Problem {
    int64_t id = 0;
    std::string difficulty;
    std::string title;
    std::string title_slug;
    std::string url;
    std::string description;

    // language ("python", "java", "cpp", ...) -> source; only non-empty code
    std::map<std::string, std::string> solution_code;

    ProblemMetadata metadata;

    // "problem:<id>"
    [[nodiscard]] std::string storage_key() const;

    nlohmann::json to_json() const;
};

// One line of the essentials index
struct EssentialEntry {
    int64_t id = 0;
    std::string title;
    std::string difficulty;
    std::string category;
    std::vector<std::string> topics;

    nlohmann::json to_json() const;
};

// Summary of every uploaded problem, for list views
struct EssentialsIndex {
    std::vector<EssentialEntry> problems;   // ascending by id
    size_t count = 0;
    std::optional<std::string> last_updated;  // stamped at upload time

    nlohmann::json to_json() const;
};

// Compact JSON, raw UTF-8, invalid byte sequences replaced instead of throwing
std::string to_compact_json(const nlohmann::json& j);

} // namespace kvload
