#pragma once
// =============================================================================
// Record Normalizer -- one raw input row -> one canonical Problem, or nothing
//
// Tabular rows (CSV, all cells are text):
//   frontendQuestionId   required; parsed as float then truncated ("1.0" -> 1)
//   topics/hints/similar_questions   list literals, best effort -> [] on failure
//   likes/dislikes       integer, 0 on empty/bad input
//   acceptance_rate      "45.5%" -> 45.5, absent on bad input
//   solution_code_<lang> attached only when non-blank
//   unknown columns      non-empty text goes to metadata.extra
//
// Structured rows (JSON objects, already typed):
//   questionId required; everything else passes through when well-typed.
//
// In both cases the id must pass the FilterPolicy. A rejected or malformed row
// is dropped silently -- never a partial Problem, never an exception.
// =============================================================================

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "filter_policy.hpp"
#include "input_reader.hpp"
#include "problem_record.hpp"

namespace kvload {

class RecordNormalizer {
public:
    // solution_languages: which solution_code_<lang> columns are attached
    explicit RecordNormalizer(FilterPolicy filter,
                              std::vector<std::string> solution_languages = {"python", "java", "cpp"});

    std::optional<Problem> normalize_tabular(const RawRow& row) const;
    std::optional<Problem> normalize_structured(const nlohmann::json& obj) const;

    // Field-level helpers, exposed for testing
    static std::optional<int64_t> parse_problem_id(const std::string& text);
    static int64_t parse_count(const std::string& text);
    static std::optional<double> parse_acceptance_rate(const std::string& text);

    [[nodiscard]] const FilterPolicy& filter() const { return filter_; }

private:
    FilterPolicy filter_;
    std::vector<std::string> solution_languages_;

    bool is_recognized_column(const std::string& name) const;
};

} // namespace kvload
