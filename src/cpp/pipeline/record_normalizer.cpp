#include "record_normalizer.hpp"
#include "list_literal.hpp"
#include "../utils/logger.hpp"
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <set>
#include <utility>

namespace kvload {

// Columns with a meaning of their own; everything else lands in metadata.extra.
// Includes source columns that are deliberately dropped (paidOnly, stats, ...).
static const std::set<std::string> kRecognizedColumns = {
    "difficulty", "frontendQuestionId", "paidOnly", "title", "titleSlug", "url",
    "description_url", "description", "solution_url", "solution",
    "solution_code_python", "solution_code_java", "solution_code_cpp",
    "solution_code_url", "category", "acceptance_rate", "topics", "hints",
    "likes", "dislikes", "similar_questions", "stats"
};

// Largest double that still truncates into int64_t
static constexpr double kMaxIdValue = 9.2e18;

RecordNormalizer::RecordNormalizer(FilterPolicy filter, std::vector<std::string> solution_languages)
    : filter_(std::move(filter)), solution_languages_(std::move(solution_languages)) {}

bool RecordNormalizer::is_recognized_column(const std::string& name) const {
    if (kRecognizedColumns.count(name)) return true;
    for (const auto& lang : solution_languages_) {
        if (name == "solution_code_" + lang) return true;
    }
    return false;
}

// Decimal notation only: digits, sign, point, exponent. strtod alone would
// also take "inf", "nan" and hex floats.
static bool is_decimal_number(const std::string& s) {
    if (s.empty()) return false;
    return s.find_first_not_of("0123456789+-.eE") == std::string::npos;
}

static std::optional<double> parse_double(const std::string& s) {
    if (!is_decimal_number(s)) return std::nullopt;
    errno = 0;
    char* end = nullptr;
    double v = std::strtod(s.c_str(), &end);
    if (errno == ERANGE || end != s.c_str() + s.size() || !std::isfinite(v)) {
        return std::nullopt;
    }
    return v;
}

static std::optional<int64_t> id_from_double(double v) {
    if (!std::isfinite(v) || v < 1.0 || v >= kMaxIdValue) return std::nullopt;
    auto id = static_cast<int64_t>(v);
    if (id <= 0) return std::nullopt;
    return id;
}

// ============================================================================
// Field parsers
// ============================================================================

std::optional<int64_t> RecordNormalizer::parse_problem_id(const std::string& text) {
    auto v = parse_double(trim_copy(text));
    if (!v) return std::nullopt;
    return id_from_double(*v);
}

int64_t RecordNormalizer::parse_count(const std::string& text) {
    std::string s = trim_copy(text);
    if (s.empty() || s.find_first_not_of("0123456789+-") != std::string::npos) return 0;
    errno = 0;
    char* end = nullptr;
    long long v = std::strtoll(s.c_str(), &end, 10);
    if (errno == ERANGE || end != s.c_str() + s.size() || v < 0) return 0;
    return static_cast<int64_t>(v);
}

std::optional<double> RecordNormalizer::parse_acceptance_rate(const std::string& text) {
    std::string s = trim_copy(text);
    if (!s.empty() && s.back() == '%') {
        s.pop_back();
        s = trim_copy(s);
    }
    auto v = parse_double(s);
    if (!v || *v < 0.0 || *v > 100.0) return std::nullopt;
    return v;
}

// ============================================================================
// Tabular source
// ============================================================================

std::optional<Problem> RecordNormalizer::normalize_tabular(const RawRow& row) const {
    auto get = [&row](const std::string& name) -> const std::string& {
        static const std::string empty;
        auto it = row.find(name);
        return it == row.end() ? empty : it->second;
    };

    const std::string& raw_id = get("frontendQuestionId");
    auto id = parse_problem_id(raw_id);
    if (!id) {
        LOG_DBG("[normalize] Skipping row with invalid id '%.40s'", raw_id.c_str());
        return std::nullopt;
    }
    if (!filter_.is_eligible(*id)) {
        return std::nullopt;
    }

    Problem p;
    p.id = *id;
    p.difficulty = trim_copy(get("difficulty"));
    p.title = trim_copy(get("title"));
    p.title_slug = trim_copy(get("titleSlug"));
    p.url = trim_copy(get("url"));
    p.description = trim_copy(get("description"));

    for (const auto& lang : solution_languages_) {
        const std::string& code = get("solution_code_" + lang);
        if (!trim_copy(code).empty()) p.solution_code[lang] = code;
    }

    auto& m = p.metadata;
    m.category = trim_copy(get("category"));
    m.topics = parse_list_literal(get("topics"));
    m.hints = parse_list_literal(get("hints"));
    m.similar_questions = parse_list_literal(get("similar_questions"));
    m.acceptance_rate = parse_acceptance_rate(get("acceptance_rate"));
    m.likes = parse_count(get("likes"));
    m.dislikes = parse_count(get("dislikes"));

    for (const auto& [column, value] : row) {
        if (column.empty() || is_recognized_column(column)) continue;
        std::string v = trim_copy(value);
        if (!v.empty()) m.extra[column] = std::move(v);
    }

    return p;
}

// ============================================================================
// Structured source
// ============================================================================

static std::string string_field(const nlohmann::json& obj, const char* key,
                                const std::string& fallback = "") {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return fallback;
    return it->get<std::string>();
}

// Arrays keep their string elements; a string is read as a list literal
static std::vector<std::string> string_list_field(const nlohmann::json& obj, const char* key) {
    std::vector<std::string> out;
    auto it = obj.find(key);
    if (it == obj.end()) return out;
    if (it->is_string()) return parse_list_literal(it->get<std::string>());
    if (!it->is_array()) return out;
    for (const auto& e : *it) {
        if (e.is_string()) out.push_back(e.get<std::string>());
    }
    return out;
}

static int64_t count_field(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end()) return 0;
    if (it->is_number_integer()) {
        auto v = it->get<int64_t>();
        return v < 0 ? 0 : v;
    }
    if (it->is_number_float()) {
        double d = it->get<double>();
        return (std::isfinite(d) && d >= 0.0 && d < kMaxIdValue) ? static_cast<int64_t>(d) : 0;
    }
    if (it->is_string()) return RecordNormalizer::parse_count(it->get<std::string>());
    return 0;
}

std::optional<Problem> RecordNormalizer::normalize_structured(const nlohmann::json& obj) const {
    if (!obj.is_object()) {
        LOG_DBG("[normalize] Skipping non-object entry");
        return std::nullopt;
    }

    std::optional<int64_t> id;
    auto qid = obj.find("questionId");
    if (qid != obj.end()) {
        if (qid->is_number_integer()) {
            auto v = qid->get<int64_t>();
            if (v > 0) id = v;
        } else if (qid->is_number_float()) {
            id = id_from_double(qid->get<double>());
        } else if (qid->is_string()) {
            id = parse_problem_id(qid->get<std::string>());
        }
    }
    if (!id) {
        LOG_DBG("[normalize] Skipping entry without a usable questionId");
        return std::nullopt;
    }
    if (!filter_.is_eligible(*id)) {
        return std::nullopt;
    }

    Problem p;
    p.id = *id;
    p.difficulty = string_field(obj, "difficulty");
    p.title = string_field(obj, "title");
    p.title_slug = string_field(obj, "titleSlug");
    p.url = string_field(obj, "url");
    p.description = string_field(obj, "description");

    for (const auto& lang : solution_languages_) {
        std::string code = string_field(obj, ("solution_code_" + lang).c_str());
        if (!trim_copy(code).empty()) p.solution_code[lang] = std::move(code);
    }

    auto& m = p.metadata;
    m.category = string_field(obj, "category", "General");
    m.topics = string_list_field(obj, "topics");
    m.hints = string_list_field(obj, "hints");
    m.similar_questions = string_list_field(obj, "similar_questions");
    m.likes = count_field(obj, "likes");
    m.dislikes = count_field(obj, "dislikes");

    auto rate = obj.find("acceptance_rate");
    if (rate != obj.end()) {
        if (rate->is_number()) {
            double d = rate->get<double>();
            if (std::isfinite(d) && d >= 0.0 && d <= 100.0) m.acceptance_rate = d;
        } else if (rate->is_string()) {
            m.acceptance_rate = parse_acceptance_rate(rate->get<std::string>());
        }
    }

    return p;
}

} // namespace kvload
