#include <gtest/gtest.h>
#include "pipeline/record_normalizer.hpp"

using kvload::FilterConfig;
using kvload::FilterPolicy;
using kvload::RawRow;
using kvload::RecordNormalizer;
using json = nlohmann::json;

static RecordNormalizer default_normalizer() {
    return RecordNormalizer(FilterPolicy::from_config(FilterConfig{}));
}

static RecordNormalizer open_normalizer() {
    return RecordNormalizer(FilterPolicy::accept_all());
}

static RawRow full_row() {
    return RawRow{
        {"frontendQuestionId", "1931"},
        {"difficulty", "Hard"},
        {"title", " Painting a Grid With Three Different Colors "},
        {"titleSlug", "painting-a-grid-with-three-different-colors"},
        {"url", "https://leetcode.com/problems/painting-a-grid-with-three-different-colors"},
        {"description", "You are given two integers m and n."},
        {"category", "Algorithms"},
        {"topics", "['Dynamic Programming', 'Bit Manipulation']"},
        {"hints", "[]"},
        {"similar_questions", ""},
        {"acceptance_rate", "45.5%"},
        {"likes", "812"},
        {"dislikes", "n/a"},
        {"paidOnly", "False"},
        {"solution_code_python", "class Solution:\n    pass\n"},
        {"solution_code_java", "   "},
        {"companies", "Google"},
        {"notes", "  "}
    };
}

// ============================================================================
// Field parsers
// ============================================================================

TEST(ParseProblemIdTest, AcceptsIntegersAndFloats) {
    EXPECT_EQ(RecordNormalizer::parse_problem_id("1931"), 1931);
    EXPECT_EQ(RecordNormalizer::parse_problem_id("1.0"), 1);
    EXPECT_EQ(RecordNormalizer::parse_problem_id("1931.9"), 1931);
    EXPECT_EQ(RecordNormalizer::parse_problem_id(" 42 "), 42);
}

TEST(ParseProblemIdTest, RejectsGarbage) {
    EXPECT_FALSE(RecordNormalizer::parse_problem_id(""));
    EXPECT_FALSE(RecordNormalizer::parse_problem_id("abc"));
    EXPECT_FALSE(RecordNormalizer::parse_problem_id("12abc"));
    EXPECT_FALSE(RecordNormalizer::parse_problem_id("inf"));
    EXPECT_FALSE(RecordNormalizer::parse_problem_id("nan"));
    EXPECT_FALSE(RecordNormalizer::parse_problem_id("0"));
    EXPECT_FALSE(RecordNormalizer::parse_problem_id("-5"));
    EXPECT_FALSE(RecordNormalizer::parse_problem_id("1e300"));
}

TEST(ParseCountTest, DefaultsToZero) {
    EXPECT_EQ(RecordNormalizer::parse_count("812"), 812);
    EXPECT_EQ(RecordNormalizer::parse_count(""), 0);
    EXPECT_EQ(RecordNormalizer::parse_count("n/a"), 0);
    EXPECT_EQ(RecordNormalizer::parse_count("-3"), 0);
    EXPECT_EQ(RecordNormalizer::parse_count("1.5"), 0);
}

TEST(ParseAcceptanceRateTest, PercentSuffixAndRange) {
    auto r = RecordNormalizer::parse_acceptance_rate("45.5%");
    ASSERT_TRUE(r);
    EXPECT_DOUBLE_EQ(*r, 45.5);
    EXPECT_DOUBLE_EQ(*RecordNormalizer::parse_acceptance_rate("67"), 67.0);
    EXPECT_DOUBLE_EQ(*RecordNormalizer::parse_acceptance_rate("100%"), 100.0);
    EXPECT_FALSE(RecordNormalizer::parse_acceptance_rate(""));
    EXPECT_FALSE(RecordNormalizer::parse_acceptance_rate("high"));
    EXPECT_FALSE(RecordNormalizer::parse_acceptance_rate("150%"));
    EXPECT_FALSE(RecordNormalizer::parse_acceptance_rate("-1"));
}

// ============================================================================
// Tabular rows
// ============================================================================

TEST(NormalizeTabularTest, FullRow) {
    auto p = default_normalizer().normalize_tabular(full_row());
    ASSERT_TRUE(p);
    EXPECT_EQ(p->id, 1931);
    EXPECT_EQ(p->storage_key(), "problem:1931");
    EXPECT_EQ(p->difficulty, "Hard");
    EXPECT_EQ(p->title, "Painting a Grid With Three Different Colors");
    EXPECT_EQ(p->title_slug, "painting-a-grid-with-three-different-colors");
    EXPECT_EQ(p->metadata.category, "Algorithms");
    EXPECT_EQ(p->metadata.topics, (std::vector<std::string>{"Dynamic Programming", "Bit Manipulation"}));
    EXPECT_TRUE(p->metadata.hints.empty());
    EXPECT_TRUE(p->metadata.similar_questions.empty());
    ASSERT_TRUE(p->metadata.acceptance_rate);
    EXPECT_DOUBLE_EQ(*p->metadata.acceptance_rate, 45.5);
    EXPECT_EQ(p->metadata.likes, 812);
    EXPECT_EQ(p->metadata.dislikes, 0);
}

TEST(NormalizeTabularTest, SolutionCodeOnlyWhenNonBlank) {
    auto p = default_normalizer().normalize_tabular(full_row());
    ASSERT_TRUE(p);
    ASSERT_EQ(p->solution_code.size(), 1u);
    EXPECT_EQ(p->solution_code.at("python"), "class Solution:\n    pass\n");
    EXPECT_EQ(p->solution_code.count("java"), 0u);
    EXPECT_EQ(p->solution_code.count("cpp"), 0u);
}

TEST(NormalizeTabularTest, UnknownColumnsKeptAsExtra) {
    auto p = default_normalizer().normalize_tabular(full_row());
    ASSERT_TRUE(p);
    EXPECT_EQ(p->metadata.extra.size(), 1u);
    EXPECT_EQ(p->metadata.extra.at("companies"), "Google");
    // Known-but-dropped columns do not leak into extra
    EXPECT_EQ(p->metadata.extra.count("paidOnly"), 0u);
}

TEST(NormalizeTabularTest, InvalidIdSkipsRow) {
    auto n = open_normalizer();
    RawRow row = full_row();
    row["frontendQuestionId"] = "";
    EXPECT_FALSE(n.normalize_tabular(row));
    row["frontendQuestionId"] = "abc";
    EXPECT_FALSE(n.normalize_tabular(row));
    row.erase("frontendQuestionId");
    EXPECT_FALSE(n.normalize_tabular(row));
}

TEST(NormalizeTabularTest, FloatIdTruncated) {
    RawRow row = full_row();
    row["frontendQuestionId"] = "1.0";
    auto p = open_normalizer().normalize_tabular(row);
    ASSERT_TRUE(p);
    EXPECT_EQ(p->id, 1);
}

TEST(NormalizeTabularTest, FilterRejectsIneligibleIds) {
    auto n = default_normalizer();
    RawRow row = full_row();
    row["frontendQuestionId"] = "1500";
    EXPECT_FALSE(n.normalize_tabular(row));
    row["frontendQuestionId"] = "1262";
    EXPECT_TRUE(n.normalize_tabular(row));
}

TEST(NormalizeTabularTest, MalformedListBecomesEmpty) {
    RawRow row = full_row();
    row["topics"] = "['Array', 'Graph";
    auto p = default_normalizer().normalize_tabular(row);
    ASSERT_TRUE(p);
    EXPECT_TRUE(p->metadata.topics.empty());
}

TEST(NormalizeTabularTest, MinimalRowGetsDefaults) {
    RawRow row{{"frontendQuestionId", "2000"}};
    auto p = default_normalizer().normalize_tabular(row);
    ASSERT_TRUE(p);
    EXPECT_EQ(p->title, "");
    EXPECT_TRUE(p->metadata.topics.empty());
    EXPECT_FALSE(p->metadata.acceptance_rate);
    EXPECT_EQ(p->metadata.likes, 0);
    EXPECT_TRUE(p->solution_code.empty());
}

TEST(NormalizeTabularTest, ConfiguredSolutionLanguages) {
    RecordNormalizer n(FilterPolicy::accept_all(), {"go"});
    RawRow row{{"frontendQuestionId", "5"}, {"solution_code_go", "func f() {}"},
               {"solution_code_python", "pass"}};
    auto p = n.normalize_tabular(row);
    ASSERT_TRUE(p);
    EXPECT_EQ(p->solution_code.size(), 1u);
    EXPECT_EQ(p->solution_code.at("go"), "func f() {}");
}

TEST(NormalizeTabularTest, WireFormat) {
    RawRow row = full_row();
    row["acceptance_rate"] = "";
    auto p = default_normalizer().normalize_tabular(row);
    ASSERT_TRUE(p);
    json j = p->to_json();
    EXPECT_EQ(j["id"].get<int64_t>(), 1931);
    EXPECT_EQ(j["titleSlug"].get<std::string>(), "painting-a-grid-with-three-different-colors");
    EXPECT_TRUE(j["metadata"]["acceptance_rate"].is_null());
    EXPECT_FALSE(j["metadata"].contains("similar_questions"));
    EXPECT_EQ(j["metadata"]["companies"].get<std::string>(), "Google");
    EXPECT_EQ(j["solution_code_python"].get<std::string>(), "class Solution:\n    pass\n");
    EXPECT_FALSE(j.contains("solution_code_java"));
}

// ============================================================================
// Structured rows
// ============================================================================

TEST(NormalizeStructuredTest, TypedObject) {
    json obj = {
        {"questionId", "1931"},
        {"title", "Painting a Grid"},
        {"difficulty", "Hard"},
        {"topics", json::array({"Dynamic Programming", 3, "Bit Manipulation"})},
        {"hints", "['Think in columns']"},
        {"similar_questions", json::array({"number-of-ways-to-paint-n-3-grid"})},
        {"likes", 812},
        {"dislikes", -4},
        {"acceptance_rate", 57.25},
        {"solution_code_cpp", "class Solution {};"}
    };
    auto p = default_normalizer().normalize_structured(obj);
    ASSERT_TRUE(p);
    EXPECT_EQ(p->id, 1931);
    EXPECT_EQ(p->metadata.category, "General");
    EXPECT_EQ(p->metadata.topics, (std::vector<std::string>{"Dynamic Programming", "Bit Manipulation"}));
    EXPECT_EQ(p->metadata.hints, (std::vector<std::string>{"Think in columns"}));
    EXPECT_EQ(p->metadata.similar_questions.size(), 1u);
    EXPECT_EQ(p->metadata.likes, 812);
    EXPECT_EQ(p->metadata.dislikes, 0);
    ASSERT_TRUE(p->metadata.acceptance_rate);
    EXPECT_DOUBLE_EQ(*p->metadata.acceptance_rate, 57.25);
    EXPECT_EQ(p->solution_code.at("cpp"), "class Solution {};");
}

TEST(NormalizeStructuredTest, NumericIds) {
    auto n = open_normalizer();
    auto a = n.normalize_structured(json{{"questionId", 2000}});
    ASSERT_TRUE(a);
    EXPECT_EQ(a->id, 2000);
    auto b = n.normalize_structured(json{{"questionId", 7.0}});
    ASSERT_TRUE(b);
    EXPECT_EQ(b->id, 7);
}

TEST(NormalizeStructuredTest, RejectsUnusableEntries) {
    auto n = open_normalizer();
    EXPECT_FALSE(n.normalize_structured(json::array({1, 2})));
    EXPECT_FALSE(n.normalize_structured(json{{"title", "no id"}}));
    EXPECT_FALSE(n.normalize_structured(json{{"questionId", nullptr}}));
    EXPECT_FALSE(n.normalize_structured(json{{"questionId", "x1"}}));
    EXPECT_FALSE(n.normalize_structured(json{{"questionId", 0}}));
}

TEST(NormalizeStructuredTest, WrongTypesFallBackToDefaults) {
    json obj = {
        {"questionId", 1931},
        {"title", 12},
        {"category", "Database"},
        {"topics", 5},
        {"acceptance_rate", "n/a"}
    };
    auto p = default_normalizer().normalize_structured(obj);
    ASSERT_TRUE(p);
    EXPECT_EQ(p->title, "");
    EXPECT_EQ(p->metadata.category, "Database");
    EXPECT_TRUE(p->metadata.topics.empty());
    EXPECT_FALSE(p->metadata.acceptance_rate);
}
