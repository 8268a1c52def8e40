#include <gtest/gtest.h>
#include "pipeline/essentials_builder.hpp"
#include "support/memory_kv_store.hpp"

using kvload_test::make_problem;

TEST(EssentialsBuilderTest, SortedById) {
    std::vector<kvload::Problem> problems = {make_problem(1931), make_problem(1262), make_problem(2000)};
    auto idx = kvload::build_essentials(problems);
    ASSERT_EQ(idx.problems.size(), 3u);
    EXPECT_EQ(idx.problems[0].id, 1262);
    EXPECT_EQ(idx.problems[1].id, 1931);
    EXPECT_EQ(idx.problems[2].id, 2000);
    EXPECT_EQ(idx.count, 3u);
    EXPECT_FALSE(idx.last_updated);
}

TEST(EssentialsBuilderTest, InputOrderDoesNotMatter) {
    std::vector<kvload::Problem> a = {make_problem(3), make_problem(1), make_problem(2)};
    std::vector<kvload::Problem> b = {make_problem(2), make_problem(3), make_problem(1)};
    EXPECT_EQ(kvload::to_compact_json(kvload::build_essentials(a).to_json()),
              kvload::to_compact_json(kvload::build_essentials(b).to_json()));
}

TEST(EssentialsBuilderTest, SummaryFields) {
    auto p = make_problem(1931, "Database");
    p.metadata.topics = {"SQL", "Join"};
    p.description = "long text that is not summarized";
    auto e = kvload::summarize(p);
    EXPECT_EQ(e.id, 1931);
    EXPECT_EQ(e.title, "Problem 1931");
    EXPECT_EQ(e.difficulty, "Medium");
    EXPECT_EQ(e.category, "Database");
    EXPECT_EQ(e.topics, (std::vector<std::string>{"SQL", "Join"}));

    auto j = e.to_json();
    EXPECT_EQ(j.size(), 5u);
    EXPECT_FALSE(j.contains("description"));
}

TEST(EssentialsBuilderTest, Empty) {
    auto idx = kvload::build_essentials({});
    EXPECT_TRUE(idx.problems.empty());
    EXPECT_EQ(idx.count, 0u);
}
