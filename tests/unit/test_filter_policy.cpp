#include <gtest/gtest.h>
#include "pipeline/filter_policy.hpp"

using kvload::FilterConfig;
using kvload::FilterPolicy;

TEST(FilterPolicyTest, DefaultThresholds) {
    auto f = FilterPolicy::from_config(FilterConfig{});
    EXPECT_FALSE(f.is_eligible(1));
    EXPECT_FALSE(f.is_eligible(1261));
    EXPECT_TRUE(f.is_eligible(1262));
    EXPECT_FALSE(f.is_eligible(1263));
    EXPECT_FALSE(f.is_eligible(1930));
    EXPECT_TRUE(f.is_eligible(1931));
    EXPECT_TRUE(f.is_eligible(3000));
}

TEST(FilterPolicyTest, DisabledAcceptsEverything) {
    FilterConfig cfg;
    cfg.enabled = false;
    auto f = FilterPolicy::from_config(cfg);
    EXPECT_TRUE(f.is_eligible(1));
    EXPECT_TRUE(f.is_eligible(1500));
    EXPECT_EQ(f.describe(), "all ids");
}

TEST(FilterPolicyTest, NoLowerBoundKeepsOnlyIncludedIds) {
    FilterConfig cfg;
    cfg.min_id = 0;
    cfg.include_ids = {7, 42};
    auto f = FilterPolicy::from_config(cfg);
    EXPECT_TRUE(f.is_eligible(7));
    EXPECT_TRUE(f.is_eligible(42));
    EXPECT_FALSE(f.is_eligible(1262));
    EXPECT_FALSE(f.is_eligible(100000));
}

TEST(FilterPolicyTest, Describe) {
    FilterPolicy f({1262}, 1931);
    EXPECT_EQ(f.describe(), "id == 1262, id >= 1931");
    FilterPolicy none({}, std::nullopt);
    EXPECT_EQ(none.describe(), "no ids");
    EXPECT_FALSE(none.is_eligible(1931));
}
