/*
 * Copyright (c) 2026 The TABENCH Authors
 * 
 * This file is part of the TABENCH project.
 * 
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

#include <tabench/tabench.h>

#include <gtest/gtest.h>

#include <map>
#include <string>
#include <utility>

using namespace tabench;

namespace {

struct Expectation {
    const char* case_name;
    size_t      rows;
    size_t      result;
};

class OperationsTest : public ::testing::TestWithParam<Expectation> {
protected:
    static const Dataset& variant(const std::string& name, size_t rows) {
        static std::map<std::pair<std::string, size_t>, Dataset> cache;
        auto key = std::make_pair(name, rows);
        auto it = cache.find(key);
        if (it == cache.end()) {
            it = cache.emplace(key, buildVariant(name, rows)).first;
        }
        return it->second;
    }
};

} // namespace

TEST_P(OperationsTest, ResultCardinality) {
    const Expectation& e = GetParam();
    const CaseDefinition& def = getCase(e.case_name);
    const Dataset& ds = variant(def.variant, e.rows);

    const auto result = def.operation->apply(ds);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, e.result) << def.name << " on " << def.variant << " x" << e.rows;

    // Repeated invocation sees the same untouched dataset
    EXPECT_EQ(def.operation->apply(ds), result);
    EXPECT_FALSE(def.operation->description().empty());
}

INSTANTIATE_TEST_SUITE_P(CoreSuite, OperationsTest, ::testing::Values(
    Expectation{"groupby_mean",                            1000,   6},
    Expectation{"filter_sort_top100",                      1000, 100},
    Expectation{"filter_sort_top100",                       100,  16},
    Expectation{"sort_top1000",                            1000, 1000},
    Expectation{"sort_top1000",                             100, 100},
    Expectation{"sort_multicol_top800",                    1000, 800},
    Expectation{"sort_multicol_top800",                     100, 100},
    Expectation{"value_counts_city",                        100,   5},
    Expectation{"value_counts_city",                       1000,   5},
    Expectation{"value_counts_group_city_top10",           1000,  10},
    Expectation{"value_counts_missing_city_dropna_false",  1000,   6},
    Expectation{"groupby_missing_city_mean",               1000,   6},
    Expectation{"value_counts_high_card_city_top20",       1000,  20},
    Expectation{"value_counts_high_card_user_top100",      1000, 100}
));

INSTANTIATE_TEST_SUITE_P(ExtendedSuite, OperationsTest, ::testing::Values(
    Expectation{"groupby_mean_2keys",           1000,  30},
    Expectation{"filter_sort_multicol_top200",  1000, 200},
    Expectation{"filter_sort_multicol_top200",   100,  71},
    Expectation{"value_counts_group_city",      1000,  30},
    Expectation{"drop_duplicates_group_city",   1000,  30},
    Expectation{"skewed_groupby_mean",          1000,   6},
    Expectation{"wide_groupby_sum",             1000,   6},
    Expectation{"wide_filter_sort",             1000, 150},
    Expectation{"wide_filter_sort",              100,  50}
));

TEST(OperationsEdgeTest, EmptyDatasetYieldsZeroNotAbsent) {
    const Dataset empty = buildVariant(VARIANT_BASE, 0);
    for (const auto& def : getExtendedCasesCached()) {
        const auto result = def.operation->apply(empty);
        ASSERT_TRUE(result.has_value()) << def.name;
        EXPECT_EQ(*result, 0u) << def.name;
    }
}

TEST(OperationsEdgeTest, MissingCityCountsIncludeNullBucket) {
    const Dataset ds = buildVariant(VARIANT_MISSING, 1000);
    auto counts = valueCounts(ds, allRows(ds), {Column::CITY}, false);
    ASSERT_EQ(counts.size(), 6u);
    size_t total = 0;
    size_t nulls = 0;
    for (const auto& c : counts) {
        total += c.count;
        if (isNull(c.key[0])) nulls = c.count;
    }
    EXPECT_EQ(total, 1000u);
    EXPECT_EQ(nulls, 44u);
}
