// Copyright (c) 2026 The TABENCH Authors
// SPDX-License-Identifier: MIT

#include <tabench/tabench.h>

#include <gtest/gtest.h>

#include <optional>
#include <string_view>
#include <vector>

using namespace tabench;

namespace {

Row makeRow(int64_t id, std::string_view group, std::optional<std::string_view> city, int32_t value) {
    Row row;
    row.id      = id;
    row.group   = group;
    row.city    = city;
    row.segment = "consumer";
    row.value   = value;
    row.weight  = 1.0;
    row.revenue = static_cast<double>(value);
    row.active  = (id % 2 == 0);
    row.bucket  = bucketFor(value);
    row.user_key    = "u_" + std::to_string(id % 3);
    row.session_key = "s_" + std::to_string(id);
    return row;
}

// id group city     value
//  0   A   Austin    5
//  1   B   (null)    9
//  2   A   Boston    9
//  3   B   Austin    1
//  4   A   (null)    9
//  5   C   Boston    4
//  6   A   Boston    7
Dataset smallFrame() {
    std::vector<Row> rows;
    rows.push_back(makeRow(0, "A", "Austin", 5));
    rows.push_back(makeRow(1, "B", std::nullopt, 9));
    rows.push_back(makeRow(2, "A", "Boston", 9));
    rows.push_back(makeRow(3, "B", "Austin", 1));
    rows.push_back(makeRow(4, "A", std::nullopt, 9));
    rows.push_back(makeRow(5, "C", "Boston", 4));
    rows.push_back(makeRow(6, "A", "Boston", 7));
    DatasetOptions options;
    options.include_missing = true;
    return Dataset("small", options, std::move(rows));
}

std::string_view text(const CellValue& cell) {
    return std::get<std::string_view>(cell);
}

} // namespace

// ── Cell helpers ───────────────────────────────────────────────────

TEST(FrameOpsTest, CompareCells) {
    EXPECT_LT(compareCells(CellValue{int64_t{1}}, CellValue{int64_t{2}}), 0);
    EXPECT_GT(compareCells(CellValue{std::string_view("b")}, CellValue{std::string_view("a")}), 0);
    EXPECT_EQ(compareCells(CellValue{2.5}, CellValue{2.5}), 0);
    EXPECT_TRUE(isNull(CellValue{}));
    EXPECT_FALSE(isNull(CellValue{false}));
}

TEST(FrameOpsTest, NumericValueRejectsText) {
    EXPECT_DOUBLE_EQ(numericValue(CellValue{int64_t{7}}), 7.0);
    EXPECT_DOUBLE_EQ(numericValue(CellValue{true}), 1.0);
    EXPECT_THROW(numericValue(CellValue{std::string_view("x")}), std::invalid_argument);
    EXPECT_THROW(numericValue(CellValue{}), std::invalid_argument);
}

TEST(FrameOpsTest, EncodeKeySeparatesNullFromEmpty) {
    Row withNull = makeRow(0, "", std::nullopt, 1);
    Row withEmpty = makeRow(0, "", std::string_view(""), 1);
    EXPECT_NE(encodeKey(withNull, {Column::CITY}), encodeKey(withEmpty, {Column::CITY}));

    // Column boundaries are part of the key
    Row ab = makeRow(0, "AB", std::string_view("C"), 1);
    Row a  = makeRow(0, "A", std::string_view("BC"), 1);
    EXPECT_NE(encodeKey(ab, {Column::GROUP, Column::CITY}), encodeKey(a, {Column::GROUP, Column::CITY}));
}

// ── Selection ──────────────────────────────────────────────────────

TEST(FrameOpsTest, FilterAndHead) {
    const Dataset ds = smallFrame();
    RowIndex rows = filterRows(ds, [](const Row& r) { return r.value > 4; });
    EXPECT_EQ(rows, (RowIndex{0, 1, 2, 4, 6}));
    EXPECT_EQ(head(rows, 2), (RowIndex{0, 1}));
    EXPECT_EQ(head(rows, 100).size(), 5u);
    EXPECT_TRUE(head(rows, 0).empty());
}

// ── Ordering ───────────────────────────────────────────────────────

TEST(FrameOpsTest, NlargestBreaksTiesByPosition) {
    const Dataset ds = smallFrame();
    EXPECT_EQ(nlargest(ds, allRows(ds), Column::VALUE, 2), (RowIndex{1, 2}));
    EXPECT_EQ(nlargest(ds, allRows(ds), Column::VALUE, 4), (RowIndex{1, 2, 4, 6}));
    EXPECT_EQ(nlargest(ds, allRows(ds), Column::VALUE, 100), (RowIndex{1, 2, 4, 6, 0, 5, 3}));
    EXPECT_TRUE(nlargest(ds, allRows(ds), Column::VALUE, 0).empty());
}

TEST(FrameOpsTest, NlargestOnSubset) {
    const Dataset ds = smallFrame();
    EXPECT_EQ(nlargest(ds, RowIndex{6, 5, 4}, Column::VALUE, 2), (RowIndex{4, 6}));
}

TEST(FrameOpsTest, MultiColumnSortPutsNullsLast) {
    const Dataset ds = smallFrame();
    RowIndex rows = allRows(ds);
    sortRows(ds, rows, {{Column::CITY, true}, {Column::VALUE, false}, {Column::ID, true}});
    // Austin(5,1) Boston(9,7,4) then nulls (9,9 by id)
    EXPECT_EQ(rows, (RowIndex{0, 3, 2, 6, 5, 1, 4}));

    RowIndex desc = allRows(ds);
    sortRows(ds, desc, {{Column::CITY, false}});
    // Stable: equal keys keep input order, nulls still last
    EXPECT_EQ(desc, (RowIndex{2, 5, 6, 0, 3, 1, 4}));
}

// ── Grouping ───────────────────────────────────────────────────────

TEST(FrameOpsTest, ValueCountsDropsNulls) {
    const Dataset ds = smallFrame();
    auto counts = valueCounts(ds, allRows(ds), {Column::CITY});
    ASSERT_EQ(counts.size(), 2u);
    EXPECT_EQ(text(counts[0].key[0]), "Boston");
    EXPECT_EQ(counts[0].count, 3u);
    EXPECT_EQ(text(counts[1].key[0]), "Austin");
    EXPECT_EQ(counts[1].count, 2u);
}

TEST(FrameOpsTest, ValueCountsKeepsNullBucket) {
    const Dataset ds = smallFrame();
    auto counts = valueCounts(ds, allRows(ds), {Column::CITY}, false);
    ASSERT_EQ(counts.size(), 3u);
    EXPECT_EQ(text(counts[0].key[0]), "Boston");
    // Austin and null tie at 2; Austin appeared first
    EXPECT_EQ(text(counts[1].key[0]), "Austin");
    EXPECT_TRUE(isNull(counts[2].key[0]));
    EXPECT_EQ(counts[2].count, 2u);
}

TEST(FrameOpsTest, ValueCountsMultiColumn) {
    const Dataset ds = smallFrame();
    auto counts = valueCounts(ds, allRows(ds), {Column::GROUP, Column::CITY});
    ASSERT_EQ(counts.size(), 4u);
    EXPECT_EQ(text(counts[0].key[0]), "A");
    EXPECT_EQ(text(counts[0].key[1]), "Boston");
    EXPECT_EQ(counts[0].count, 2u);
}

TEST(FrameOpsTest, GroupByAggregates) {
    const Dataset ds = smallFrame();
    auto groups = groupBy(ds, allRows(ds), {Column::GROUP},
                          {{Column::VALUE, Aggregation::MEAN},
                           {Column::REVENUE, Aggregation::SUM},
                           {Column::VALUE, Aggregation::COUNT}});
    ASSERT_EQ(groups.size(), 3u);

    EXPECT_EQ(text(groups[0].key[0]), "A");
    EXPECT_EQ(groups[0].rows, 4u);
    EXPECT_DOUBLE_EQ(groups[0].values[0], 7.5);
    EXPECT_DOUBLE_EQ(groups[0].values[1], 30.0);
    EXPECT_DOUBLE_EQ(groups[0].values[2], 4.0);

    EXPECT_EQ(text(groups[1].key[0]), "B");
    EXPECT_DOUBLE_EQ(groups[1].values[0], 5.0);
    EXPECT_EQ(text(groups[2].key[0]), "C");
}

TEST(FrameOpsTest, GroupByNullKeyHandling) {
    const Dataset ds = smallFrame();
    auto dropped = groupBy(ds, allRows(ds), {Column::CITY}, {{Column::VALUE, Aggregation::MEAN}});
    EXPECT_EQ(dropped.size(), 2u);

    GroupOptions keep;
    keep.dropna = false;
    auto kept = groupBy(ds, allRows(ds), {Column::CITY}, {{Column::VALUE, Aggregation::MEAN}}, keep);
    ASSERT_EQ(kept.size(), 3u);
    // first-appearance order: Austin, null, Boston
    EXPECT_TRUE(isNull(kept[1].key[0]));
    EXPECT_DOUBLE_EQ(kept[1].values[0], 9.0);

    keep.sort = true;
    auto sorted = groupBy(ds, allRows(ds), {Column::CITY}, {{Column::VALUE, Aggregation::MEAN}}, keep);
    ASSERT_EQ(sorted.size(), 3u);
    EXPECT_EQ(text(sorted[0].key[0]), "Austin");
    EXPECT_EQ(text(sorted[1].key[0]), "Boston");
    EXPECT_TRUE(isNull(sorted[2].key[0]));
}

TEST(FrameOpsTest, DropDuplicatesKeepsFirst) {
    const Dataset ds = smallFrame();
    EXPECT_EQ(dropDuplicates(ds, allRows(ds), {Column::GROUP}), (RowIndex{0, 1, 5}));
    // null city is its own key
    EXPECT_EQ(dropDuplicates(ds, allRows(ds), {Column::CITY}), (RowIndex{0, 1, 2}));
    EXPECT_EQ(dropDuplicates(ds, allRows(ds), {Column::GROUP, Column::CITY}).size(), 6u);
}
