/*
 * Copyright (c) 2026 The TABENCH Authors
 * 
 * This file is part of the TABENCH project.
 * 
 * Licensed under the MIT License. See LICENSE file in the project root 
 * for full license information.
 */

#pragma once

/**
 * @file frame_ops.h
 * @brief Reference query kernels over a Dataset.
 *
 * These are the native implementations behind the benchmark cases: filtering,
 * stable multi-column sorting, top-k selection, hash grouping with simple
 * aggregates, value counts and duplicate removal.
 *
 * All kernels work on selection vectors (RowIndex: positions into the
 * dataset) and never touch the dataset itself. Conventions:
 *   - sorting is stable and places nulls last in either direction
 *   - nlargest() breaks ties by original position (first occurrence wins)
 *   - valueCounts() orders buckets by count descending, ties in first-appearance order
 *   - groupBy() keeps first-appearance order unless sorting by key is requested
 *
 * Keys returned in ValueCount / GroupResult are views into the dataset and the
 * static vocabularies, valid as long as the dataset lives.
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "column.h"
#include "dataset.h"

namespace tabench {

    using RowIndex = std::vector<size_t>;

    struct SortKey {
        Column column;
        bool   ascending = true;
    };

    enum class Aggregation : uint8_t {
        SUM,
        MEAN,
        COUNT
    };

    struct AggregateSpec {
        Column      column;
        Aggregation kind;
    };

    struct GroupOptions {
        bool dropna   = true;   // drop rows with a null in any key column
        bool sort     = false;  // order groups by key instead of first appearance
    };

    struct ValueCount {
        std::vector<CellValue>  key;
        size_t                  count = 0;
    };

    struct GroupResult {
        std::vector<CellValue>  key;
        size_t                  rows = 0;
        std::vector<double>     values;     // one per AggregateSpec, in request order
    };

    // ── Cell helpers ───────────────────────────────────────────────────

    bool isNull(const CellValue& value);

    /// Three-way compare of two non-null cells of the same column.
    int compareCells(const CellValue& lhs, const CellValue& rhs);

    /// Numeric view of a bool/int/real cell; throws std::invalid_argument otherwise.
    double numericValue(const CellValue& value);

    /// Hashable encoding of the key columns of a row. Null and empty string encode differently.
    std::string encodeKey(const Row& row, const std::vector<Column>& columns);

    // ── Selection ──────────────────────────────────────────────────────

    RowIndex allRows(const Dataset& dataset);

    template<typename Predicate>
    RowIndex filterRows(const Dataset& dataset, Predicate&& predicate);

    RowIndex head(RowIndex rows, size_t n);

    // ── Ordering ───────────────────────────────────────────────────────

    void sortRows(const Dataset& dataset, RowIndex& rows, const std::vector<SortKey>& keys);

    /// The k rows with the largest value in column, largest first.
    RowIndex nlargest(const Dataset& dataset, const RowIndex& rows, Column column, size_t k);

    // ── Grouping ───────────────────────────────────────────────────────

    std::vector<ValueCount> valueCounts(const Dataset& dataset, const RowIndex& rows,
                                        const std::vector<Column>& subset, bool dropna = true);

    std::vector<GroupResult> groupBy(const Dataset& dataset, const RowIndex& rows,
                                     const std::vector<Column>& keys,
                                     const std::vector<AggregateSpec>& aggregates,
                                     const GroupOptions& options = {});

    /// First row of every distinct key combination, in original order. Nulls form their own key.
    RowIndex dropDuplicates(const Dataset& dataset, const RowIndex& rows, const std::vector<Column>& subset);

} // namespace tabench
