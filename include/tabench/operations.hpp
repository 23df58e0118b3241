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
 * @file operations.hpp
 * @brief Benchmark operation implementations on top of the frame kernels.
 */

#include "operations.h"
#include "barrier.h"
#include "frame_ops.h"

#include <algorithm>
#include <utility>
#include <vector>

namespace tabench {

    namespace detail {

        // Keep computed aggregates observable so the work cannot be elided.
        inline size_t groupCount(const std::vector<GroupResult>& groups) {
            doNotOptimize(groups.data());
            return groups.size();
        }

        inline size_t topCount(const std::vector<ValueCount>& counts, size_t k) {
            doNotOptimize(counts.data());
            return std::min(k, counts.size());
        }

    } // namespace detail

    // ========================================================================
    // Core suite
    // ========================================================================

    inline std::optional<size_t> GroupByMean::apply(const Dataset& dataset) const {
        auto groups = groupBy(dataset, allRows(dataset), {Column::GROUP},
                              {{Column::VALUE, Aggregation::MEAN}, {Column::REVENUE, Aggregation::SUM}});
        return detail::groupCount(groups);
    }

    inline std::string GroupByMean::description() const {
        return "group by group; mean(value), sum(revenue)";
    }

    inline std::optional<size_t> FilterSortTop100::apply(const Dataset& dataset) const {
        RowIndex rows = filterRows(dataset, [](const Row& row) {
            return row.active && row.value > 500;
        });
        return nlargest(dataset, rows, Column::VALUE, 100).size();
    }

    inline std::string FilterSortTop100::description() const {
        return "active && value > 500; top 100 by value";
    }

    inline std::optional<size_t> SortTop1000::apply(const Dataset& dataset) const {
        return nlargest(dataset, allRows(dataset), Column::VALUE, 1000).size();
    }

    inline std::string SortTop1000::description() const {
        return "top 1000 by value";
    }

    inline std::optional<size_t> SortMultiColumnTop800::apply(const Dataset& dataset) const {
        RowIndex rows = allRows(dataset);
        sortRows(dataset, rows, {{Column::CITY, true}, {Column::VALUE, false}, {Column::ID, true}});
        return head(std::move(rows), 800).size();
    }

    inline std::string SortMultiColumnTop800::description() const {
        return "sort by city asc, value desc, id asc; first 800";
    }

    inline std::optional<size_t> ValueCountsCity::apply(const Dataset& dataset) const {
        auto counts = valueCounts(dataset, allRows(dataset), {Column::CITY}, true);
        return detail::topCount(counts, counts.size());
    }

    inline std::string ValueCountsCity::description() const {
        return "value counts by city, nulls dropped";
    }

    inline std::optional<size_t> ValueCountsGroupCityTop10::apply(const Dataset& dataset) const {
        auto counts = valueCounts(dataset, allRows(dataset), {Column::GROUP, Column::CITY}, true);
        return detail::topCount(counts, 10);
    }

    inline std::string ValueCountsGroupCityTop10::description() const {
        return "value counts by (group, city); top 10";
    }

    inline std::optional<size_t> ValueCountsCityKeepNull::apply(const Dataset& dataset) const {
        auto counts = valueCounts(dataset, allRows(dataset), {Column::CITY}, false);
        return detail::topCount(counts, counts.size());
    }

    inline std::string ValueCountsCityKeepNull::description() const {
        return "value counts by city, null is its own bucket";
    }

    inline std::optional<size_t> GroupByCityKeepNullMean::apply(const Dataset& dataset) const {
        GroupOptions options;
        options.dropna = false;
        auto groups = groupBy(dataset, allRows(dataset), {Column::CITY},
                              {{Column::VALUE, Aggregation::MEAN}}, options);
        return detail::groupCount(groups);
    }

    inline std::string GroupByCityKeepNullMean::description() const {
        return "group by city including null; mean(value)";
    }

    inline std::optional<size_t> ValueCountsUserCityTop20::apply(const Dataset& dataset) const {
        auto counts = valueCounts(dataset, allRows(dataset), {Column::USER_KEY, Column::CITY}, true);
        return detail::topCount(counts, 20);
    }

    inline std::string ValueCountsUserCityTop20::description() const {
        return "value counts by (user_key, city); top 20";
    }

    inline std::optional<size_t> ValueCountsUserTop100::apply(const Dataset& dataset) const {
        auto counts = valueCounts(dataset, allRows(dataset), {Column::USER_KEY}, true);
        return detail::topCount(counts, 100);
    }

    inline std::string ValueCountsUserTop100::description() const {
        return "value counts by user_key; top 100";
    }

    // ========================================================================
    // Extended suite
    // ========================================================================

    inline std::optional<size_t> GroupByMeanTwoKeys::apply(const Dataset& dataset) const {
        GroupOptions options;
        options.sort = true;
        auto groups = groupBy(dataset, allRows(dataset), {Column::GROUP, Column::CITY},
                              {{Column::VALUE, Aggregation::MEAN}, {Column::REVENUE, Aggregation::SUM}},
                              options);
        return detail::groupCount(groups);
    }

    inline std::string GroupByMeanTwoKeys::description() const {
        return "group by (group, city), sorted; mean(value), sum(revenue)";
    }

    inline std::optional<size_t> FilterSortMultiColumnTop200::apply(const Dataset& dataset) const {
        RowIndex rows = filterRows(dataset, [](const Row& row) { return row.value > 300; });
        sortRows(dataset, rows, {{Column::GROUP, true}, {Column::VALUE, false}, {Column::ID, true}});
        return head(std::move(rows), 200).size();
    }

    inline std::string FilterSortMultiColumnTop200::description() const {
        return "value > 300; sort by group asc, value desc, id asc; first 200";
    }

    inline std::optional<size_t> ValueCountsGroupCity::apply(const Dataset& dataset) const {
        auto counts = valueCounts(dataset, allRows(dataset), {Column::GROUP, Column::CITY}, true);
        return detail::topCount(counts, counts.size());
    }

    inline std::string ValueCountsGroupCity::description() const {
        return "value counts by (group, city)";
    }

    inline std::optional<size_t> DropDuplicatesGroupCity::apply(const Dataset& dataset) const {
        return dropDuplicates(dataset, allRows(dataset), {Column::GROUP, Column::CITY}).size();
    }

    inline std::string DropDuplicatesGroupCity::description() const {
        return "drop duplicates on (group, city), keep first";
    }

    inline std::optional<size_t> WideGroupBySum::apply(const Dataset& dataset) const {
        GroupOptions options;
        options.sort = true;
        auto groups = groupBy(dataset, allRows(dataset), {Column::GROUP, Column::SEGMENT},
                              {{Column::EXTRA_1, Aggregation::SUM},
                               {Column::EXTRA_2, Aggregation::MEAN},
                               {Column::REVENUE, Aggregation::SUM}},
                              options);
        return detail::groupCount(groups);
    }

    inline std::string WideGroupBySum::description() const {
        return "group by (group, segment), sorted; sum(extra_1), mean(extra_2), sum(revenue)";
    }

    inline std::optional<size_t> WideFilterSort::apply(const Dataset& dataset) const {
        RowIndex rows = filterRows(dataset, [](const Row& row) {
            return row.extra[4] > 10 && row.revenue > 900.0;
        });
        sortRows(dataset, rows, {{Column::EXTRA_7, false}, {Column::REVENUE, false}});
        return head(std::move(rows), 150).size();
    }

    inline std::string WideFilterSort::description() const {
        return "extra_4 > 10 && revenue > 900; sort by extra_7 desc, revenue desc; first 150";
    }

} // namespace tabench
