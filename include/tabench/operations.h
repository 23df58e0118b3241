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
 * @file operations.h
 * @brief Concrete benchmark operations, one per registered case.
 *
 * Core cases (compatibility surface, see case_registry.h):
 *   GroupByMean                      groupby(group) -> mean(value), sum(revenue)
 *   FilterSortTop100                 active && value > 500, nlargest(100, value)
 *   SortTop1000                      nlargest(1000, value)
 *   SortMultiColumnTop800            sort(city asc, value desc, id asc).head(800)
 *   ValueCountsCity                  value_counts(city), nulls dropped
 *   ValueCountsGroupCityTop10        value_counts(group, city).head(10)
 *   ValueCountsCityKeepNull          value_counts(city), null is a bucket
 *   GroupByCityKeepNullMean          groupby(city, dropna=false) -> mean(value)
 *   ValueCountsUserCityTop20         value_counts(user_key, city).head(20)
 *   ValueCountsUserTop100            value_counts(user_key).head(100)
 *
 * Extended cases:
 *   GroupByMeanTwoKeys               groupby(group, city, sorted) -> mean(value), sum(revenue)
 *   FilterSortMultiColumnTop200      value > 300, sort(group asc, value desc, id asc).head(200)
 *   ValueCountsGroupCity             value_counts(group, city)
 *   DropDuplicatesGroupCity          drop_duplicates(group, city, keep=first)
 *   WideGroupBySum                   groupby(group, segment, sorted) -> sum(extra_1), mean(extra_2), sum(revenue)
 *   WideFilterSort                   extra_4 > 10 && revenue > 900, sort(extra_7 desc, revenue desc).head(150)
 */

#include <cstddef>
#include <optional>
#include <string>

#include "operation.h"

namespace tabench {

    class GroupByMean : public Operation {
    public:
        std::optional<size_t> apply(const Dataset& dataset) const override;
        std::string description() const override;
    };

    class FilterSortTop100 : public Operation {
    public:
        std::optional<size_t> apply(const Dataset& dataset) const override;
        std::string description() const override;
    };

    class SortTop1000 : public Operation {
    public:
        std::optional<size_t> apply(const Dataset& dataset) const override;
        std::string description() const override;
    };

    class SortMultiColumnTop800 : public Operation {
    public:
        std::optional<size_t> apply(const Dataset& dataset) const override;
        std::string description() const override;
    };

    class ValueCountsCity : public Operation {
    public:
        std::optional<size_t> apply(const Dataset& dataset) const override;
        std::string description() const override;
    };

    class ValueCountsGroupCityTop10 : public Operation {
    public:
        std::optional<size_t> apply(const Dataset& dataset) const override;
        std::string description() const override;
    };

    class ValueCountsCityKeepNull : public Operation {
    public:
        std::optional<size_t> apply(const Dataset& dataset) const override;
        std::string description() const override;
    };

    class GroupByCityKeepNullMean : public Operation {
    public:
        std::optional<size_t> apply(const Dataset& dataset) const override;
        std::string description() const override;
    };

    class ValueCountsUserCityTop20 : public Operation {
    public:
        std::optional<size_t> apply(const Dataset& dataset) const override;
        std::string description() const override;
    };

    class ValueCountsUserTop100 : public Operation {
    public:
        std::optional<size_t> apply(const Dataset& dataset) const override;
        std::string description() const override;
    };

    // ── Extended suite ─────────────────────────────────────────────────

    class GroupByMeanTwoKeys : public Operation {
    public:
        std::optional<size_t> apply(const Dataset& dataset) const override;
        std::string description() const override;
    };

    class FilterSortMultiColumnTop200 : public Operation {
    public:
        std::optional<size_t> apply(const Dataset& dataset) const override;
        std::string description() const override;
    };

    class ValueCountsGroupCity : public Operation {
    public:
        std::optional<size_t> apply(const Dataset& dataset) const override;
        std::string description() const override;
    };

    class DropDuplicatesGroupCity : public Operation {
    public:
        std::optional<size_t> apply(const Dataset& dataset) const override;
        std::string description() const override;
    };

    class WideGroupBySum : public Operation {
    public:
        std::optional<size_t> apply(const Dataset& dataset) const override;
        std::string description() const override;
    };

    class WideFilterSort : public Operation {
    public:
        std::optional<size_t> apply(const Dataset& dataset) const override;
        std::string description() const override;
    };

} // namespace tabench
