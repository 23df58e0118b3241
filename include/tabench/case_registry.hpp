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
 * @file case_registry.hpp
 * @brief Case registry implementations.
 */

#include "case_registry.h"
#include "errors.h"
#include "operations.h"

#include <algorithm>
#include <unordered_map>

namespace tabench {

    namespace detail {

        template<typename Op>
        CaseDefinition makeCase(const char* name, const char* variant) {
            return CaseDefinition{name, variant, std::make_shared<Op>()};
        }

        inline std::string_view trim(std::string_view s) {
            while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
            while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
            return s;
        }

    } // namespace detail

    // ========================================================================
    // Registry
    // ========================================================================

    inline const std::vector<CaseDefinition>& getCoreCasesCached() {
        static const std::vector<CaseDefinition> cases = {
            detail::makeCase<GroupByMean>("groupby_mean", VARIANT_BASE),
            detail::makeCase<FilterSortTop100>("filter_sort_top100", VARIANT_BASE),
            detail::makeCase<SortTop1000>("sort_top1000", VARIANT_BASE),
            detail::makeCase<SortMultiColumnTop800>("sort_multicol_top800", VARIANT_BASE),
            detail::makeCase<ValueCountsCity>("value_counts_city", VARIANT_BASE),
            detail::makeCase<ValueCountsGroupCityTop10>("value_counts_group_city_top10", VARIANT_BASE),
            detail::makeCase<ValueCountsCityKeepNull>("value_counts_missing_city_dropna_false", VARIANT_MISSING),
            detail::makeCase<GroupByCityKeepNullMean>("groupby_missing_city_mean", VARIANT_MISSING),
            detail::makeCase<ValueCountsUserCityTop20>("value_counts_high_card_city_top20", VARIANT_HIGH_CARD),
            detail::makeCase<ValueCountsUserTop100>("value_counts_high_card_user_top100", VARIANT_HIGH_CARD)
        };
        return cases;
    }

    inline const std::vector<CaseDefinition>& getExtendedCasesCached() {
        static const std::vector<CaseDefinition> cases = [] {
            std::vector<CaseDefinition> all = getCoreCasesCached();
            all.push_back(detail::makeCase<GroupByMeanTwoKeys>("groupby_mean_2keys", VARIANT_BASE));
            all.push_back(detail::makeCase<FilterSortMultiColumnTop200>("filter_sort_multicol_top200", VARIANT_BASE));
            all.push_back(detail::makeCase<ValueCountsGroupCity>("value_counts_group_city", VARIANT_BASE));
            all.push_back(detail::makeCase<DropDuplicatesGroupCity>("drop_duplicates_group_city", VARIANT_BASE));
            all.push_back(detail::makeCase<GroupByMean>("skewed_groupby_mean", VARIANT_SKEWED));
            all.push_back(detail::makeCase<WideGroupBySum>("wide_groupby_sum", VARIANT_WIDE));
            all.push_back(detail::makeCase<WideFilterSort>("wide_filter_sort", VARIANT_WIDE));
            return all;
        }();
        return cases;
    }

    inline std::vector<std::string> getSuiteNames() {
        return { "core", "extended" };
    }

    inline const std::vector<CaseDefinition>& getSuite(std::string_view suite) {
        if (suite == "core")     return getCoreCasesCached();
        if (suite == "extended") return getExtendedCasesCached();
        throw ConfigError("Unknown suite: " + std::string(suite) + " (expected core or extended)");
    }

    inline const CaseDefinition& getCase(std::string_view name) {
        static const std::unordered_map<std::string, size_t> case_index = [] {
            std::unordered_map<std::string, size_t> index;
            const auto& all = getExtendedCasesCached();
            for (size_t i = 0; i < all.size(); ++i) {
                index.emplace(all[i].name, i);
            }
            return index;
        }();

        auto it = case_index.find(std::string(name));
        if (it != case_index.end()) {
            return getExtendedCasesCached()[it->second];
        }
        throw ConfigError("Unknown benchmark case: " + std::string(name));
    }

    inline std::vector<std::string> getCaseNames(std::string_view suite) {
        std::vector<std::string> names;
        const auto& cases = getSuite(suite);
        names.reserve(cases.size());
        for (const auto& c : cases) names.push_back(c.name);
        return names;
    }

    inline std::vector<CaseDefinition> selectCases(std::string_view suite, std::string_view filter) {
        const auto& cases = getSuite(suite);
        if (detail::trim(filter).empty()) {
            return cases;
        }

        std::vector<std::string> wanted;
        size_t start = 0;
        while (start <= filter.size()) {
            size_t comma = filter.find(',', start);
            if (comma == std::string_view::npos) comma = filter.size();
            std::string_view name = detail::trim(filter.substr(start, comma - start));
            if (!name.empty()) {
                const bool known = std::any_of(cases.begin(), cases.end(),
                                               [name](const CaseDefinition& c) { return c.name == name; });
                if (!known) {
                    throw ConfigError("Unknown benchmark case in suite '" + std::string(suite) + "': "
                                      + std::string(name));
                }
                wanted.emplace_back(name);
            }
            start = comma + 1;
        }
        // Separators only: no names given
        if (wanted.empty()) {
            return cases;
        }

        std::vector<CaseDefinition> selected;
        for (const auto& c : cases) {
            if (std::find(wanted.begin(), wanted.end(), c.name) != wanted.end()) {
                selected.push_back(c);
            }
        }
        return selected;
    }

    inline std::vector<std::string> requiredVariants(const std::vector<CaseDefinition>& cases) {
        std::vector<std::string> variants;
        for (const auto& c : cases) {
            if (std::find(variants.begin(), variants.end(), c.variant) == variants.end()) {
                variants.push_back(c.variant);
            }
        }
        return variants;
    }

} // namespace tabench
