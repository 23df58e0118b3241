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
 * @file dataset.h
 * @brief Synthetic benchmark dataset: Row, DatasetOptions, Dataset, variants.
 *
 * A dataset is built once from (rowCount, options) and never modified
 * afterwards. Building twice with the same arguments yields identical rows:
 * the generator is re-seeded for every build.
 *
 * Named variants:
 *   base       no flags
 *   high_card  near-unique user_key / session_key
 *   missing    nulls injected into city (id % 23 == 0) and segment (id % 31 == 0)
 *   skewed     70 of every 100 rows in group "A"
 *   wide       extra_0..extra_9 derived integer columns
 */

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "column.h"
#include "definitions.h"
#include "lcg.h"

namespace tabench {

    inline constexpr std::array<std::string_view, GROUP_COUNT> GROUPS = {
        "A", "B", "C", "D", "E", "F"
    };

    inline constexpr std::array<std::string_view, CITY_COUNT> CITIES = {
        "Austin", "Seattle", "Boston", "Denver", "Miami"
    };

    inline constexpr std::array<std::string_view, SEGMENT_COUNT> SEGMENTS = {
        "consumer", "enterprise", "startup"
    };

    /// One synthetic record. Categorical columns point into the static
    /// vocabularies above; only the key columns own their storage.
    struct Row {
        int64_t                                     id = 0;
        std::string_view                            group;
        std::optional<std::string_view>             city;       // nullopt = missing
        std::optional<std::string_view>             segment;    // nullopt = missing
        int32_t                                     value = 0;
        double                                      weight = 0.0;
        double                                      revenue = 0.0;
        bool                                        active = false;
        std::string_view                            bucket;
        std::string                                 user_key;
        std::string                                 session_key;
        std::array<int32_t, WIDE_EXTRA_COLUMNS>     extra{};    // zero unless wide

        bool operator==(const Row& other) const = default;
    };

    /// Cell value for generic column access; std::monostate is a null cell.
    using CellValue = std::variant<std::monostate, bool, int64_t, double, std::string_view>;

    CellValue cellValue(const Row& row, Column column);

    struct DatasetOptions {
        bool        skew             = false;
        bool        wide             = false;
        bool        high_cardinality = false;
        bool        include_missing  = false;
        uint32_t    seed             = DEFAULT_SEED;

        bool operator==(const DatasetOptions& other) const = default;

        /// Compact flag summary, e.g. "skew+wide" or "none"
        std::string describe() const;
    };

    class Dataset {
        std::string         variant_;
        DatasetOptions      options_;
        std::vector<Row>    rows_;

    public:
        using const_iterator = std::vector<Row>::const_iterator;

        Dataset(std::string variant, const DatasetOptions& options, std::vector<Row> rows);

        const std::string&      variant() const     { return variant_; }
        const DatasetOptions&   options() const     { return options_; }
        size_t                  rowCount() const    { return rows_.size(); }
        bool                    empty() const       { return rows_.empty(); }
        const Row&              row(size_t index) const { return rows_.at(index); }
        const std::vector<Row>& rows() const        { return rows_; }
        const_iterator          begin() const       { return rows_.begin(); }
        const_iterator          end() const         { return rows_.end(); }
        std::vector<Column>     columns() const     { return schemaColumns(options_.wide); }

        bool operator==(const Dataset& other) const = default;
    };

    // ── Synthesizer ────────────────────────────────────────────────────

    /// round(x, 2), correctly rounded on the exact binary value of x
    double roundTo2(double x);

    /// "high" if value > 700, "mid" if value > 350, else "low"
    std::string_view bucketFor(int32_t value);

    Dataset buildDataset(size_t rowCount, const DatasetOptions& options = {},
                         std::string variant = "custom");

    // ── Variants ───────────────────────────────────────────────────────

    std::vector<std::string> getVariantNames();
    DatasetOptions variantOptions(std::string_view variant);
    Dataset buildVariant(std::string_view variant, size_t rowCount);

} // namespace tabench
