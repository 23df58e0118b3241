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
 * @file dataset.hpp
 * @brief Dataset synthesizer implementations.
 */

#include "dataset.h"
#include "errors.h"

#include <array>
#include <charconv>
#include <cmath>
#include <system_error>
#include <utility>

namespace tabench {

    // ========================================================================
    // Row cell access
    // ========================================================================

    inline CellValue cellValue(const Row& row, Column column) {
        switch (column) {
            case Column::ID:          return static_cast<int64_t>(row.id);
            case Column::GROUP:       return row.group;
            case Column::CITY:        return row.city ? CellValue{*row.city} : CellValue{};
            case Column::SEGMENT:     return row.segment ? CellValue{*row.segment} : CellValue{};
            case Column::VALUE:       return static_cast<int64_t>(row.value);
            case Column::WEIGHT:      return row.weight;
            case Column::REVENUE:     return row.revenue;
            case Column::ACTIVE:      return row.active;
            case Column::BUCKET:      return row.bucket;
            case Column::USER_KEY:    return std::string_view(row.user_key);
            case Column::SESSION_KEY: return std::string_view(row.session_key);
            default:
                return static_cast<int64_t>(row.extra[extraIndex(column)]);
        }
    }

    inline std::string DatasetOptions::describe() const {
        std::string out;
        auto add = [&out](const char* flag) {
            if (!out.empty()) out += '+';
            out += flag;
        };
        if (skew)             add("skew");
        if (wide)             add("wide");
        if (high_cardinality) add("high_card");
        if (include_missing)  add("missing");
        return out.empty() ? "none" : out;
    }

    inline Dataset::Dataset(std::string variant, const DatasetOptions& options, std::vector<Row> rows)
        : variant_(std::move(variant))
        , options_(options)
        , rows_(std::move(rows))
    {}

    // ========================================================================
    // Synthesizer
    // ========================================================================

    inline double roundTo2(double x) {
        // Fixed-precision to_chars is correctly rounded on the exact binary
        // value, which matches the decimal rounding of the paired harnesses.
        std::array<char, 64> buf{};
        auto [end, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), x,
                                       std::chars_format::fixed, 2);
        double rounded = 0.0;
        if (ec == std::errc{}
            && std::from_chars(buf.data(), end, rounded).ec == std::errc{}) {
            return rounded;
        }
        return std::round(x * 100.0) / 100.0;
    }

    inline std::string_view bucketFor(int32_t value) {
        if (value > BUCKET_HIGH_ABOVE) return "high";
        if (value > BUCKET_MID_ABOVE)  return "mid";
        return "low";
    }

    inline Dataset buildDataset(size_t rowCount, const DatasetOptions& options, std::string variant) {
        Lcg rnd(options.seed);
        std::vector<Row> rows;
        rows.reserve(rowCount);

        for (size_t i = 0; i < rowCount; ++i) {
            Row row;
            row.id      = static_cast<int64_t>(i);
            row.value   = static_cast<int32_t>(rnd.next() * VALUE_RANGE);
            row.weight  = roundTo2(rnd.next() * 5.0 + 0.5);
            row.revenue = roundTo2(static_cast<double>(row.value) * row.weight);
            row.bucket  = bucketFor(row.value);

            if (options.skew && (i % SKEW_BLOCK) < SKEW_HEAD) {
                row.group = GROUPS[0];
            } else {
                row.group = GROUPS[i % GROUP_COUNT];
            }

            if (!(options.include_missing && i % MISSING_CITY_PERIOD == 0)) {
                row.city = CITIES[i % CITY_COUNT];
            }
            if (!(options.include_missing && i % MISSING_SEGMENT_PERIOD == 0)) {
                row.segment = SEGMENTS[i % SEGMENT_COUNT];
            }

            row.active = (i % 3 == 0);

            if (options.high_cardinality) {
                row.user_key    = "u_" + std::to_string(i);
                row.session_key = "s_" + std::to_string(i * SESSION_KEY_STRIDE);
            } else {
                row.user_key    = "u_" + std::to_string(i % USER_KEY_CYCLE);
                row.session_key = "s_" + std::to_string(i % SESSION_KEY_CYCLE);
            }

            if (options.wide) {
                for (size_t k = 0; k < WIDE_EXTRA_COLUMNS; ++k) {
                    row.extra[k] = (row.value + static_cast<int32_t>(k)) % (50 + static_cast<int32_t>(k));
                }
            }

            rows.push_back(std::move(row));
        }

        return Dataset(std::move(variant), options, std::move(rows));
    }

    // ========================================================================
    // Variants
    // ========================================================================

    inline std::vector<std::string> getVariantNames() {
        return { VARIANT_BASE, VARIANT_HIGH_CARD, VARIANT_MISSING, VARIANT_SKEWED, VARIANT_WIDE };
    }

    inline DatasetOptions variantOptions(std::string_view variant) {
        DatasetOptions options;
        if (variant == VARIANT_BASE) {
            return options;
        } else if (variant == VARIANT_HIGH_CARD) {
            options.high_cardinality = true;
        } else if (variant == VARIANT_MISSING) {
            options.include_missing = true;
        } else if (variant == VARIANT_SKEWED) {
            options.skew = true;
        } else if (variant == VARIANT_WIDE) {
            options.wide = true;
        } else {
            throw ConfigError("Unknown dataset variant: " + std::string(variant));
        }
        return options;
    }

    inline Dataset buildVariant(std::string_view variant, size_t rowCount) {
        return buildDataset(rowCount, variantOptions(variant), std::string(variant));
    }

} // namespace tabench
