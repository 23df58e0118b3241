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
 * @file column.h
 * @brief Column identifiers and types of the synthetic row schema.
 *
 * The schema is fixed: 11 base columns, followed by extra_0..extra_9 when a
 * dataset is built in wide mode. Columns are addressed by enum rather than by
 * name on the hot path; names are only needed for CSV headers and the CLI.
 */

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "definitions.h"

namespace tabench {

    enum class ColumnType : uint8_t {
        BOOL,
        INT,
        REAL,
        STRING
    };

    enum class Column : uint8_t {
        ID = 0,
        GROUP,
        CITY,
        SEGMENT,
        VALUE,
        WEIGHT,
        REVENUE,
        ACTIVE,
        BUCKET,
        USER_KEY,
        SESSION_KEY,
        EXTRA_0,    // EXTRA_0 + k addresses extra_k
        EXTRA_1,
        EXTRA_2,
        EXTRA_3,
        EXTRA_4,
        EXTRA_5,
        EXTRA_6,
        EXTRA_7,
        EXTRA_8,
        EXTRA_9
    };

    constexpr size_t BASE_COLUMN_COUNT = static_cast<size_t>(Column::EXTRA_0);
    constexpr size_t MAX_COLUMN_COUNT  = BASE_COLUMN_COUNT + WIDE_EXTRA_COLUMNS;

    constexpr bool isExtra(Column column) {
        return static_cast<size_t>(column) >= BASE_COLUMN_COUNT;
    }

    constexpr size_t extraIndex(Column column) {
        return static_cast<size_t>(column) - BASE_COLUMN_COUNT;
    }

    constexpr Column extraColumn(size_t k) {
        return static_cast<Column>(BASE_COLUMN_COUNT + k);
    }

    constexpr ColumnType columnType(Column column) {
        switch (column) {
            case Column::ACTIVE:      return ColumnType::BOOL;
            case Column::WEIGHT:
            case Column::REVENUE:     return ColumnType::REAL;
            case Column::GROUP:
            case Column::CITY:
            case Column::SEGMENT:
            case Column::BUCKET:
            case Column::USER_KEY:
            case Column::SESSION_KEY: return ColumnType::STRING;
            default:                  return ColumnType::INT;
        }
    }

    /// Only city and segment may hold nulls (missing-value mode).
    constexpr bool isNullable(Column column) {
        return column == Column::CITY || column == Column::SEGMENT;
    }

    inline std::string columnName(Column column) {
        static const std::array<const char*, BASE_COLUMN_COUNT> names = {
            "id", "group", "city", "segment", "value", "weight",
            "revenue", "active", "bucket", "user_key", "session_key"
        };
        if (isExtra(column)) {
            return "extra_" + std::to_string(extraIndex(column));
        }
        return names[static_cast<size_t>(column)];
    }

    inline std::string_view columnTypeName(ColumnType type) {
        switch (type) {
            case ColumnType::BOOL:   return "bool";
            case ColumnType::INT:    return "int";
            case ColumnType::REAL:   return "real";
            case ColumnType::STRING: return "string";
        }
        return "unknown";
    }

    /// Columns present in a dataset: the base schema, plus extras when wide.
    inline std::vector<Column> schemaColumns(bool wide) {
        std::vector<Column> columns;
        columns.reserve(wide ? MAX_COLUMN_COUNT : BASE_COLUMN_COUNT);
        const size_t n = wide ? MAX_COLUMN_COUNT : BASE_COLUMN_COUNT;
        for (size_t i = 0; i < n; ++i) {
            columns.push_back(static_cast<Column>(i));
        }
        return columns;
    }

} // namespace tabench
