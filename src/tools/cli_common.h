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
 * @file cli_common.h
 * @brief Shared utilities for TABENCH CLI tools
 *
 * Provides standardised helpers used across the CLI tools:
 *   - formatBytes()         byte count → "1.23 MB" / "456 KB" / "789 bytes"
 *   - formatMs()            duration → "1.23ms"
 *   - printSchemaSummary()  tabular column listing to any ostream
 *   - printCaseList()       case / variant / description table
 *   - printVariantList()    variant / flags table
 *
 * Tools opt-in to specific helpers via ordinary #include.
 */

#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>
#include <string>
#include <vector>
#include <tabench/tabench.h>

namespace tabench_cli {

// ── formatBytes ────────────────────────────────────────────────────

/// Format a byte count as human-readable string.
inline std::string formatBytes(uintmax_t bytes) {
    std::ostringstream oss;
    if (bytes >= 1024 * 1024) {
        oss << std::fixed << std::setprecision(2)
            << (static_cast<double>(bytes) / (1024.0 * 1024.0)) << " MB";
    } else if (bytes >= 1024) {
        oss << std::fixed << std::setprecision(2)
            << (static_cast<double>(bytes) / 1024.0) << " KB";
    } else {
        oss << bytes << " bytes";
    }
    return oss.str();
}

// ── formatMs ───────────────────────────────────────────────────────

inline std::string formatMs(double ms) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << ms << "ms";
    return oss.str();
}

// ── printSchemaSummary ─────────────────────────────────────────────

/// Print vertical schema table: type histogram + full column listing.
inline void printSchemaSummary(const std::string& label,
                               const std::vector<tabench::Column>& columns,
                               std::ostream& os = std::cerr) {
    const size_t n = columns.size();
    if (n == 0) {
        os << label << ": (empty)\n";
        return;
    }

    std::map<std::string, size_t> type_counts;
    size_t max_name_len = 4;   // minimum width for "Name" header
    size_t max_type_len = 4;   // minimum width for "Type" header
    for (auto column : columns) {
        const std::string name = tabench::columnName(column);
        const std::string type(tabench::columnTypeName(tabench::columnType(column)));
        type_counts[type]++;
        if (name.size() > max_name_len) max_name_len = name.size();
        if (type.size() > max_type_len) max_type_len = type.size();
    }

    os << label << " (" << n << " columns)  [ ";
    bool first = true;
    for (const auto& [tname, cnt] : type_counts) {
        if (!first) os << ", ";
        os << cnt << "\xc3\x97" << tname;   // UTF-8 ×
        first = false;
    }
    os << " ]\n";

    os << "  " << std::right << std::setw(3) << "Idx"
       << "  " << std::left  << std::setw(static_cast<int>(max_name_len)) << "Name"
       << "  " << std::left  << std::setw(static_cast<int>(max_type_len)) << "Type"
       << "  Nullable\n";
    os << "  " << std::string(3, '-')
       << "  " << std::string(max_name_len, '-')
       << "  " << std::string(max_type_len, '-')
       << "  --------\n";

    for (size_t i = 0; i < n; ++i) {
        const auto column = columns[i];
        os << "  " << std::right << std::setw(3) << i
           << "  " << std::left  << std::setw(static_cast<int>(max_name_len)) << tabench::columnName(column)
           << "  " << std::left  << std::setw(static_cast<int>(max_type_len)) << tabench::columnTypeName(tabench::columnType(column))
           << "  " << (tabench::isNullable(column) ? "yes" : "no")
           << "\n";
    }
}

// ── Listings ───────────────────────────────────────────────────────

inline void printCaseList(const std::string& suite,
                          const std::vector<tabench::CaseDefinition>& cases,
                          std::ostream& os = std::cout) {
    os << "Cases in suite '" << suite << "' (" << cases.size() << "):\n\n";
    os << std::left
       << std::setw(42) << "Name"
       << std::setw(12) << "Dataset"
       << "Operation\n";
    os << std::string(40, '-') << "  "
       << std::string(10, '-') << "  "
       << std::string(40, '-') << "\n";
    for (const auto& c : cases) {
        os << std::left
           << std::setw(42) << c.name
           << std::setw(12) << c.variant
           << c.operation->description() << "\n";
    }
}

inline void printVariantList(std::ostream& os = std::cout) {
    const auto names = tabench::getVariantNames();
    os << "Available dataset variants (" << names.size() << "):\n\n";
    os << std::left << std::setw(12) << "Name" << "Flags\n";
    os << std::string(10, '-') << "  " << std::string(40, '-') << "\n";
    for (const auto& name : names) {
        os << std::left << std::setw(12) << name
           << tabench::variantOptions(name).describe() << "\n";
    }
}

} // namespace tabench_cli
