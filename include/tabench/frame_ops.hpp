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
 * @file frame_ops.hpp
 * @brief Reference query kernel implementations.
 */

#include "frame_ops.h"

#include <algorithm>
#include <charconv>
#include <limits>
#include <numeric>
#include <stdexcept>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace tabench {

    // ========================================================================
    // Cell helpers
    // ========================================================================

    inline bool isNull(const CellValue& value) {
        return std::holds_alternative<std::monostate>(value);
    }

    inline int compareCells(const CellValue& lhs, const CellValue& rhs) {
        if (lhs.index() != rhs.index()) {
            return lhs.index() < rhs.index() ? -1 : 1;
        }
        return std::visit([&rhs](const auto& a) -> int {
            using T = std::decay_t<decltype(a)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return 0;
            } else {
                const T& b = std::get<T>(rhs);
                if (a < b) return -1;
                if (b < a) return 1;
                return 0;
            }
        }, lhs);
    }

    inline double numericValue(const CellValue& value) {
        return std::visit([](const auto& v) -> double {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, bool>) {
                return v ? 1.0 : 0.0;
            } else if constexpr (std::is_same_v<T, int64_t> || std::is_same_v<T, double>) {
                return static_cast<double>(v);
            } else {
                throw std::invalid_argument("numericValue: cell is null or not numeric");
            }
        }, value);
    }

    inline std::string encodeKey(const Row& row, const std::vector<Column>& columns) {
        std::string key;
        key.reserve(columns.size() * 12);
        char buf[32];
        for (Column column : columns) {
            const CellValue cell = cellValue(row, column);
            std::visit([&](const auto& v) {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, std::monostate>) {
                    key.push_back('\x00');
                } else if constexpr (std::is_same_v<T, std::string_view>) {
                    key.push_back('\x01');
                    key.append(v.data(), v.size());
                } else if constexpr (std::is_same_v<T, bool>) {
                    key.push_back('\x01');
                    key.push_back(v ? '1' : '0');
                } else {
                    key.push_back('\x01');
                    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
                    key.append(buf, ptr);
                }
            }, cell);
            key.push_back('\x1f'); // unit separator between key columns
        }
        return key;
    }

    namespace detail {

        inline bool anyNull(const Row& row, const std::vector<Column>& columns) {
            for (Column c : columns) {
                if (isNullable(c) && isNull(cellValue(row, c))) return true;
            }
            return false;
        }

        inline std::vector<CellValue> keyCells(const Row& row, const std::vector<Column>& columns) {
            std::vector<CellValue> cells;
            cells.reserve(columns.size());
            for (Column c : columns) cells.push_back(cellValue(row, c));
            return cells;
        }

        /// Lexicographic key compare, nulls last per component
        inline bool keyLess(const std::vector<CellValue>& lhs, const std::vector<CellValue>& rhs) {
            for (size_t i = 0; i < lhs.size() && i < rhs.size(); ++i) {
                const bool ln = isNull(lhs[i]);
                const bool rn = isNull(rhs[i]);
                if (ln != rn) return rn;
                if (ln) continue;
                const int c = compareCells(lhs[i], rhs[i]);
                if (c != 0) return c < 0;
            }
            return lhs.size() < rhs.size();
        }

    } // namespace detail

    // ========================================================================
    // Selection
    // ========================================================================

    inline RowIndex allRows(const Dataset& dataset) {
        RowIndex rows(dataset.rowCount());
        std::iota(rows.begin(), rows.end(), size_t{0});
        return rows;
    }

    template<typename Predicate>
    RowIndex filterRows(const Dataset& dataset, Predicate&& predicate) {
        RowIndex rows;
        const auto& all = dataset.rows();
        for (size_t i = 0; i < all.size(); ++i) {
            if (predicate(all[i])) rows.push_back(i);
        }
        return rows;
    }

    inline RowIndex head(RowIndex rows, size_t n) {
        if (rows.size() > n) rows.resize(n);
        return rows;
    }

    // ========================================================================
    // Ordering
    // ========================================================================

    inline void sortRows(const Dataset& dataset, RowIndex& rows, const std::vector<SortKey>& keys) {
        const auto& all = dataset.rows();
        std::stable_sort(rows.begin(), rows.end(), [&](size_t a, size_t b) {
            for (const SortKey& key : keys) {
                const CellValue lhs = cellValue(all[a], key.column);
                const CellValue rhs = cellValue(all[b], key.column);
                const bool ln = isNull(lhs);
                const bool rn = isNull(rhs);
                if (ln || rn) {
                    if (ln == rn) continue;
                    return rn;  // nulls last regardless of direction
                }
                const int c = compareCells(lhs, rhs);
                if (c != 0) return key.ascending ? c < 0 : c > 0;
            }
            return false;
        });
    }

    inline RowIndex nlargest(const Dataset& dataset, const RowIndex& rows, Column column, size_t k) {
        const auto& all = dataset.rows();
        // position within the input selection breaks ties
        std::vector<size_t> position(rows.size());
        std::iota(position.begin(), position.end(), size_t{0});

        auto larger = [&](size_t pa, size_t pb) {
            const CellValue a = cellValue(all[rows[pa]], column);
            const CellValue b = cellValue(all[rows[pb]], column);
            const bool an = isNull(a);
            const bool bn = isNull(b);
            if (an != bn) return bn;
            if (!an) {
                const int c = compareCells(a, b);
                if (c != 0) return c > 0;
            }
            return pa < pb;
        };

        const size_t n = std::min(k, position.size());
        std::partial_sort(position.begin(), position.begin() + static_cast<std::ptrdiff_t>(n),
                          position.end(), larger);
        position.resize(n);

        RowIndex selected;
        selected.reserve(n);
        for (size_t p : position) selected.push_back(rows[p]);
        return selected;
    }

    // ========================================================================
    // Grouping
    // ========================================================================

    inline std::vector<ValueCount> valueCounts(const Dataset& dataset, const RowIndex& rows,
                                               const std::vector<Column>& subset, bool dropna) {
        const auto& all = dataset.rows();
        std::unordered_map<std::string, size_t> slots;
        std::vector<ValueCount> counts;

        for (size_t r : rows) {
            const Row& row = all[r];
            if (dropna && detail::anyNull(row, subset)) continue;

            auto [it, inserted] = slots.try_emplace(encodeKey(row, subset), counts.size());
            if (inserted) {
                counts.push_back({detail::keyCells(row, subset), 0});
            }
            ++counts[it->second].count;
        }

        std::stable_sort(counts.begin(), counts.end(), [](const ValueCount& a, const ValueCount& b) {
            return a.count > b.count;
        });
        return counts;
    }

    inline std::vector<GroupResult> groupBy(const Dataset& dataset, const RowIndex& rows,
                                            const std::vector<Column>& keys,
                                            const std::vector<AggregateSpec>& aggregates,
                                            const GroupOptions& options) {
        const auto& all = dataset.rows();
        std::unordered_map<std::string, size_t> slots;
        std::vector<GroupResult> groups;

        for (size_t r : rows) {
            const Row& row = all[r];
            if (options.dropna && detail::anyNull(row, keys)) continue;

            auto [it, inserted] = slots.try_emplace(encodeKey(row, keys), groups.size());
            if (inserted) {
                groups.push_back({detail::keyCells(row, keys), 0, std::vector<double>(aggregates.size(), 0.0)});
            }
            GroupResult& g = groups[it->second];
            ++g.rows;
            for (size_t a = 0; a < aggregates.size(); ++a) {
                if (aggregates[a].kind != Aggregation::COUNT) {
                    g.values[a] += numericValue(cellValue(row, aggregates[a].column));
                }
            }
        }

        for (GroupResult& g : groups) {
            for (size_t a = 0; a < aggregates.size(); ++a) {
                switch (aggregates[a].kind) {
                    case Aggregation::MEAN:
                        g.values[a] = g.rows > 0 ? g.values[a] / static_cast<double>(g.rows)
                                                 : std::numeric_limits<double>::quiet_NaN();
                        break;
                    case Aggregation::COUNT:
                        g.values[a] = static_cast<double>(g.rows);
                        break;
                    case Aggregation::SUM:
                        break;
                }
            }
        }

        if (options.sort) {
            std::stable_sort(groups.begin(), groups.end(), [](const GroupResult& a, const GroupResult& b) {
                return detail::keyLess(a.key, b.key);
            });
        }
        return groups;
    }

    inline RowIndex dropDuplicates(const Dataset& dataset, const RowIndex& rows, const std::vector<Column>& subset) {
        const auto& all = dataset.rows();
        std::unordered_set<std::string> seen;
        RowIndex kept;
        for (size_t r : rows) {
            if (seen.insert(encodeKey(all[r], subset)).second) {
                kept.push_back(r);
            }
        }
        return kept;
    }

} // namespace tabench
