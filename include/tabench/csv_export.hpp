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
 * @file csv_export.hpp
 * @brief CSV export implementations.
 */

#include "csv_export.h"
#include "errors.h"

#include <charconv>
#include <fstream>
#include <system_error>
#include <type_traits>
#include <variant>

namespace tabench {

    inline DatasetCsvWriter::DatasetCsvWriter(std::ostream& os, char delimiter)
        : os_(os), delimiter_(delimiter)
    {
        buf_.reserve(512);
    }

    inline void DatasetCsvWriter::writeHeader(const std::vector<Column>& columns) {
        buf_.clear();
        for (size_t i = 0; i < columns.size(); ++i) {
            if (i > 0) buf_.push_back(delimiter_);
            appendString(columnName(columns[i]));
        }
        flushLine();
    }

    inline void DatasetCsvWriter::writeRow(const Row& row, const std::vector<Column>& columns) {
        buf_.clear();
        for (size_t i = 0; i < columns.size(); ++i) {
            if (i > 0) buf_.push_back(delimiter_);
            std::visit([this](const auto& value) {
                using T = std::decay_t<decltype(value)>;
                if constexpr (std::is_same_v<T, std::monostate>) {
                    // null: empty field
                } else if constexpr (std::is_same_v<T, bool>) {
                    const std::string_view text = value ? "true" : "false";
                    buf_.insert(buf_.end(), text.begin(), text.end());
                } else if constexpr (std::is_same_v<T, std::string_view>) {
                    appendString(value);
                } else {
                    appendToChars(value);
                }
            }, cellValue(row, columns[i]));
        }
        flushLine();
    }

    inline size_t DatasetCsvWriter::writeDataset(const Dataset& dataset) {
        const std::vector<Column> columns = dataset.columns();
        writeHeader(columns);
        for (const Row& row : dataset) {
            writeRow(row, columns);
        }
        return dataset.rowCount();
    }

    template<typename T>
    inline void DatasetCsvWriter::appendToChars(T value) {
        constexpr size_t kMaxDigits = 32;
        const size_t oldSize = buf_.size();
        buf_.resize(oldSize + kMaxDigits);
        auto [ptr, ec] = std::to_chars(buf_.data() + oldSize, buf_.data() + oldSize + kMaxDigits, value);
        if (ec != std::errc{}) {
            throw std::runtime_error("cannot format numeric CSV cell");
        }
        buf_.resize(static_cast<size_t>(ptr - buf_.data()));
    }

    inline void DatasetCsvWriter::appendString(std::string_view value) {
        bool needsQuoting = false;
        for (char c : value) {
            if (c == delimiter_ || c == '"' || c == '\n' || c == '\r') {
                needsQuoting = true;
                break;
            }
        }

        if (needsQuoting) {
            buf_.push_back('"');
            for (char c : value) {
                if (c == '"') buf_.push_back('"');
                buf_.push_back(c);
            }
            buf_.push_back('"');
        } else {
            buf_.insert(buf_.end(), value.begin(), value.end());
        }
    }

    inline void DatasetCsvWriter::flushLine() {
        buf_.push_back('\n');
        os_.write(buf_.data(), static_cast<std::streamsize>(buf_.size()));
    }

    inline size_t writeDatasetCsv(const std::filesystem::path& path, const Dataset& dataset, bool overwrite) {
        std::error_code ec;
        if (std::filesystem::exists(path, ec) && !overwrite) {
            throw IoFailure(path.string(), "file exists (use overwrite to replace it)");
        }
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path(), ec);
            if (ec) {
                throw IoFailure(path.string(), ec.message());
            }
        }

        std::ofstream out(path, std::ios::out | std::ios::trunc | std::ios::binary);
        if (!out.is_open()) {
            throw IoFailure(path.string(), "failed to open file for writing");
        }
        DatasetCsvWriter writer(out);
        const size_t rows = writer.writeDataset(dataset);
        out.flush();
        if (!out) {
            throw IoFailure(path.string(), "write failed");
        }
        return rows;
    }

} // namespace tabench
