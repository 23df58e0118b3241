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
 * @file csv_export.h
 * @brief Export of a synthesized dataset as CSV.
 *
 * Lets another engine load byte-identical input. Cell rendering:
 * - integers and doubles via std::to_chars (no locale, shortest round-trip)
 * - booleans as true/false
 * - null cells as an empty field
 * - strings quoted per RFC 4180 when they contain the delimiter, a quote or
 *   a line break
 */

#include <filesystem>
#include <ostream>
#include <string_view>
#include <vector>

#include "column.h"
#include "dataset.h"

namespace tabench {

    class DatasetCsvWriter {
    public:
        explicit DatasetCsvWriter(std::ostream& os, char delimiter = ',');

        void writeHeader(const std::vector<Column>& columns);
        void writeRow(const Row& row, const std::vector<Column>& columns);

        /// Header plus every row; returns the number of data rows written
        size_t writeDataset(const Dataset& dataset);

    private:
        template<typename T>
        void appendToChars(T value);
        void appendString(std::string_view value);
        void flushLine();

        std::ostream&       os_;
        char                delimiter_;
        std::vector<char>   buf_;
    };

    /// Write dataset to path, creating parent directories. Throws IoFailure
    /// if the file exists and overwrite is false, or on any write error.
    size_t writeDatasetCsv(const std::filesystem::path& path, const Dataset& dataset, bool overwrite = false);

} // namespace tabench
