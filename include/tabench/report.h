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
 * @file report.h
 * @brief Run driver and result payload: JSON artifact and markdown summary.
 *
 * runCases() walks the selected cases in registration order, resolves each
 * case's dataset from a DatasetCatalog (every variant built once per run),
 * measures it and appends one CaseResult. The RunPayload is the only
 * persisted artifact; its JSON keys carry the engine label so payloads of
 * different engines can be diffed key by key:
 *
 *   { "generatedAt": "2026-01-31T12:00:00Z",
 *     "rows": 25000, "iterations": 8, "rounds": 3, "cases": 10,
 *     "results": [ { "case": "...", "dataset": "...",
 *                    "<engine>AvgMs": 1.25,
 *                    "<engine>RoundAverages": [1.3, 1.25, 1.2] }, ... ] }
 */

#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "case_registry.h"
#include "dataset.h"
#include "definitions.h"

namespace tabench {

    // ========================================================================
    // DatasetCatalog: one immutable dataset per variant
    // ========================================================================

    class DatasetCatalog {
        std::map<std::string, Dataset, std::less<>> datasets_;

    public:
        /// Build every listed variant once with the given row count
        static DatasetCatalog build(const std::vector<std::string>& variants, size_t rows);

        void add(Dataset dataset);

        /// Throws ConfigError if the variant was not built
        const Dataset& at(std::string_view variant) const;

        bool   contains(std::string_view variant) const;
        size_t size() const { return datasets_.size(); }
    };

    // ========================================================================
    // Results
    // ========================================================================

    struct RunParameters {
        size_t      rows       = DEFAULT_ROWS;
        size_t      iterations = DEFAULT_ITERATIONS;
        size_t      rounds     = DEFAULT_ROUNDS;
        std::string engine     = DEFAULT_ENGINE;
    };

    struct CaseResult {
        std::string         case_name;
        std::string         dataset;
        double              avg_ms = 0;
        std::vector<double> round_averages_ms;
        size_t              result_count = 0;   // cardinality of the last invocation (not persisted)
    };

    struct RunPayload {
        std::string             generated_at;
        RunParameters           parameters;
        std::vector<CaseResult> results;

        size_t caseCount() const { return results.size(); }

        /// 2-space indented JSON document (no trailing newline)
        std::string toJson() const;
    };

    /// Called after each finished case with its 1-based position and the total
    using ProgressSink = std::function<void(size_t index, size_t total, const CaseResult&)>;

    /// Current UTC time as YYYY-MM-DDTHH:MM:SSZ
    std::string utcTimestamp();

    /// Measure every case in order. A ContractViolation propagates unchanged.
    RunPayload runCases(const std::vector<CaseDefinition>& cases,
                        const DatasetCatalog& catalog,
                        const RunParameters& parameters,
                        const ProgressSink& progress = {});

    // ========================================================================
    // Output
    // ========================================================================

    /// Shortest round-trip rendering of a double, always with a fraction or exponent
    std::string formatJsonNumber(double value);

    /// Quote and escape a string for JSON
    std::string quoteJson(std::string_view text);

    /// Write payload JSON plus trailing newline, creating parent directories.
    /// Throws IoFailure on any filesystem or stream error.
    void writeReportJson(const std::filesystem::path& path, const RunPayload& payload);

    /// Title, parameter line and a `| case | dataset | <engine> avg |` table
    void printMarkdownSummary(std::ostream& os, const RunPayload& payload);

} // namespace tabench
