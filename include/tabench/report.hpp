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
 * @file report.hpp
 * @brief Run driver and report rendering implementations.
 */

#include "report.h"
#include "errors.h"
#include "timing.h"

#include <array>
#include <charconv>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace tabench {

    // ── DatasetCatalog ─────────────────────────────────────────────────

    inline DatasetCatalog DatasetCatalog::build(const std::vector<std::string>& variants, size_t rows) {
        DatasetCatalog catalog;
        for (const auto& variant : variants) {
            if (!catalog.contains(variant)) {
                catalog.add(buildVariant(variant, rows));
            }
        }
        return catalog;
    }

    inline void DatasetCatalog::add(Dataset dataset) {
        std::string key = dataset.variant();
        datasets_.insert_or_assign(std::move(key), std::move(dataset));
    }

    inline const Dataset& DatasetCatalog::at(std::string_view variant) const {
        auto it = datasets_.find(variant);
        if (it == datasets_.end()) {
            throw ConfigError("dataset variant '" + std::string(variant) + "' was not built");
        }
        return it->second;
    }

    inline bool DatasetCatalog::contains(std::string_view variant) const {
        return datasets_.find(variant) != datasets_.end();
    }

    // ── Run ────────────────────────────────────────────────────────────

    inline std::string utcTimestamp() {
        const std::time_t now = std::time(nullptr);
        std::tm utc{};
#if defined(_WIN32)
        gmtime_s(&utc, &now);
#else
        gmtime_r(&now, &utc);
#endif
        char buf[32]{};
        std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &utc);
        return buf;
    }

    inline RunPayload runCases(const std::vector<CaseDefinition>& cases,
                               const DatasetCatalog& catalog,
                               const RunParameters& parameters,
                               const ProgressSink& progress) {
        RunPayload payload;
        payload.parameters = parameters;
        payload.results.reserve(cases.size());

        for (size_t i = 0; i < cases.size(); ++i) {
            const CaseDefinition& def = cases[i];
            const Dataset& dataset = catalog.at(def.variant);
            CaseMeasurement m = measureCase(*def.operation, dataset,
                                            parameters.iterations, parameters.rounds, def.name);

            CaseResult result;
            result.case_name         = def.name;
            result.dataset           = def.variant;
            result.avg_ms            = m.robust_average_ms;
            result.round_averages_ms = std::move(m.round_averages_ms);
            result.result_count      = m.last_result;
            payload.results.push_back(std::move(result));

            if (progress) {
                progress(i + 1, cases.size(), payload.results.back());
            }
        }

        // Stamped once all cases succeeded: an aborted run has no payload
        payload.generated_at = utcTimestamp();
        return payload;
    }

    // ── JSON ───────────────────────────────────────────────────────────

    inline std::string formatJsonNumber(double value) {
        std::array<char, 32> buf{};
        auto [ptr, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), value);
        if (ec != std::errc{}) {
            throw std::runtime_error("cannot format number for JSON");
        }
        std::string text(buf.data(), ptr);
        if (text.find_first_of(".eEn") == std::string::npos) {
            text += ".0";   // keep floats recognisable as floats
        }
        return text;
    }

    inline std::string quoteJson(std::string_view text) {
        std::string out;
        out.reserve(text.size() + 2);
        out.push_back('"');
        for (char c : text) {
            switch (c) {
                case '"':  out += "\\\""; break;
                case '\\': out += "\\\\"; break;
                case '\b': out += "\\b";  break;
                case '\f': out += "\\f";  break;
                case '\n': out += "\\n";  break;
                case '\r': out += "\\r";  break;
                case '\t': out += "\\t";  break;
                default:
                    if (static_cast<unsigned char>(c) < 0x20) {
                        char esc[8];
                        std::snprintf(esc, sizeof(esc), "\\u%04x", static_cast<unsigned>(c));
                        out += esc;
                    } else {
                        out.push_back(c);
                    }
            }
        }
        out.push_back('"');
        return out;
    }

    inline std::string RunPayload::toJson() const {
        const std::string avgKey    = quoteJson(parameters.engine + "AvgMs");
        const std::string roundsKey = quoteJson(parameters.engine + "RoundAverages");

        std::ostringstream ss;
        ss << "{\n"
           << "  \"generatedAt\": " << quoteJson(generated_at) << ",\n"
           << "  \"rows\": " << parameters.rows << ",\n"
           << "  \"iterations\": " << parameters.iterations << ",\n"
           << "  \"rounds\": " << parameters.rounds << ",\n"
           << "  \"cases\": " << caseCount() << ",\n";

        if (results.empty()) {
            ss << "  \"results\": []\n}";
            return ss.str();
        }

        ss << "  \"results\": [\n";
        for (size_t i = 0; i < results.size(); ++i) {
            const CaseResult& r = results[i];
            ss << "    {\n"
               << "      \"case\": " << quoteJson(r.case_name) << ",\n"
               << "      \"dataset\": " << quoteJson(r.dataset) << ",\n"
               << "      " << avgKey << ": " << formatJsonNumber(r.avg_ms) << ",\n"
               << "      " << roundsKey << ": ";
            if (r.round_averages_ms.empty()) {
                ss << "[]\n";
            } else {
                ss << "[\n";
                for (size_t k = 0; k < r.round_averages_ms.size(); ++k) {
                    ss << "        " << formatJsonNumber(r.round_averages_ms[k]);
                    if (k + 1 < r.round_averages_ms.size()) ss << ",";
                    ss << "\n";
                }
                ss << "      ]\n";
            }
            ss << "    }";
            if (i + 1 < results.size()) ss << ",";
            ss << "\n";
        }
        ss << "  ]\n"
           << "}";
        return ss.str();
    }

    inline void writeReportJson(const std::filesystem::path& path, const RunPayload& payload) {
        const std::string document = payload.toJson();

        if (path.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(path.parent_path(), ec);
            if (ec) {
                throw IoFailure(path.string(), ec.message());
            }
        }

        std::ofstream out(path, std::ios::out | std::ios::trunc);
        if (!out.is_open()) {
            throw IoFailure(path.string(), "failed to open file for writing");
        }
        out << document << "\n";
        out.flush();
        if (!out) {
            throw IoFailure(path.string(), "write failed");
        }
    }

    // ── Markdown ───────────────────────────────────────────────────────

    inline void printMarkdownSummary(std::ostream& os, const RunPayload& payload) {
        const RunParameters& p = payload.parameters;
        os << "# tabench " << p.engine << " benchmark\n"
           << "rows=" << p.rows << ", iterations=" << p.iterations
           << ", rounds=" << p.rounds << ", cases=" << payload.caseCount() << "\n"
           << "\n"
           << "| case | dataset | " << p.engine << " avg |\n"
           << "| --- | --- | ---: |\n";

        std::ostringstream cell;
        cell << std::fixed << std::setprecision(2);
        for (const auto& r : payload.results) {
            cell.str({});
            cell << r.avg_ms << "ms";
            os << "| " << r.case_name << " | " << r.dataset << " | " << cell.str() << " |\n";
        }
    }

} // namespace tabench
