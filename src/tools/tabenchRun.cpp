/*
 * Copyright (c) 2026 The TABENCH Authors
 * 
 * This file is part of the TABENCH project.
 * 
 * Licensed under the MIT License. See LICENSE file in the project root 
 * for full license information.
 */

/**
 * @file tabenchRun.cpp
 * @brief Benchmark harness entry point (tabench_run)
 *
 * Resolves the run configuration, builds every dataset variant the selected
 * cases need exactly once, measures the cases in registration order, writes
 * the JSON payload and prints a markdown summary to stdout.
 *
 * Exit status: 0 on success, 1 on any fatal error. A case that returns no
 * result aborts the run before the report is written.
 */

#include <chrono>
#include <iostream>
#include <string>
#include <tabench/tabench.h>
#include "cli_common.h"

int main(int argc, char* argv[]) {
    try {
        const tabench::RunConfig cfg = tabench::parseRunConfig(argc, argv);

        if (cfg.help) {
            std::cout << tabench::runUsage(argv[0]);
            return 0;
        }

        const auto cases = tabench::selectCases(cfg.suite, cfg.case_filter);

        if (cfg.list) {
            tabench_cli::printCaseList(cfg.suite, cases);
            return 0;
        }

        // ── Datasets ────────────────────────────────────────────────
        const auto variants = tabench::requiredVariants(cases);
        if (!cfg.quiet) {
            std::cerr << "Building " << variants.size() << " dataset variant(s) with "
                      << cfg.rows << " rows...\n";
        }
        auto build_start = std::chrono::steady_clock::now();
        const auto catalog = tabench::DatasetCatalog::build(variants, cfg.rows);
        auto build_ms = std::chrono::duration<double, std::milli>(
                            std::chrono::steady_clock::now() - build_start).count();
        if (!cfg.quiet) {
            std::cerr << "  done in " << tabench_cli::formatMs(build_ms) << "\n";
        }

        // ── Measure ─────────────────────────────────────────────────
        tabench::RunParameters params;
        params.rows       = cfg.rows;
        params.iterations = cfg.iterations;
        params.rounds     = cfg.rounds;
        params.engine     = cfg.engine;

        tabench::ProgressSink progress;
        if (!cfg.quiet) {
            progress = [](size_t index, size_t total, const tabench::CaseResult& r) {
                std::cerr << "  [" << index << "/" << total << "] " << r.case_name
                          << " (" << r.dataset << ") avg=" << tabench_cli::formatMs(r.avg_ms) << "\n";
            };
        }

        const tabench::RunPayload payload = tabench::runCases(cases, catalog, params, progress);

        // ── Report ──────────────────────────────────────────────────
        tabench::writeReportJson(cfg.json_out, payload);
        if (!cfg.quiet) {
            std::cerr << "Wrote " << cfg.json_out << "\n\n";
        }
        tabench::printMarkdownSummary(std::cout, payload);
        return 0;

    } catch (const tabench::ConfigError& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        std::cerr << "Use --help for usage.\n";
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
