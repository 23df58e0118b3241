/*
 * Copyright (c) 2026 The TABENCH Authors
 * 
 * This file is part of the TABENCH project.
 * 
 * Licensed under the MIT License. See LICENSE file in the project root 
 * for full license information.
 */

/**
 * @file tabenchGenerator.cpp
 * @brief CLI tool to export synthesized benchmark datasets as CSV
 *
 * Produces exactly the rows the harness measures, so another engine can be
 * benchmarked on byte-identical input. A named variant selects the flag
 * set; individual flags may be added on top (the result is labelled
 * "custom").
 *
 * Default: base variant, 25 000 rows.
 */

#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <tabench/tabench.h>
#include "cli_common.h"

// ── Configuration ───────────────────────────────────────────────────

struct Config {
    std::string output_file;
    std::string variant       = tabench::VARIANT_BASE;
    size_t      rows          = tabench::DEFAULT_ROWS;

    // Flags added on top of the variant
    bool        skew              = false;
    bool        wide              = false;
    bool        high_cardinality  = false;
    bool        include_missing   = false;

    bool        overwrite         = false;
    bool        list_variants     = false;
    bool        verbose           = false;
    bool        help              = false;
};

// ── Usage ───────────────────────────────────────────────────────────

static void printUsage(const char* prog) {
    std::cout
        << "Usage: " << prog
        << " [OPTIONS] -o OUTPUT_FILE\n\n"

        << "Export a synthesized benchmark dataset as CSV.\n\n"

        << "Arguments:\n"
        << "  -o, --output FILE        Output CSV file (required)\n\n"

        << "Dataset:\n"
        << "  -p, --variant NAME       Dataset variant (default: base)\n"
        << "  -n, --rows N             Number of rows (default: " << tabench::DEFAULT_ROWS << ")\n"
        << "  --skew                   Pin 70 of every 100 rows to the first group\n"
        << "  --wide                   Append extra_0..extra_9 columns\n"
        << "  --high-card              Unique user/session keys per row\n"
        << "  --missing                Inject null city/segment cells\n"
        << "  --list                   List available variants and exit\n\n"

        << "General:\n"
        << "  -f, --overwrite          Overwrite output file if it exists\n"
        << "  -v, --verbose            Verbose progress output\n"
        << "  -h, --help               Show this help message\n\n"

        << "Examples:\n"
        << "  " << prog << " -o base.csv\n"
        << "  " << prog << " -p missing -n 100000 -o missing.csv\n"
        << "  " << prog << " --skew --wide -o skewed_wide.csv\n"
        << "  " << prog << " --list\n";
}

// ── Argument parsing ────────────────────────────────────────────────

static Config parseArgs(int argc, char* argv[]) {
    Config cfg;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            cfg.help = true;
            return cfg;
        } else if (arg == "--list") {
            cfg.list_variants = true;
            return cfg;
        } else if (arg == "-v" || arg == "--verbose") {
            cfg.verbose = true;
        } else if (arg == "-f" || arg == "--overwrite") {
            cfg.overwrite = true;
        } else if (arg == "--skew") {
            cfg.skew = true;
        } else if (arg == "--wide") {
            cfg.wide = true;
        } else if (arg == "--high-card") {
            cfg.high_cardinality = true;
        } else if (arg == "--missing") {
            cfg.include_missing = true;
        } else if ((arg == "-o" || arg == "--output") && i + 1 < argc) {
            cfg.output_file = argv[++i];
        } else if ((arg == "-p" || arg == "--variant") && i + 1 < argc) {
            cfg.variant = argv[++i];
        } else if ((arg == "-n" || arg == "--rows") && i + 1 < argc) {
            cfg.rows = tabench::parseCount(argv[++i], "row count");
        } else if (arg.starts_with("-")) {
            throw std::runtime_error("Unknown option: " + arg);
        } else {
            // Treat bare positional arg as output file if -o not used
            if (cfg.output_file.empty()) {
                cfg.output_file = arg;
            } else {
                throw std::runtime_error("Too many positional arguments.");
            }
        }
    }

    if (cfg.output_file.empty()) {
        throw std::runtime_error("Output file is required (-o FILE).");
    }

    return cfg;
}

// ── Main ────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
    try {
        Config cfg = parseArgs(argc, argv);

        if (cfg.help) {
            printUsage(argv[0]);
            return 0;
        }

        if (cfg.list_variants) {
            tabench_cli::printVariantList();
            return 0;
        }

        // ── Resolve variant ─────────────────────────────────────────
        tabench::DatasetOptions options;
        try {
            options = tabench::variantOptions(cfg.variant);
        } catch (const tabench::ConfigError& e) {
            std::cerr << "Error: " << e.what() << "\n";
            std::cerr << "Use --list to see available variants.\n";
            return 1;
        }

        const tabench::DatasetOptions named = options;
        options.skew             = options.skew || cfg.skew;
        options.wide             = options.wide || cfg.wide;
        options.high_cardinality = options.high_cardinality || cfg.high_cardinality;
        options.include_missing  = options.include_missing || cfg.include_missing;
        const std::string label  = (options == named) ? cfg.variant : std::string("custom");

        if (cfg.verbose) {
            std::cerr << "Variant:   " << label << "\n";
            std::cerr << "Flags:     " << options.describe() << "\n";
            std::cerr << "Rows:      " << cfg.rows << "\n";
            tabench_cli::printSchemaSummary("Schema", tabench::schemaColumns(options.wide));
        }

        // ── Build + write ───────────────────────────────────────────
        auto start_time = std::chrono::steady_clock::now();

        const tabench::Dataset dataset = tabench::buildDataset(cfg.rows, options, label);
        const size_t written = tabench::writeDatasetCsv(cfg.output_file, dataset, cfg.overwrite);

        auto end_time = std::chrono::steady_clock::now();
        auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                               end_time - start_time).count();
        if (duration_ms == 0) duration_ms = 1;

        // ── Summary ─────────────────────────────────────────────────
        auto file_size = std::filesystem::file_size(cfg.output_file);
        double duration_s  = static_cast<double>(duration_ms) / 1000.0;
        double krows_per_s = (static_cast<double>(written) / 1000.0) / duration_s;

        std::cerr << "\n=== tabenchGenerator Summary ===\n";
        std::cerr << "Variant:    " << label << " (" << options.describe() << ")\n";
        if (cfg.verbose) {
            tabench_cli::printSchemaSummary("Schema", dataset.columns(), std::cerr);
        }
        std::cerr << "\n"
                  << "  Rows written: " << written << "\n"
                  << "  Columns:      " << dataset.columns().size() << "\n"
                  << "  File size:    " << file_size << " bytes ("
                  << tabench_cli::formatBytes(file_size) << ")\n"
                  << "\n"
                  << "  Wall time:    " << duration_ms << " ms\n"
                  << "  Throughput:   " << std::fixed << std::setprecision(1)
                  << krows_per_s << " krows/s\n"
                  << "\n"
                  << "  Output: " << cfg.output_file << "\n";

        return 0;

    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
