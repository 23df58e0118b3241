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
 * @file run_config.h
 * @brief Harness configuration from command line and environment.
 *
 * Resolution order per setting: command-line option, then environment
 * variable, then built-in default. Options are written `--key=value` or
 * `--key value`; switches take no value.
 *
 *   --rows N            TABENCH_ROWS       rows per dataset variant
 *   --iters N           TABENCH_ITERS      timed invocations per round (>= 1)
 *   --rounds N          TABENCH_ROUNDS     rounds reduced by median (>= 1)
 *   --json-out PATH     TABENCH_JSON_OUT   payload destination
 *   --engine NAME       TABENCH_ENGINE     label used in JSON keys
 *   --suite NAME        TABENCH_SUITE      core | extended
 *   --case A,B          -                  case filter
 *   --list, --quiet, --help
 */

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "definitions.h"

namespace tabench {

    struct RunConfig {
        size_t      rows        = DEFAULT_ROWS;
        size_t      iterations  = DEFAULT_ITERATIONS;
        size_t      rounds      = DEFAULT_ROUNDS;
        std::string json_out    = DEFAULT_JSON_OUT;
        std::string engine      = DEFAULT_ENGINE;
        std::string suite       = DEFAULT_SUITE;
        std::string case_filter;
        bool        list        = false;
        bool        quiet       = false;
        bool        help        = false;
    };

    using ArgMap    = std::map<std::string, std::string, std::less<>>;
    using EnvLookup = std::function<std::optional<std::string>(const char* name)>;

    /// Process environment; empty values count as unset
    std::optional<std::string> systemEnv(const char* name);

    /// Split argv into option -> value. Switches map to "true".
    /// Throws ConfigError for unknown options, positional arguments and
    /// options missing their value.
    ArgMap parseArgs(int argc, char* argv[]);

    /// Strict unsigned decimal parse; `what` names the setting in the error
    size_t parseCount(std::string_view text, std::string_view what);

    RunConfig parseRunConfig(int argc, char* argv[], const EnvLookup& env = systemEnv);

    std::string runUsage(std::string_view program);

} // namespace tabench
