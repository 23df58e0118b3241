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
 * @file run_config.hpp
 * @brief Harness configuration implementations.
 */

#include "run_config.h"
#include "errors.h"

#include <array>
#include <charconv>
#include <cstdlib>
#include <sstream>

namespace tabench {

    namespace detail {

        struct OptionSpec {
            std::string_view flag;      // as written on the command line
            std::string_view key;       // canonical key in ArgMap
            bool             takes_value;
        };

        inline constexpr std::array<OptionSpec, 11> RUN_OPTIONS = {{
            {"--rows",       "rows",     true},
            {"--iters",      "iters",    true},
            {"--iterations", "iters",    true},
            {"--rounds",     "rounds",   true},
            {"--json-out",   "json-out", true},
            {"--engine",     "engine",   true},
            {"--suite",      "suite",    true},
            {"--case",       "case",     true},
            {"--list",       "list",     false},
            {"--quiet",      "quiet",    false},
            {"--help",       "help",     false},
        }};

        inline const OptionSpec* findOption(std::string_view flag) {
            for (const auto& spec : RUN_OPTIONS) {
                if (spec.flag == flag) return &spec;
            }
            return nullptr;
        }

        /// CLI value first, then environment, else nullopt
        inline std::optional<std::string> resolve(const ArgMap& args, std::string_view key,
                                                  const char* envName, const EnvLookup& env) {
            auto it = args.find(key);
            if (it != args.end()) return it->second;
            if (envName != nullptr && env) {
                std::optional<std::string> value = env(envName);
                if (value && !value->empty()) return value;
            }
            return std::nullopt;
        }

    } // namespace detail

    inline std::optional<std::string> systemEnv(const char* name) {
        const char* value = std::getenv(name);
        if (value == nullptr || *value == '\0') return std::nullopt;
        return std::string(value);
    }

    inline ArgMap parseArgs(int argc, char* argv[]) {
        ArgMap args;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "-h") {
                args["help"] = "true";
                continue;
            }
            if (!arg.starts_with("--")) {
                throw ConfigError("unexpected argument '" + arg + "'");
            }

            std::string flag = arg;
            std::optional<std::string> inlineValue;
            auto eq = arg.find('=');
            if (eq != std::string::npos) {
                flag = arg.substr(0, eq);
                inlineValue = arg.substr(eq + 1);
            }

            const detail::OptionSpec* spec = detail::findOption(flag);
            if (spec == nullptr) {
                throw ConfigError("unknown option '" + flag + "'");
            }

            if (!spec->takes_value) {
                if (inlineValue) {
                    throw ConfigError("option '" + flag + "' takes no value");
                }
                args[std::string(spec->key)] = "true";
            } else if (inlineValue) {
                args[std::string(spec->key)] = *inlineValue;
            } else {
                if (i + 1 >= argc) {
                    throw ConfigError("option '" + flag + "' requires a value");
                }
                args[std::string(spec->key)] = argv[++i];
            }
        }
        return args;
    }

    inline size_t parseCount(std::string_view text, std::string_view what) {
        size_t value = 0;
        const char* first = text.data();
        const char* last  = text.data() + text.size();
        auto [ptr, ec] = std::from_chars(first, last, value);
        if (text.empty() || ec != std::errc{} || ptr != last) {
            throw ConfigError("invalid value for " + std::string(what) + ": '" + std::string(text) + "'");
        }
        return value;
    }

    inline RunConfig parseRunConfig(int argc, char* argv[], const EnvLookup& env) {
        const ArgMap args = parseArgs(argc, argv);
        RunConfig config;

        // Usage does not depend on the environment
        if (args.contains("help")) {
            config.help = true;
            return config;
        }

        if (auto v = detail::resolve(args, "rows", "TABENCH_ROWS", env)) {
            config.rows = parseCount(*v, "rows");
        }
        if (auto v = detail::resolve(args, "iters", "TABENCH_ITERS", env)) {
            config.iterations = parseCount(*v, "iterations");
        }
        if (auto v = detail::resolve(args, "rounds", "TABENCH_ROUNDS", env)) {
            config.rounds = parseCount(*v, "rounds");
        }
        if (auto v = detail::resolve(args, "json-out", "TABENCH_JSON_OUT", env)) {
            config.json_out = *v;
        }
        if (auto v = detail::resolve(args, "engine", "TABENCH_ENGINE", env)) {
            config.engine = *v;
        }
        if (auto v = detail::resolve(args, "suite", "TABENCH_SUITE", env)) {
            config.suite = *v;
        }
        if (auto v = detail::resolve(args, "case", nullptr, env)) {
            config.case_filter = *v;
        }
        config.list  = args.contains("list");
        config.quiet = args.contains("quiet");

        if (config.iterations < 1) {
            throw ConfigError("iterations must be at least 1");
        }
        if (config.rounds < 1) {
            throw ConfigError("rounds must be at least 1");
        }
        if (config.engine.empty()) {
            throw ConfigError("engine label must not be empty");
        }
        if (config.json_out.empty()) {
            throw ConfigError("json-out path must not be empty");
        }
        return config;
    }

    inline std::string runUsage(std::string_view program) {
        std::ostringstream ss;
        ss << "Usage: " << program << " [OPTIONS]\n\n"
           << "Run the tabular micro-benchmark suite and write a JSON report.\n\n"
           << "Options:\n"
           << "  --rows N           Rows per dataset variant (default: " << DEFAULT_ROWS << ", env TABENCH_ROWS)\n"
           << "  --iters N          Timed invocations per round (default: " << DEFAULT_ITERATIONS << ", env TABENCH_ITERS)\n"
           << "  --rounds N         Rounds reduced by median (default: " << DEFAULT_ROUNDS << ", env TABENCH_ROUNDS)\n"
           << "  --json-out PATH    Report destination (default: " << DEFAULT_JSON_OUT << ", env TABENCH_JSON_OUT)\n"
           << "  --engine NAME      Engine label for JSON keys (default: " << DEFAULT_ENGINE << ", env TABENCH_ENGINE)\n"
           << "  --suite NAME       core | extended (default: " << DEFAULT_SUITE << ", env TABENCH_SUITE)\n"
           << "  --case A,B         Run only the named cases\n"
           << "  --list             List the cases of the suite and exit\n"
           << "  --quiet            No progress output on stderr\n"
           << "  -h, --help         Show this help message\n\n"
           << "Examples:\n"
           << "  " << program << "\n"
           << "  " << program << " --rows=100000 --rounds 5\n"
           << "  " << program << " --suite extended --json-out results/native.json --engine native\n";
        return ss.str();
    }

} // namespace tabench
