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
 * @file errors.h
 * @brief Exception types raised by the harness.
 *
 * All of them are fatal for a run: tools catch std::exception once in main(),
 * print "Error: <what>" and exit with status 1.
 */

#include <stdexcept>
#include <string>

namespace tabench {

    /// An operation under test produced no result.
    class ContractViolation : public std::runtime_error {
        std::string case_name_;

    public:
        ContractViolation(const std::string& caseName, const std::string& detail)
            : std::runtime_error("case '" + caseName + "' " + detail)
            , case_name_(caseName) {}

        const std::string& caseName() const { return case_name_; }
    };

    /// Output directory or file could not be created or written.
    class IoFailure : public std::runtime_error {
        std::string path_;

    public:
        IoFailure(const std::string& path, const std::string& cause)
            : std::runtime_error("cannot write '" + path + "': " + cause)
            , path_(path) {}

        const std::string& path() const { return path_; }
    };

    /// Invalid command-line/environment value or unknown case, variant or suite.
    class ConfigError : public std::invalid_argument {
    public:
        explicit ConfigError(const std::string& what) : std::invalid_argument(what) {}
    };

} // namespace tabench
