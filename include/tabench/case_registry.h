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
 * @file case_registry.h
 * @brief Fixed, ordered tables of benchmark cases.
 *
 * Each case binds a name to a dataset variant and an Operation. Case names
 * and variants of the core suite are a compatibility surface shared with the
 * paired harness of the other engine; results are diffed by case name.
 *
 * Suites:
 *   core      the 10 compatibility cases (default)
 *   extended  core + skewed/wide variants and additional multi-key queries
 */

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "definitions.h"
#include "operation.h"

namespace tabench {

    struct CaseDefinition {
        std::string                         name;
        std::string                         variant;
        std::shared_ptr<const Operation>    operation;
    };

    const std::vector<CaseDefinition>& getCoreCasesCached();
    const std::vector<CaseDefinition>& getExtendedCasesCached();

    std::vector<std::string> getSuiteNames();

    /// Throws ConfigError for an unknown suite
    const std::vector<CaseDefinition>& getSuite(std::string_view suite);

    /// Lookup across all registered cases. Throws ConfigError for an unknown name.
    const CaseDefinition& getCase(std::string_view name);

    std::vector<std::string> getCaseNames(std::string_view suite = DEFAULT_SUITE);

    /// Cases of a suite restricted to a comma-separated name filter, in
    /// registration order. An empty filter selects the whole suite.
    std::vector<CaseDefinition> selectCases(std::string_view suite, std::string_view filter = {});

    /// Distinct variants referenced by the cases, in first-use order
    std::vector<std::string> requiredVariants(const std::vector<CaseDefinition>& cases);

} // namespace tabench
