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
 * @file operation.h
 * @brief Capability interface for a benchmarked query.
 *
 * An Operation is opaque to the harness: it reads a dataset and reports the
 * cardinality of its result. Implementations must not modify the dataset and
 * must be callable any number of times. Returning std::nullopt means "no
 * result" and is turned into a ContractViolation by the timing harness.
 */

#include <cstddef>
#include <optional>
#include <string>

#include "dataset.h"

namespace tabench {

    class Operation {
    public:
        virtual ~Operation() = default;

        /// Run the query once and return its result cardinality
        virtual std::optional<size_t> apply(const Dataset& dataset) const = 0;

        /// One-line description of the query, for listings
        virtual std::string description() const = 0;
    };

} // namespace tabench
