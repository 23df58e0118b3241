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
 * @file timing.hpp
 * @brief Timing harness implementations.
 */

#include "timing.h"
#include "barrier.h"
#include "errors.h"

#include <algorithm>
#include <numeric>
#include <optional>
#include <string>

namespace tabench {

    inline double mean(const std::vector<double>& values) {
        if (values.empty()) return 0;
        return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
    }

    inline double median(std::vector<double> values) {
        if (values.empty()) return 0;
        std::sort(values.begin(), values.end());
        const size_t n = values.size();
        return (n % 2 == 0) ? (values[n / 2 - 1] + values[n / 2]) / 2.0 : values[n / 2];
    }

    inline size_t invokeChecked(const Operation& operation, const Dataset& dataset, std::string_view caseName) {
        const std::optional<size_t> result = operation.apply(dataset);
        if (!result) {
            throw ContractViolation(std::string(caseName), "returned no result");
        }
        doNotOptimize(*result);
        return *result;
    }

    inline CaseMeasurement measureCase(const Operation& operation, const Dataset& dataset,
                                       size_t iterations, size_t rounds, std::string_view caseName) {
        if (iterations == 0) {
            throw ConfigError("case '" + std::string(caseName) + "': iterations must be at least 1");
        }

        CaseMeasurement m;
        m.round_averages_ms.reserve(rounds);

        // Warmup: results checked, timings discarded
        for (size_t i = 0; i < WARMUP_INVOCATIONS; ++i) {
            m.last_result = invokeChecked(operation, dataset, caseName);
            ++m.invocations;
        }

        Timer timer;
        std::vector<double> samples(iterations);
        for (size_t round = 0; round < rounds; ++round) {
            for (size_t i = 0; i < iterations; ++i) {
                clobberMemory();
                timer.start();
                const std::optional<size_t> result = operation.apply(dataset);
                samples[i] = timer.stop();
                clobberMemory();
                ++m.invocations;

                if (!result) {
                    throw ContractViolation(std::string(caseName), "returned no result");
                }
                doNotOptimize(*result);
                m.last_result = *result;
            }
            m.round_averages_ms.push_back(mean(samples));
        }

        m.robust_average_ms = median(m.round_averages_ms);
        return m;
    }

} // namespace tabench
