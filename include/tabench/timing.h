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
 * @file timing.h
 * @brief Timing harness: warmup, rounds of timed invocations, robust average.
 *
 * measureCase() runs an operation WARMUP_INVOCATIONS times untimed, then
 * `rounds` rounds of `iterations` timed invocations each. Every round is
 * reduced to its arithmetic mean; the reported figure is the median of the
 * round means. The aggregation level is part of the result format: samples
 * are never pooled across rounds.
 *
 * An invocation that returns no result aborts the measurement with a
 * ContractViolation, whether it happens during warmup or timing.
 */

#include <chrono>
#include <cstddef>
#include <string_view>
#include <vector>

#include "dataset.h"
#include "operation.h"

namespace tabench {

    // ========================================================================
    // Invocation stopwatch
    // ========================================================================

    /// Brackets one Operation::apply call. stop() returns the span just
    /// measured; elapsedMs() repeats it until the next start().
    class Timer {
    public:
        using Clock = std::chrono::steady_clock;

        void start() {
            begin_ = Clock::now();
            span_  = Clock::duration::zero();
        }

        double stop() {
            span_ = Clock::now() - begin_;
            return elapsedMs();
        }

        double elapsedMs() const {
            return std::chrono::duration<double, std::milli>(span_).count();
        }

    private:
        Clock::time_point begin_{};
        Clock::duration   span_{Clock::duration::zero()};
    };

    // ========================================================================
    // Statistics helpers
    // ========================================================================

    /// Arithmetic mean; 0 for an empty sequence
    double mean(const std::vector<double>& values);

    /// Median of a copy of values: middle element (odd) or mean of the two
    /// central elements (even); 0 for an empty sequence
    double median(std::vector<double> values);

    // ========================================================================
    // Measurement
    // ========================================================================

    struct CaseMeasurement {
        std::vector<double> round_averages_ms;      // one per round, in execution order
        double              robust_average_ms = 0;  // median(round_averages_ms)
        size_t              last_result       = 0;  // cardinality of the final invocation
        size_t              invocations       = 0;  // total calls, warmup included
    };

    /// Run one invocation and enforce the result contract
    size_t invokeChecked(const Operation& operation, const Dataset& dataset, std::string_view caseName);

    CaseMeasurement measureCase(const Operation& operation, const Dataset& dataset,
                                size_t iterations, size_t rounds, std::string_view caseName);

} // namespace tabench
