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
 * @file barrier.h
 * @brief Keeps case results and timer reads from being folded away.
 *
 * measureCase() wraps each timed apply() in clobberMemory() and sinks the
 * returned cardinality through doNotOptimize().
 */

#include <atomic>

namespace tabench {

    /// Marks `value` as read by an opaque consumer
    template<typename T>
    inline void doNotOptimize(const T& value) {
#if defined(__GNUC__) || defined(__clang__)
        asm volatile("" : : "g"(value) : "memory");
#else
        volatile auto sink = value;
        (void)sink;
#endif
    }

    /// No loads or stores move across this point
    inline void clobberMemory() {
#if defined(__GNUC__) || defined(__clang__)
        asm volatile("" : : : "memory");
#else
        std::atomic_signal_fence(std::memory_order_seq_cst);
#endif
    }

} // namespace tabench
