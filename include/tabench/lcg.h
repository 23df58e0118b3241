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
 * @file lcg.h
 * @brief Deterministic sequence generator used by the dataset synthesizer.
 *
 * state = (1664525 * state + 1013904223) mod 2^32, output = state / 2^32.
 * The modulus is implicit in uint32_t wrap-around. The stream depends only on
 * the seed and the number of calls, so every engine seeded with the same
 * constant produces the same dataset.
 */

#include <cstdint>

#include "definitions.h"

namespace tabench {

    class Lcg {
        uint32_t state_;

    public:
        explicit constexpr Lcg(uint32_t seed = DEFAULT_SEED) noexcept : state_(seed) {}

        /// Advance and return a value in [0, 1)
        constexpr double next() noexcept {
            state_ = LCG_MULTIPLIER * state_ + LCG_INCREMENT;
            return static_cast<double>(state_) / LCG_MODULUS;
        }

        constexpr uint32_t state() const noexcept { return state_; }
    };

} // namespace tabench
