/*
 * Copyright (c) 2026 The TABENCH Authors
 * 
 * This file is part of the TABENCH project.
 * 
 * Licensed under the MIT License. See LICENSE file in the project root 
 * for full license information.
 */

#pragma once

/* This file holds all constants and definitions used throughout the TABENCH harness */
#include <cstddef>
#include <cstdint>
#include <string>

namespace tabench {

    // Version information
    constexpr int VERSION_MAJOR = 1;
    constexpr int VERSION_MINOR = 0;
    constexpr int VERSION_PATCH = 0;

    inline std::string getVersion() {
        return std::to_string(VERSION_MAJOR) + "." +
               std::to_string(VERSION_MINOR) + "." +
               std::to_string(VERSION_PATCH);
    }

    // Numerical-Recipes LCG, shared with every paired harness implementation
    constexpr uint32_t LCG_MULTIPLIER       = 1664525u;
    constexpr uint32_t LCG_INCREMENT        = 1013904223u;
    constexpr double   LCG_MODULUS          = 4294967296.0;   // 2^32
    constexpr uint32_t DEFAULT_SEED         = 42;

    // Dataset shape
    constexpr size_t   GROUP_COUNT          = 6;
    constexpr size_t   CITY_COUNT           = 5;
    constexpr size_t   SEGMENT_COUNT        = 3;
    constexpr size_t   WIDE_EXTRA_COLUMNS   = 10;
    constexpr size_t   SKEW_BLOCK           = 100;  // rows per skew block
    constexpr size_t   SKEW_HEAD            = 70;   // rows of each block pinned to the first group
    constexpr size_t   MISSING_CITY_PERIOD  = 23;
    constexpr size_t   MISSING_SEGMENT_PERIOD = 31;
    constexpr size_t   USER_KEY_CYCLE       = 120;
    constexpr size_t   SESSION_KEY_CYCLE    = 300;
    constexpr size_t   SESSION_KEY_STRIDE   = 7;
    constexpr int32_t  VALUE_RANGE          = 1000;
    constexpr int32_t  BUCKET_HIGH_ABOVE    = 700;
    constexpr int32_t  BUCKET_MID_ABOVE     = 350;

    // Harness defaults
    constexpr size_t   WARMUP_INVOCATIONS   = 3;
    constexpr size_t   DEFAULT_ROWS         = 25000;
    constexpr size_t   DEFAULT_ITERATIONS   = 8;
    constexpr size_t   DEFAULT_ROUNDS       = 3;
    constexpr const char* DEFAULT_JSON_OUT  = "bench/results/pandas.json";
    constexpr const char* DEFAULT_ENGINE    = "pandas";
    constexpr const char* DEFAULT_SUITE     = "core";

    // Variant names
    constexpr const char* VARIANT_BASE      = "base";
    constexpr const char* VARIANT_HIGH_CARD = "high_card";
    constexpr const char* VARIANT_MISSING   = "missing";
    constexpr const char* VARIANT_SKEWED    = "skewed";
    constexpr const char* VARIANT_WIDE      = "wide";

} // namespace tabench
