/*
 * Copyright (c) 2026 The TABENCH Authors
 * 
 * This file is part of the TABENCH project.
 * 
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

#include <tabench/tabench.h>

#include <gtest/gtest.h>

#include <cstdint>
#include <vector>

using tabench::Lcg;

TEST(LcgTest, FirstOutputsForDefaultSeed) {
    Lcg rng;
    EXPECT_EQ(rng.state(), 42u);

    EXPECT_DOUBLE_EQ(rng.next(), 0.2523451747838408);
    EXPECT_EQ(rng.state(), 1083814273u);

    EXPECT_DOUBLE_EQ(rng.next(), 0.08812504541128874);
    EXPECT_EQ(rng.state(), 378494188u);

    EXPECT_DOUBLE_EQ(rng.next(), 0.5772811982315034);
    EXPECT_EQ(rng.state(), 2479403867u);
}

TEST(LcgTest, OutputIsStateOverTwoToThe32) {
    Lcg rng(7);
    for (int i = 0; i < 100; ++i) {
        const double v = rng.next();
        EXPECT_EQ(v, static_cast<double>(rng.state()) / 4294967296.0);
    }
}

TEST(LcgTest, StaysInUnitInterval) {
    Lcg rng;
    for (int i = 0; i < 100000; ++i) {
        const double v = rng.next();
        ASSERT_GE(v, 0.0);
        ASSERT_LT(v, 1.0);
    }
}

TEST(LcgTest, SameSeedSameSequence) {
    Lcg a(tabench::DEFAULT_SEED);
    Lcg b(tabench::DEFAULT_SEED);
    for (int i = 0; i < 1000; ++i) {
        ASSERT_EQ(a.next(), b.next()) << "diverged at draw " << i;
    }

    Lcg c(43);
    Lcg d(42);
    EXPECT_NE(c.next(), d.next());
}

TEST(LcgTest, StateWrapsModulo2To32) {
    Lcg rng(0xFFFFFFFFu);
    rng.next();
    EXPECT_EQ(rng.state(), 1012239698u);
}

TEST(LcgTest, UsableInConstantExpressions) {
    constexpr uint32_t state = [] {
        Lcg rng;
        rng.next();
        return rng.state();
    }();
    static_assert(state == 1083814273u);
    SUCCEED();
}
