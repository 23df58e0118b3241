/*
 * Copyright (c) 2026 The TABENCH Authors
 * 
 * This file is part of the TABENCH project.
 * 
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

/**
 * @file bench_micro_operations.cpp
 * @brief Micro-benchmarks for dataset synthesis and the reference query kernels.
 *
 * Profiles the kernels outside the harness so Google Benchmark's own
 * repetition and statistics can be used. Case benchmarks are registered at
 * startup from the extended suite, one per case, on a fixed-size dataset.
 */

#include <benchmark/benchmark.h>
#include <tabench/tabench.h>

#include <map>
#include <string>

using namespace tabench;

// ============================================================================
// Setup helpers
// ============================================================================

namespace {

constexpr size_t CASE_ROWS = 25000;

// One dataset per variant, shared by every case benchmark
const Dataset& cachedVariant(const std::string& variant) {
    static std::map<std::string, Dataset> cache;
    auto it = cache.find(variant);
    if (it == cache.end()) {
        it = cache.emplace(variant, buildVariant(variant, CASE_ROWS)).first;
    }
    return it->second;
}

} // namespace

// ============================================================================
// Synthesis benchmarks
// ============================================================================

static void BM_Lcg_Next(benchmark::State& state) {
    Lcg rng;
    for (auto _ : state) {
        double v = rng.next();
        benchmark::DoNotOptimize(v);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Lcg_Next);

static void BM_BuildDataset(benchmark::State& state, const std::string& variant) {
    const size_t rows = static_cast<size_t>(state.range(0));
    for (auto _ : state) {
        Dataset ds = buildVariant(variant, rows);
        benchmark::DoNotOptimize(ds.rows().data());
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(rows));
}
BENCHMARK_CAPTURE(BM_BuildDataset, base,      std::string(VARIANT_BASE))->Arg(1000)->Arg(25000);
BENCHMARK_CAPTURE(BM_BuildDataset, high_card, std::string(VARIANT_HIGH_CARD))->Arg(1000)->Arg(25000);
BENCHMARK_CAPTURE(BM_BuildDataset, missing,   std::string(VARIANT_MISSING))->Arg(1000)->Arg(25000);
BENCHMARK_CAPTURE(BM_BuildDataset, wide,      std::string(VARIANT_WIDE))->Arg(1000)->Arg(25000);

// ============================================================================
// Case benchmarks
// ============================================================================

static void BM_Case(benchmark::State& state, const CaseDefinition& def) {
    const Dataset& ds = cachedVariant(def.variant);
    for (auto _ : state) {
        size_t n = invokeChecked(*def.operation, ds, def.name);
        benchmark::DoNotOptimize(n);
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(ds.rowCount()));
}

int main(int argc, char** argv) {
    for (const auto& def : getExtendedCasesCached()) {
        benchmark::RegisterBenchmark(("BM_Case/" + def.name).c_str(),
                                     [&def](benchmark::State& st) { BM_Case(st, def); })
            ->Unit(benchmark::kMicrosecond);
    }

    benchmark::Initialize(&argc, argv);
    if (benchmark::ReportUnrecognizedArguments(argc, argv)) return 1;
    benchmark::RunSpecifiedBenchmarks();
    benchmark::Shutdown();
    return 0;
}
