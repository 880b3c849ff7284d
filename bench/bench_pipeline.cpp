/**
 * @file  bench/bench_pipeline.cpp
 * @brief Google Benchmark suite for the QMJ pipeline.
 *
 * Benchmarks
 * ----------
 *   BM_Normalize_Period     — one cross-section, all standardized metrics
 *   BM_Pipeline_Run         — full panel, 1 / 2 / 4 workers
 *   BM_Loader_ParseCsv      — CSV text → PanelStore
 *
 * Build (CMake):
 *   cmake -DQMJ_BENCH=ON ..
 *   cmake --build build --target bench_pipeline
 *   ./build/bench_pipeline --benchmark_format=json
 *
 * Throughput units: items/second (entity-period records processed).
 */

#include "benchmark/benchmark.h"

#include "qmj/data_loader.hpp"
#include "qmj/normalizer.hpp"
#include "qmj/pipeline.hpp"

#include "panel_fixtures.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

using namespace qmj;
using namespace qmj::core;
using namespace qmj::factor;
using namespace qmj::engine;

// ── Normalizer ────────────────────────────────────────────────────────────────

static void BM_Normalize_Period(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    const auto records  = fixtures::random_panel(n, 1);
    const auto metrics  = PipelineConfig{}.standardized_metrics();
    const CrossSectionalNormalizer normalizer;

    for (auto _ : state) {
        std::vector<Diagnostic> diags;
        auto z = normalizer.normalize(records, metrics, diags);
        benchmark::DoNotOptimize(z);
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}
BENCHMARK(BM_Normalize_Period)->RangeMultiplier(4)->Range(64, 16384)->Unit(benchmark::kMicrosecond);

// ── Full pipeline ─────────────────────────────────────────────────────────────

static void BM_Pipeline_Run(benchmark::State& state) {
    const std::size_t workers = static_cast<std::size_t>(state.range(0));
    const std::size_t years   = 20;
    const std::size_t n       = 2000;
    const PanelStore panel(fixtures::random_panel(n, years));

    PipelineConfig cfg;
    cfg.workers = workers;
    const Pipeline pipeline(cfg);

    for (auto _ : state) {
        auto result = pipeline.run(panel);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) *
                            static_cast<int64_t>(n * years));
}
BENCHMARK(BM_Pipeline_Run)->Arg(1)->Arg(2)->Arg(4)->Unit(benchmark::kMillisecond)->UseRealTime();

// ── Loader ────────────────────────────────────────────────────────────────────

static void BM_Loader_ParseCsv(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    const auto csv = fixtures::to_csv(fixtures::random_panel(n, 5));

    for (auto _ : state) {
        auto panel = PanelLoader::parse_csv_string(csv);
        benchmark::DoNotOptimize(panel);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) *
                            static_cast<int64_t>(n * 5));
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) *
                            static_cast<int64_t>(csv.size()));
}
BENCHMARK(BM_Loader_ParseCsv)->RangeMultiplier(4)->Range(64, 4096)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
