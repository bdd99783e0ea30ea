/**
 * @file bench_chunk_pipeline.cpp
 * @brief Benchmarks for the per-chunk work done between disk and wire
 */

#include <benchmark/benchmark.h>

#include <kcenon/package_upload/core/chunk_planner.h>
#include <kcenon/package_upload/core/chunk_reader.h>
#include <kcenon/package_upload/core/encoding.h>
#include <kcenon/package_upload/core/progress_aggregator.h>
#include <kcenon/package_upload/core/progress_table.h>

#include "utils/benchmark_helpers.h"

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

namespace kcenon::package_upload::benchmark {

/**
 * @brief Planning cost for a range of installer sizes
 */
static void BM_ChunkPlanner_Plan(::benchmark::State& state) {
    const auto file_size = static_cast<uint64_t>(state.range(0));
    const chunk_config config{static_cast<uint64_t>(state.range(1))};

    for (auto _ : state) {
        auto plan = chunk_planner::plan(file_size, config);
        if (!plan) {
            state.SkipWithError("Planning failed");
            return;
        }
        ::benchmark::DoNotOptimize(plan.value().chunks.data());
    }

    state.SetItemsProcessed(static_cast<int64_t>(config.calculate_chunk_count(file_size)) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Reading every chunk of a file through independent streams
 */
static void BM_ChunkReader_ReadAll(::benchmark::State& state) {
    const auto file_size = static_cast<std::size_t>(state.range(0));

    temp_file_manager temp_files;
    auto path = temp_files.create_random_file("read_test.bin", file_size, 42);

    auto plan = chunk_planner::plan(file_size, chunk_config{sizes::min_chunk});
    if (!plan) {
        state.SkipWithError("Planning failed");
        return;
    }
    chunk_reader reader(path);

    for (auto _ : state) {
        for (const auto& c : plan.value().chunks) {
            auto data = reader.read(c);
            if (!data) {
                state.SkipWithError("Read failed");
                return;
            }
            ::benchmark::DoNotOptimize(data.value().data());
        }
    }

    state.SetBytesProcessed(static_cast<int64_t>(file_size) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Base64 encoding of one chunk payload for the chunk-id body
 */
static void BM_Base64_EncodeChunk(::benchmark::State& state) {
    const auto size = static_cast<std::size_t>(state.range(0));
    auto data = generate_random_data(size, 42);

    for (auto _ : state) {
        auto encoded = encoding::base64_encode(data);
        ::benchmark::DoNotOptimize(encoded.data());
    }

    state.SetBytesProcessed(static_cast<int64_t>(size) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Status transitions from several workers while a reader polls
 */
static void BM_ProgressTable_Contention(::benchmark::State& state) {
    const auto workers = static_cast<std::size_t>(state.range(0));
    constexpr uint64_t chunk_count = 1024;

    auto plan = chunk_planner::plan(chunk_count * sizes::min_chunk, chunk_config{sizes::min_chunk});
    if (!plan) {
        state.SkipWithError("Planning failed");
        return;
    }

    for (auto _ : state) {
        auto progress = std::make_shared<progress_aggregator>();
        auto table = std::make_shared<progress_table>(plan.value());
        progress->attach(table);
        std::atomic<uint32_t> next{1};
        std::atomic<bool> done{false};

        std::thread poller([&] {
            while (!done.load()) {
                ::benchmark::DoNotOptimize(progress->summary().percent);
            }
        });

        std::vector<std::thread> threads;
        threads.reserve(workers);
        for (std::size_t w = 0; w < workers; ++w) {
            threads.emplace_back([&] {
                for (auto n = next.fetch_add(1); n <= chunk_count; n = next.fetch_add(1)) {
                    table->mark_in_flight(n);
                    table->mark_committed(n);
                }
            });
        }
        for (auto& t : threads) {
            t.join();
        }
        done.store(true);
        poller.join();
    }

    state.SetItemsProcessed(static_cast<int64_t>(chunk_count) *
                            static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_ChunkPlanner_Plan)
    ->Args({static_cast<int64_t>(100 * sizes::MB), static_cast<int64_t>(sizes::default_chunk)})
    ->Args({static_cast<int64_t>(1 * sizes::GB), static_cast<int64_t>(sizes::default_chunk)})
    ->Args({static_cast<int64_t>(8 * sizes::GB), static_cast<int64_t>(sizes::min_chunk)})
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_ChunkReader_ReadAll)
    ->Arg(static_cast<int64_t>(16 * sizes::MB))
    ->Arg(static_cast<int64_t>(64 * sizes::MB))
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_Base64_EncodeChunk)
    ->Arg(static_cast<int64_t>(sizes::min_chunk))
    ->Arg(static_cast<int64_t>(sizes::default_chunk))
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_ProgressTable_Contention)
    ->Arg(1)
    ->Arg(4)
    ->Arg(8)
    ->Unit(::benchmark::kMillisecond);

}  // namespace kcenon::package_upload::benchmark
