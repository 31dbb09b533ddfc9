#include <benchmark/benchmark.h>
#include <rlog/logger.hpp>

#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <memory>
#include <string>
#include <vector>

#include "test_helpers.hpp"

namespace {

std::unique_ptr<rlog_test::TempDir> g_dir;
std::unique_ptr<rlog::Logger> g_logger;

void setup_logger(uint64_t max_file_size, const char* level = "spam") {
    g_dir = std::make_unique<rlog_test::TempDir>();

    rlog::LoggerOptions opts;
    opts.level = level;
    opts.console = false;
    opts.filename = g_dir->File("bench.log");
    opts.max_file_size = max_file_size;
    opts.max_files = 4;

    rlog::LoggerRuntime runtime;
    runtime.console_out = nullptr;
    runtime.console_err = nullptr;

    g_logger = std::make_unique<rlog::Logger>(opts, runtime);
    g_logger->Open();
}

void teardown_logger() {
    g_logger.reset();
    g_dir.reset();
}

} // namespace

static void BM_SingleThreadLogInfo(benchmark::State& state) {
    setup_logger(0);
    int i = 0;
    for (auto _ : state) {
        g_logger->Info("benchmark message {}", i++);
    }
    state.SetItemsProcessed(state.iterations());
    teardown_logger();
}
BENCHMARK(BM_SingleThreadLogInfo);

static void BM_ContextLogInfo(benchmark::State& state) {
    setup_logger(0);
    rlog::LoggerContext& ctx = g_logger->Context("bench");
    int i = 0;
    for (auto _ : state) {
        ctx.Info("benchmark message {}", i++);
    }
    state.SetItemsProcessed(state.iterations());
    teardown_logger();
}
BENCHMARK(BM_ContextLogInfo);

static void BM_MultiThreadLogInfo(benchmark::State& state) {
    if (state.thread_index() == 0) {
        setup_logger(0);
    }

    int i = 0;
    for (auto _ : state) {
        g_logger->Info("thread {} msg {}", static_cast<int>(state.thread_index()), i++);
    }
    state.SetItemsProcessed(state.iterations());

    if (state.thread_index() == 0) {
        teardown_logger();
    }
}
BENCHMARK(BM_MultiThreadLogInfo)->Threads(4);

// 64 KiB files: rotation and pruning run continuously in the background
static void BM_RotatingLogInfo(benchmark::State& state) {
    setup_logger(64 * 1024);
    int i = 0;
    for (auto _ : state) {
        g_logger->Info("rotating message {}", i++);
    }
    g_logger->Flush();
    state.counters["rotations"] = static_cast<double>(g_logger->FileSink().RotationCount());
    state.counters["dropped"] = static_cast<double>(g_logger->DropCount());
    state.SetItemsProcessed(state.iterations());
    teardown_logger();
}
BENCHMARK(BM_RotatingLogInfo);

static void BM_CompileTimeFiltered(benchmark::State& state) {
    setup_logger(0, "none");
    for (auto _ : state) {
        RLOG_SPAM(*g_logger, "stripped when RLOG_ACTIVE_LEVEL < 5: {}", 42);
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(state.iterations());
    teardown_logger();
}
BENCHMARK(BM_CompileTimeFiltered);

static void BM_RuntimeFiltered(benchmark::State& state) {
    setup_logger(0, "error");
    for (auto _ : state) {
        g_logger->Debug("this should be filtered at runtime {}", 42);
    }
    state.SetItemsProcessed(state.iterations());
    teardown_logger();
}
BENCHMARK(BM_RuntimeFiltered);

static void BM_P99Latency(benchmark::State& state) {
    setup_logger(1024 * 1024);

    std::vector<int64_t> latencies;
    latencies.reserve(1000000);

    for (auto _ : state) {
        auto start = std::chrono::high_resolution_clock::now();
        g_logger->Info("latency test {}", 123);
        auto end = std::chrono::high_resolution_clock::now();
        latencies.push_back(
            std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count());
    }

    if (!latencies.empty()) {
        std::sort(latencies.begin(), latencies.end());
        size_t p99_idx = static_cast<size_t>(latencies.size() * 0.99);
        if (p99_idx >= latencies.size()) p99_idx = latencies.size() - 1;
        state.counters["p99_ns"] = static_cast<double>(latencies[p99_idx]);
        state.counters["p50_ns"] = static_cast<double>(latencies[latencies.size() / 2]);
        state.counters["max_ns"] = static_cast<double>(latencies.back());
    }

    state.SetItemsProcessed(state.iterations());
    teardown_logger();
}
BENCHMARK(BM_P99Latency)->Iterations(100000);

BENCHMARK_MAIN();
