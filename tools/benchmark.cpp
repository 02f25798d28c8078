// Storage benchmark: compares the in-memory backend with the WAL-backed
// persistent backend (checksums on and off).
//
// Runs N PUT+GET cycles directly against each StorageEngine, then compacts
// the persistent stores.
//
// Prints: total ops, elapsed time, ops/sec, and latency percentiles (p50,
// p90, p99, p999) for each backend.

#include "persistence/persistent_storage.hpp"
#include "storage/error.hpp"
#include "storage/memory_storage.hpp"
#include "storage/storage_engine.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <exception>
#include <numeric>
#include <string>
#include <vector>

#include <unistd.h>

namespace {

namespace fs = std::filesystem;

using clock = std::chrono::steady_clock;
using ns    = std::chrono::nanoseconds;

// ── Stats helpers ────────────────────────────────────────────────────────────

struct BenchResult {
    std::size_t total_ops{};
    double elapsed_sec{};
    double ops_per_sec{};
    double p50_us{};
    double p90_us{};
    double p99_us{};
    double p999_us{};
    double avg_us{};
};

BenchResult compute_stats(std::vector<int64_t>& latencies_ns) {
    BenchResult r;
    r.total_ops = latencies_ns.size();

    if (latencies_ns.empty()) return r;

    std::sort(latencies_ns.begin(), latencies_ns.end());

    auto total_ns = std::accumulate(latencies_ns.begin(), latencies_ns.end(), int64_t{0});
    r.elapsed_sec = static_cast<double>(total_ns) / 1e9;
    r.ops_per_sec = static_cast<double>(r.total_ops) / r.elapsed_sec;
    r.avg_us      = static_cast<double>(total_ns) / static_cast<double>(r.total_ops) / 1000.0;

    auto percentile = [&](double p) -> double {
        auto idx = static_cast<std::size_t>(p * static_cast<double>(latencies_ns.size() - 1));
        return static_cast<double>(latencies_ns[idx]) / 1000.0; // ns → µs
    };

    r.p50_us  = percentile(0.50);
    r.p90_us  = percentile(0.90);
    r.p99_us  = percentile(0.99);
    r.p999_us = percentile(0.999);

    return r;
}

void print_result(const char* label, const BenchResult& r) {
    fprintf(stdout,
        "\n── %s ──\n"
        "  Total ops:    %zu\n"
        "  Elapsed:      %.3f s\n"
        "  Throughput:   %.0f ops/sec\n"
        "  Avg latency:  %.1f µs\n"
        "  p50:          %.1f µs\n"
        "  p90:          %.1f µs\n"
        "  p99:          %.1f µs\n"
        "  p99.9:        %.1f µs\n",
        label, r.total_ops, r.elapsed_sec, r.ops_per_sec,
        r.avg_us, r.p50_us, r.p90_us, r.p99_us, r.p999_us);
}

// ── Benchmark runner ─────────────────────────────────────────────────────────

// Every fourth cycle overwrites an earlier key so compaction has work to do.
BenchResult bench_storage(zephyrite::StorageEngine& storage, std::size_t num_cycles) {
    std::vector<int64_t> latencies;
    latencies.reserve(num_cycles * 2); // PUT + GET per cycle

    for (std::size_t i = 0; i < num_cycles; ++i) {
        const std::size_t slot = (i % 4 == 3) ? i / 2 : i;
        std::string key = "key" + std::to_string(slot);
        std::string val = "val" + std::to_string(i);

        {
            auto t0 = clock::now();
            storage.put(key, val);
            auto t1 = clock::now();
            latencies.push_back(std::chrono::duration_cast<ns>(t1 - t0).count());
        }

        {
            auto t0 = clock::now();
            auto v = storage.get(key);
            auto t1 = clock::now();
            latencies.push_back(std::chrono::duration_cast<ns>(t1 - t0).count());
            if (v.content != val) {
                throw zephyrite::StorageError::internal("benchmark read back a stale value for " + key);
            }
        }
    }

    return compute_stats(latencies);
}

void bench_compaction(zephyrite::persistence::PersistentStorage& storage, const char* label) {
    auto t0 = clock::now();
    auto result = storage.compact();
    auto t1 = clock::now();
    fprintf(stdout, "  %s compaction: %zu → %zu entries in %.1f ms\n",
            label, result.entries_before, result.entries_after,
            std::chrono::duration<double, std::milli>(t1 - t0).count());
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    // Suppress storage logs during benchmark.
    spdlog::set_level(spdlog::level::warn);

    std::size_t num_cycles = 10'000;
    if (argc > 1) {
        num_cycles = static_cast<std::size_t>(std::atol(argv[1]));
        if (num_cycles == 0) num_cycles = 10'000;
    }

    const fs::path work_dir = fs::temp_directory_path() /
        ("zephyrite-bench-" + std::to_string(::getpid()));

    fprintf(stdout,
        "Zephyrite Storage Benchmark\n"
        "===========================\n"
        "Cycles:   %zu (each cycle = 1 PUT + 1 GET = 2 ops)\n"
        "WAL dir:  %s\n",
        num_cycles, work_dir.string().c_str());

    try {
        fs::create_directories(work_dir);

        zephyrite::MemoryStorage memory{num_cycles};
        zephyrite::persistence::PersistentStorage checked{
            work_dir / "checked.wal", true, num_cycles};
        zephyrite::persistence::PersistentStorage unchecked{
            work_dir / "unchecked.wal", false, num_cycles};

        auto memory_result    = bench_storage(memory, num_cycles);
        auto checked_result   = bench_storage(checked, num_cycles);
        auto unchecked_result = bench_storage(unchecked, num_cycles);

        print_result("Memory", memory_result);
        print_result("Persistent (checksums)", checked_result);
        print_result("Persistent (no checksums)", unchecked_result);

        fprintf(stdout, "\n── Compaction ──\n");
        bench_compaction(checked, "checksums");
        bench_compaction(unchecked, "no checksums");

        if (memory_result.ops_per_sec > 0 && checked_result.ops_per_sec > 0) {
            fprintf(stdout,
                "\n── Comparison ──\n"
                "  Memory / Persistent throughput ratio: %.2fx\n",
                memory_result.ops_per_sec / checked_result.ops_per_sec);
        }
    } catch (const std::exception& e) {
        fprintf(stderr, "benchmark failed: %s\n", e.what());
        std::error_code ec;
        fs::remove_all(work_dir, ec);
        return 1;
    }

    fprintf(stdout, "\n");

    std::error_code ec;
    fs::remove_all(work_dir, ec);
    if (ec) {
        fprintf(stderr, "failed to remove %s: %s\n", work_dir.string().c_str(), ec.message().c_str());
    }

    return 0;
}
