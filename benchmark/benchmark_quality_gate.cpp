// ============================================================================
// BENCHMARK: QUALITY GATE EVALUATION
// ============================================================================
// Throughput of evaluating analysis runs against one shared gate
//
// Test scenarios:
// 1. Verdict only (single thread)
// 2. Verdict + violation messages (single thread)
// 3. Concurrent evaluation of one gate (multiple threads)
// ============================================================================

#include <iostream>
#include <chrono>
#include <thread>
#include <vector>
#include <iomanip>
#include <string>
#include <analysisgate/core/quality/quality_gate.hpp>

using namespace AnalysisGate;

// ============================================================================
// BENCHMARK UTILITIES
// ============================================================================

struct BenchmarkResult {
    std::string name;
    uint64_t total_ops;
    uint64_t elapsed_ns;
    double ops_per_sec;
    double ns_per_op;
};

void print_header(const std::string& test_name) {
    std::cout << "\n" << std::string(70, '=') << std::endl;
    std::cout << "TEST: " << test_name << std::endl;
    std::cout << std::string(70, '=') << std::endl;
}

void print_result(const BenchmarkResult& r) {
    std::cout << std::left << std::setw(30) << r.name
              << std::right
              << std::setw(12) << r.total_ops << " ops | "
              << std::setw(10) << std::fixed << std::setprecision(2) << (r.ops_per_sec / 1e6) << "M ops/s | "
              << std::setw(8) << std::fixed << std::setprecision(1) << r.ns_per_op << " ns/op"
              << std::endl;
}

BenchmarkResult make_result(const std::string& name, uint64_t total_ops,
                            std::chrono::high_resolution_clock::time_point start,
                            std::chrono::high_resolution_clock::time_point end) {
    uint64_t elapsed_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count();
    if (elapsed_ns == 0) {
        elapsed_ns = 1;
    }
    return {name, total_ops, elapsed_ns, (total_ops * 1e9) / elapsed_ns, (double)elapsed_ns / total_ops};
}

// Deterministic run whose counts sweep across every threshold boundary
AnalysisRunCounts make_run(uint64_t i) {
    AnalysisRunCounts run;
    run.totalHigh = static_cast<uint32_t>(i % 7);
    run.totalNormal = static_cast<uint32_t>(i % 41);
    run.totalLow = static_cast<uint32_t>(i % 67);
    run.total = run.totalHigh + run.totalNormal + run.totalLow;
    run.newHigh = static_cast<uint32_t>(i % 3);
    run.newNormal = static_cast<uint32_t>(i % 5);
    run.newLow = static_cast<uint32_t>(i % 11);
    run.newTotal = run.newHigh + run.newNormal + run.newLow;
    return run;
}

QualityGate make_gate() {
    Thresholds thresholds;
    thresholds.failedTotalAll = 100;
    thresholds.failedTotalHigh = 5;
    thresholds.unstableTotalAll = 60;
    thresholds.unstableTotalNormal = 30;
    thresholds.failedNewAll = 15;
    thresholds.failedNewHigh = 2;
    thresholds.unstableNewAll = 5;
    thresholds.unstableNewLow = 8;
    return QualityGate(thresholds);
}

BenchmarkResult benchmark_verdict(const QualityGate& gate, uint64_t num_ops) {
    uint64_t failures = 0;
    auto start = std::chrono::high_resolution_clock::now();

    for (uint64_t i = 0; i < num_ops; ++i) {
        if (gate.evaluate(make_run(i)).getOverallResult() == Result::FAILURE) {
            ++failures;
        }
    }

    auto end = std::chrono::high_resolution_clock::now();
    volatile uint64_t sink = failures;  // Prevent optimization
    (void)sink;
    return make_result("Verdict only", num_ops, start, end);
}

BenchmarkResult benchmark_messages(const QualityGate& gate, uint64_t num_ops) {
    uint64_t messages = 0;
    auto start = std::chrono::high_resolution_clock::now();

    for (uint64_t i = 0; i < num_ops; ++i) {
        messages += gate.evaluate(make_run(i)).getEvaluations().size();
    }

    auto end = std::chrono::high_resolution_clock::now();
    volatile uint64_t sink = messages;
    (void)sink;
    return make_result("Verdict + messages", num_ops, start, end);
}

BenchmarkResult benchmark_concurrent(const QualityGate& gate, uint64_t threads, uint64_t ops_per_thread) {
    auto start = std::chrono::high_resolution_clock::now();

    std::vector<std::thread> thread_vec;
    std::vector<uint64_t> failures(threads, 0);
    for (uint64_t t = 0; t < threads; ++t) {
        thread_vec.emplace_back([&, t]() {
            for (uint64_t i = 0; i < ops_per_thread; ++i) {
                if (gate.evaluate(make_run(t * ops_per_thread + i)).getOverallResult() == Result::FAILURE) {
                    ++failures[t];
                }
            }
        });
    }

    for (auto& t : thread_vec) {
        t.join();
    }

    auto end = std::chrono::high_resolution_clock::now();
    return make_result(std::to_string(threads) + " threads", threads * ops_per_thread, start, end);
}

// ============================================================================
// MAIN
// ============================================================================

int main() {
    const QualityGate gate = make_gate();

    print_header("Single thread (1M runs)");
    print_result(benchmark_verdict(gate, 1000000));
    print_result(benchmark_messages(gate, 1000000));

    print_header("Shared gate, concurrent evaluation (250K runs per thread)");
    for (uint64_t threads : {1, 2, 4, 8}) {
        print_result(benchmark_concurrent(gate, threads, 250000));
    }

    return 0;
}
