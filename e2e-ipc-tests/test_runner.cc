#include "test_runner.h"
#include <iostream>
#include <iomanip>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <numeric>

TestResult TestRunner::ExecuteTest(const std::string& name, Operation& op,
                                   const std::string& category) {
    TestResult result;
    result.name = name;
    result.category = !category.empty() ? category :
                      (!category_.empty() ? category_ : "uncategorized");

    auto start = std::chrono::high_resolution_clock::now();
    BridgeResult outcome = op();
    auto end = std::chrono::high_resolution_clock::now();

    result.metrics.operation = name;
    result.metrics.latency_ms = std::chrono::duration<double, std::milli>(end - start).count();
    result.actual_status = BridgeStatusToCode(outcome.status);
    result.metrics.status = result.actual_status;
    result.value = outcome.value;
    result.error = outcome.message;

    return result;
}

void TestRunner::RecordResult(TestResult& result, bool passed, const std::string& error) {
    result.success = passed;
    result.error = error;
    result.metrics.success = passed;
    result.metrics.error_message = error;
    results_.push_back(result);

    if (verbose_) {
        std::cout << (passed ? "[PASS] " : "[FAIL] ")
                  << result.name << " (" << std::fixed << std::setprecision(1)
                  << result.metrics.latency_ms << "ms)";
        if (!passed && !error.empty()) {
            std::cout << " - " << error;
        }
        std::cout << std::endl;
        std::cout.flush();
    }
}

TestResult TestRunner::Test(const std::string& name, Operation op, const std::string& category) {
    TestResult result = ExecuteTest(name, op, category);
    result.expected_status = BridgeStatusToCode(BridgeStatus::OK);

    bool passed = result.actual_status == result.expected_status;
    std::string error;

    if (!passed) {
        error = "Failed with status: " + result.actual_status + " - " + result.error;
    }

    RecordResult(result, passed, error);
    return result;
}

TestResult TestRunner::TestExpectStatus(const std::string& name, BridgeStatus expected_status,
                                        Operation op, const std::string& category) {
    TestResult result = ExecuteTest(name, op, category);
    result.expected_status = BridgeStatusToCode(expected_status);

    bool passed = result.actual_status == result.expected_status;
    std::string error;

    if (!passed) {
        error = "Expected status '" + result.expected_status + "', got '" +
                result.actual_status + "'";
        if (!result.error.empty()) {
            error += " (" + result.error + ")";
        }
    }

    RecordResult(result, passed, error);
    return result;
}

TestResult TestRunner::TestWithValidator(const std::string& name, Operation op,
                                         ValidationFn validator, const std::string& category) {
    BridgeResult outcome;
    Operation capture = [&]() {
        outcome = op();
        return outcome;
    };
    TestResult result = ExecuteTest(name, capture, category);
    result.expected_status = BridgeStatusToCode(BridgeStatus::OK);

    std::string error;
    if (!outcome.success) {
        error = "Failed with status: " + result.actual_status + " - " + outcome.message;
    } else {
        error = validator(outcome);
    }

    RecordResult(result, error.empty(), error);
    return result;
}

TestResult TestRunner::Check(const std::string& name, bool condition, const std::string& detail,
                             const std::string& category) {
    TestResult result;
    result.name = name;
    result.category = !category.empty() ? category :
                      (!category_.empty() ? category_ : "uncategorized");
    result.metrics.operation = name;

    RecordResult(result, condition, condition ? "" : (detail.empty() ? "Check failed" : detail));
    return result;
}

std::vector<TestResult> TestRunner::GetFailures() const {
    std::vector<TestResult> failures;
    for (const auto& result : results_) {
        if (!result.success) {
            failures.push_back(result);
        }
    }
    return failures;
}

BenchmarkStats TestRunner::CalculateStats() const {
    BenchmarkStats stats;

    if (results_.empty()) return stats;

    std::vector<double> latencies;

    for (const auto& result : results_) {
        latencies.push_back(result.metrics.latency_ms);

        if (result.success) {
            stats.passed_checks++;
        } else {
            stats.failed_checks++;
        }
    }

    stats.total_checks = results_.size();

    // Sort latencies for percentile calculations
    std::sort(latencies.begin(), latencies.end());

    stats.min_latency = latencies.front();
    stats.max_latency = latencies.back();

    double sum = std::accumulate(latencies.begin(), latencies.end(), 0.0);
    stats.avg_latency = sum / latencies.size();

    size_t mid = latencies.size() / 2;
    stats.median_latency = (latencies.size() % 2 == 0) ?
        (latencies[mid - 1] + latencies[mid]) / 2.0 : latencies[mid];

    stats.p95_latency = latencies[static_cast<size_t>(latencies.size() * 0.95)];
    stats.p99_latency = latencies[static_cast<size_t>(latencies.size() * 0.99)];

    double sq_sum = 0.0;
    for (double lat : latencies) {
        sq_sum += (lat - stats.avg_latency) * (lat - stats.avg_latency);
    }
    stats.stddev_latency = std::sqrt(sq_sum / latencies.size());

    stats.total_duration_sec = sum / 1000.0;
    if (stats.total_duration_sec > 0) {
        stats.calls_per_second = stats.total_checks / stats.total_duration_sec;
    }

    return stats;
}

std::map<std::string, CategoryStats> TestRunner::GetCategoryStats() const {
    std::map<std::string, CategoryStats> category_stats;

    for (const auto& result : results_) {
        auto& cat = category_stats[result.category];
        cat.name = result.category;
        cat.total++;
        if (result.success) {
            cat.passed++;
        } else {
            cat.failed++;
        }
        cat.latencies.push_back(result.metrics.latency_ms);
    }

    for (auto& [name, cat] : category_stats) {
        if (!cat.latencies.empty()) {
            double sum = std::accumulate(cat.latencies.begin(), cat.latencies.end(), 0.0);
            cat.avg_latency_ms = sum / cat.latencies.size();
        }
    }

    return category_stats;
}

bool TestRunner::PrintSummary() {
    int passed = 0, failed = 0;

    for (const auto& result : results_) {
        if (result.success) {
            passed++;
        } else {
            failed++;
        }
    }

    std::cout << "\n========================================\n";
    std::cout << "TEST SUMMARY\n";
    std::cout << "========================================\n";
    std::cout << "Total:  " << results_.size() << "\n";
    std::cout << "Passed: " << passed << "\n";
    std::cout << "Failed: " << failed << "\n";
    std::cout << "========================================\n";

    if (failed > 0) {
        std::cout << "\nFAILED TESTS:\n";
        for (const auto& result : results_) {
            if (!result.success) {
                std::cout << "  - [" << result.category << "] " << result.name;
                if (!result.error.empty()) {
                    std::cout << ": " << result.error;
                }
                std::cout << "\n";
            }
        }
    }

    std::cout << "\nBY CATEGORY:\n";
    for (const auto& [name, cat] : GetCategoryStats()) {
        std::cout << "  " << std::left << std::setw(14) << name << std::right
                  << cat.passed << "/" << cat.total << " passed, avg "
                  << std::fixed << std::setprecision(2) << cat.avg_latency_ms << "ms\n";
    }

    auto stats = CalculateStats();
    std::cout << "\nLATENCY STATS:\n";
    std::cout << "  Min:    " << std::fixed << std::setprecision(2) << stats.min_latency << "ms\n";
    std::cout << "  Max:    " << stats.max_latency << "ms\n";
    std::cout << "  Avg:    " << stats.avg_latency << "ms\n";
    std::cout << "  Median: " << stats.median_latency << "ms\n";
    std::cout << "  P95:    " << stats.p95_latency << "ms\n";
    std::cout << "  P99:    " << stats.p99_latency << "ms\n";
    std::cout << "  StdDev: " << stats.stddev_latency << "ms\n";
    std::cout << "  Duration: " << stats.total_duration_sec << "s\n";

    return failed == 0;
}

void TestRunner::Reset() {
    results_.clear();
    category_.clear();
}
