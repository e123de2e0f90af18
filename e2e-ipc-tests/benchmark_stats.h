#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Per-check timing metrics
struct CallMetrics {
    std::string operation;
    double latency_ms = 0.0;           // Time spent inside the bridge call
    bool success = false;
    std::string status;                // BridgeStatus code ("ok", "timeout", ...)
    std::string error_message;

    json to_json() const {
        return {
            {"operation", operation},
            {"latency_ms", latency_ms},
            {"success", success},
            {"status", status},
            {"error_message", error_message}
        };
    }
};

// Aggregated statistics
struct BenchmarkStats {
    // Latency stats (in milliseconds)
    double min_latency = 0.0;
    double max_latency = 0.0;
    double avg_latency = 0.0;
    double median_latency = 0.0;
    double p95_latency = 0.0;          // 95th percentile
    double p99_latency = 0.0;          // 99th percentile
    double stddev_latency = 0.0;

    // Throughput
    double calls_per_second = 0.0;

    // Totals
    int total_checks = 0;
    int passed_checks = 0;
    int failed_checks = 0;
    double total_duration_sec = 0.0;

    json to_json() const {
        return {
            {"min_ms", min_latency},
            {"max_ms", max_latency},
            {"avg_ms", avg_latency},
            {"median_ms", median_latency},
            {"p95_ms", p95_latency},
            {"p99_ms", p99_latency},
            {"stddev_ms", stddev_latency}
        };
    }
};

// Category statistics
struct CategoryStats {
    std::string name;
    int total = 0;
    int passed = 0;
    int failed = 0;
    double avg_latency_ms = 0.0;
    std::vector<double> latencies;
};

// Outcome of one check
struct TestResult {
    std::string name;
    std::string category;
    bool success = false;
    std::string error;
    std::string expected_status;
    std::string actual_status;
    json value;                        // Raw value returned by the call
    CallMetrics metrics;
};
