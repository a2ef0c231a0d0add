#pragma once

#include "types.hpp"
#include <string>
#include <sstream>
#include <atomic>
#include <mutex>
#include <memory>
#include <chrono>
#include <vector>

namespace chunkpack {

// Histogram bucket for latency tracking
struct HistogramBucket {
    double upper_bound;
    std::unique_ptr<std::atomic<uint64_t>> count;

    HistogramBucket(double bound) : upper_bound(bound), count(std::make_unique<std::atomic<uint64_t>>(0)) {}
};

// Latency histogram with fixed buckets
class LatencyHistogram {
public:
    LatencyHistogram();

    void observe(double value_ms);

    struct Snapshot {
        std::vector<std::pair<double, uint64_t>> buckets;  // cumulative
        uint64_t count;
        double sum;
    };

    Snapshot snapshot() const;
    void reset();

private:
    std::vector<HistogramBucket> buckets_;
    std::atomic<uint64_t> count_{0};
    std::atomic<double> sum_{0};

    // Bucket bounds in milliseconds. Packing is in-memory, so the scale is finer
    // than for I/O bound operations.
    static constexpr double DEFAULT_BUCKETS[] = {
        0.01, 0.05, 0.1, 0.5, 1, 2.5, 5, 10, 25, 50, 100, 250, 1000
    };
};

// Counter metric
class Counter {
public:
    Counter() = default;

    void inc(uint64_t n = 1) { value_.fetch_add(n, std::memory_order_relaxed); }
    uint64_t get() const { return value_.load(std::memory_order_relaxed); }
    void reset() { value_.store(0, std::memory_order_relaxed); }

private:
    std::atomic<uint64_t> value_{0};
};

// Gauge metric (can go up or down)
class Gauge {
public:
    Gauge() = default;

    void set(double v) { value_.store(v, std::memory_order_relaxed); }
    void inc(double n = 1) {
        double old = value_.load();
        while (!value_.compare_exchange_weak(old, old + n));
    }
    void dec(double n = 1) { inc(-n); }
    double get() const { return value_.load(std::memory_order_relaxed); }

private:
    std::atomic<double> value_{0};
};

struct Metrics {
    // Packing
    Counter extend_calls_total;
    Counter extend_errors_total;
    Counter batches_recorded_total;
    Counter samples_recorded_total;
    Counter chunks_spawned_total;
    Counter bytes_packed_total;

    // Serialization
    Counter chunks_serialized_total;
    Counter chunks_deserialized_total;
    Counter deserialize_errors_total;

    // Storage
    Counter storage_bytes_written_total;
    Counter storage_bytes_read_total;
    Gauge chunks_stored;

    LatencyHistogram extend_latency_ms;
    LatencyHistogram serialize_latency_ms;

    std::chrono::steady_clock::time_point start_time;

    Metrics() : start_time(std::chrono::steady_clock::now()) {}

    double uptime_seconds() const {
        auto now = std::chrono::steady_clock::now();
        return std::chrono::duration<double>(now - start_time).count();
    }
};

// Global metrics instance
Metrics& metrics();

// Renders the global metrics
class MetricsExporter {
public:
    MetricsExporter() = default;

    std::string export_prometheus() const;
    std::string export_json() const;

private:
    mutable std::mutex mutex_;

    void write_counter(std::ostringstream& out, const std::string& name,
                       const std::string& help, uint64_t value) const;
    void write_gauge(std::ostringstream& out, const std::string& name,
                     const std::string& help, double value) const;
    void write_histogram(std::ostringstream& out, const std::string& name,
                         const std::string& help,
                         const LatencyHistogram::Snapshot& snap) const;
};

// RAII timer for latency measurement
class LatencyTimer {
public:
    explicit LatencyTimer(LatencyHistogram& histogram)
        : histogram_(histogram)
        , start_(std::chrono::steady_clock::now())
    {}

    ~LatencyTimer() {
        auto end = std::chrono::steady_clock::now();
        double ms = std::chrono::duration<double, std::milli>(end - start_).count();
        histogram_.observe(ms);
    }

    LatencyTimer(const LatencyTimer&) = delete;
    LatencyTimer& operator=(const LatencyTimer&) = delete;

private:
    LatencyHistogram& histogram_;
    std::chrono::steady_clock::time_point start_;
};

#define CHUNKPACK_CONCAT_INNER(a, b) a##b
#define CHUNKPACK_CONCAT(a, b) CHUNKPACK_CONCAT_INNER(a, b)

#define CHUNKPACK_TIME_OPERATION(histogram) \
    chunkpack::LatencyTimer CHUNKPACK_CONCAT(_timer_, __LINE__)(histogram)

}  // namespace chunkpack
