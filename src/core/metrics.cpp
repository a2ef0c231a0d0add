#include "chunkpack/metrics.hpp"
#include <iomanip>
#include <cmath>
#include <limits>

namespace chunkpack {

// Global metrics instance
static Metrics g_metrics;

Metrics& metrics() {
    return g_metrics;
}

// LatencyHistogram implementation

LatencyHistogram::LatencyHistogram() {
    for (double bound : DEFAULT_BUCKETS) {
        buckets_.emplace_back(bound);
    }
    // +Inf bucket
    buckets_.emplace_back(std::numeric_limits<double>::infinity());
}

void LatencyHistogram::observe(double value_ms) {
    for (auto& bucket : buckets_) {
        if (value_ms <= bucket.upper_bound) {
            bucket.count->fetch_add(1, std::memory_order_relaxed);
            break;
        }
    }

    count_.fetch_add(1, std::memory_order_relaxed);

    double old_sum = sum_.load(std::memory_order_relaxed);
    while (!sum_.compare_exchange_weak(old_sum, old_sum + value_ms,
                                        std::memory_order_relaxed));
}

LatencyHistogram::Snapshot LatencyHistogram::snapshot() const {
    Snapshot snap;
    snap.count = count_.load(std::memory_order_relaxed);
    snap.sum = sum_.load(std::memory_order_relaxed);

    uint64_t cumulative = 0;
    for (const auto& bucket : buckets_) {
        cumulative += bucket.count->load(std::memory_order_relaxed);
        snap.buckets.emplace_back(bucket.upper_bound, cumulative);
    }

    return snap;
}

void LatencyHistogram::reset() {
    for (auto& bucket : buckets_) {
        bucket.count->store(0, std::memory_order_relaxed);
    }
    count_.store(0, std::memory_order_relaxed);
    sum_.store(0, std::memory_order_relaxed);
}

// MetricsExporter implementation

void MetricsExporter::write_counter(std::ostringstream& out,
                                    const std::string& name,
                                    const std::string& help,
                                    uint64_t value) const {
    out << "# HELP " << name << " " << help << "\n";
    out << "# TYPE " << name << " counter\n";
    out << name << " " << value << "\n";
}

void MetricsExporter::write_gauge(std::ostringstream& out,
                                  const std::string& name,
                                  const std::string& help,
                                  double value) const {
    out << "# HELP " << name << " " << help << "\n";
    out << "# TYPE " << name << " gauge\n";
    out << name << " " << std::fixed << std::setprecision(2) << value << "\n";
}

void MetricsExporter::write_histogram(std::ostringstream& out,
                                      const std::string& name,
                                      const std::string& help,
                                      const LatencyHistogram::Snapshot& snap) const {
    out << "# HELP " << name << " " << help << "\n";
    out << "# TYPE " << name << " histogram\n";

    for (const auto& [bound, count] : snap.buckets) {
        out << name << "_bucket{le=\"";
        if (std::isinf(bound)) {
            out << "+Inf";
        } else {
            out << std::fixed << std::setprecision(2) << bound;
        }
        out << "\"} " << count << "\n";
    }

    out << name << "_sum " << std::fixed << std::setprecision(3) << snap.sum << "\n";
    out << name << "_count " << snap.count << "\n";
}

std::string MetricsExporter::export_prometheus() const {
    std::lock_guard lock(mutex_);
    std::ostringstream out;

    auto& m = metrics();

    write_counter(out, "chunkpack_extend_calls_total",
                  "Total number of extend calls", m.extend_calls_total.get());
    write_counter(out, "chunkpack_extend_errors_total",
                  "Total number of rejected extend calls", m.extend_errors_total.get());
    write_counter(out, "chunkpack_batches_recorded_total",
                  "Total number of batches recorded in chunk indexes", m.batches_recorded_total.get());
    write_counter(out, "chunkpack_samples_recorded_total",
                  "Total number of samples recorded in chunk indexes", m.samples_recorded_total.get());
    write_counter(out, "chunkpack_chunks_spawned_total",
                  "Total number of chunks spawned by overflowing batches", m.chunks_spawned_total.get());
    write_counter(out, "chunkpack_bytes_packed_total",
                  "Total payload bytes copied into chunks", m.bytes_packed_total.get());

    write_counter(out, "chunkpack_chunks_serialized_total",
                  "Total chunks serialized", m.chunks_serialized_total.get());
    write_counter(out, "chunkpack_chunks_deserialized_total",
                  "Total chunks deserialized", m.chunks_deserialized_total.get());
    write_counter(out, "chunkpack_deserialize_errors_total",
                  "Total malformed chunk blobs rejected", m.deserialize_errors_total.get());

    write_counter(out, "chunkpack_storage_bytes_written_total",
                  "Total bytes handed to chunk storage", m.storage_bytes_written_total.get());
    write_counter(out, "chunkpack_storage_bytes_read_total",
                  "Total bytes loaded from chunk storage", m.storage_bytes_read_total.get());
    write_gauge(out, "chunkpack_chunks_stored",
                "Chunks currently held by storage backends", m.chunks_stored.get());

    write_histogram(out, "chunkpack_extend_latency_ms",
                    "Extend latency in milliseconds", m.extend_latency_ms.snapshot());
    write_histogram(out, "chunkpack_serialize_latency_ms",
                    "Chunk serialization latency in milliseconds", m.serialize_latency_ms.snapshot());

    write_gauge(out, "chunkpack_uptime_seconds",
                "Time since process start in seconds", m.uptime_seconds());

    return out.str();
}

std::string MetricsExporter::export_json() const {
    std::lock_guard lock(mutex_);
    std::ostringstream out;

    auto& m = metrics();

    out << "{\n";
    out << "  \"packing\": {\n";
    out << "    \"extend_calls\": " << m.extend_calls_total.get() << ",\n";
    out << "    \"extend_errors\": " << m.extend_errors_total.get() << ",\n";
    out << "    \"batches_recorded\": " << m.batches_recorded_total.get() << ",\n";
    out << "    \"samples_recorded\": " << m.samples_recorded_total.get() << ",\n";
    out << "    \"chunks_spawned\": " << m.chunks_spawned_total.get() << ",\n";
    out << "    \"bytes_packed\": " << m.bytes_packed_total.get() << "\n";
    out << "  },\n";

    out << "  \"serialization\": {\n";
    out << "    \"chunks_serialized\": " << m.chunks_serialized_total.get() << ",\n";
    out << "    \"chunks_deserialized\": " << m.chunks_deserialized_total.get() << ",\n";
    out << "    \"deserialize_errors\": " << m.deserialize_errors_total.get() << "\n";
    out << "  },\n";

    out << "  \"storage\": {\n";
    out << "    \"bytes_written\": " << m.storage_bytes_written_total.get() << ",\n";
    out << "    \"bytes_read\": " << m.storage_bytes_read_total.get() << ",\n";
    out << "    \"chunks_stored\": " << static_cast<uint64_t>(m.chunks_stored.get()) << "\n";
    out << "  },\n";

    auto extend_latency = m.extend_latency_ms.snapshot();
    double avg_extend = extend_latency.count > 0 ? extend_latency.sum / extend_latency.count : 0;
    auto serialize_latency = m.serialize_latency_ms.snapshot();
    double avg_serialize = serialize_latency.count > 0 ? serialize_latency.sum / serialize_latency.count : 0;

    out << "  \"latency_ms\": {\n";
    out << "    \"extend_avg\": " << std::fixed << std::setprecision(3) << avg_extend << ",\n";
    out << "    \"serialize_avg\": " << std::fixed << std::setprecision(3) << avg_serialize << "\n";
    out << "  },\n";

    out << "  \"uptime_seconds\": " << std::fixed << std::setprecision(1) << m.uptime_seconds() << "\n";
    out << "}\n";

    return out.str();
}

}  // namespace chunkpack
