#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace mqtransit {

/**
 * Thread-safe transport counters plus handler latency percentiles
 * over a sliding window.
 */
class Metrics {
public:
    struct Stats {
        double p50 = 0.0;
        double p90 = 0.0;
        double p99 = 0.0;
        uint64_t packets_published = 0;
        uint64_t packets_dropped = 0;
        uint64_t packets_received = 0;
        uint64_t packets_acked = 0;
        uint64_t packets_nacked = 0;
        double received_per_second = 0.0;
    };

    explicit Metrics(std::chrono::milliseconds window_size = std::chrono::milliseconds(1000));

    void record_handler_latency(std::chrono::nanoseconds latency);

    void record_published();

    // Publish attempted without a channel.
    void record_dropped();

    void record_received();

    void record_acked();

    void record_nacked();

    Stats get_stats();

    void reset();

private:
    void trim_samples();
    double calculate_percentile(const std::vector<double>& sorted_samples, double percentile);

    static constexpr size_t kMaxSamples = 1000;

    std::chrono::milliseconds window_size_;
    std::chrono::steady_clock::time_point window_start_;

    std::vector<double> latency_samples_;
    std::mutex samples_mutex_;

    std::atomic<uint64_t> packets_published_{0};
    std::atomic<uint64_t> packets_dropped_{0};
    std::atomic<uint64_t> packets_received_{0};
    std::atomic<uint64_t> packets_acked_{0};
    std::atomic<uint64_t> packets_nacked_{0};

    std::mutex rate_mutex_;
    std::chrono::steady_clock::time_point last_rate_calc_;
    uint64_t last_received_count_{0};
};

namespace metrics_utils {
    std::string format_stats(const Metrics::Stats& stats);
    std::string format_duration(std::chrono::nanoseconds duration);
}

} // namespace mqtransit
