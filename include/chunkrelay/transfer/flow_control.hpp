#pragma once

#include "chunkrelay/transfer/transfer_config.hpp"
#include "chunkrelay/transfer/transfer_types.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>

namespace chunkrelay::transfer {

// Window, pacing and backpressure for one sending session. The window and
// pacing knobs move only on adjust(), never per chunk.
class FlowMonitor {
public:
    using Clock = std::chrono::steady_clock;

    explicit FlowMonitor(FlowConfig config = {});

    // Sample feeds
    void on_ack_received(std::chrono::milliseconds rtt, std::size_t bytes);
    void on_bytes_sent(std::size_t bytes);
    void on_failure();

    // Recomputes window and pacing if adjust_interval has elapsed.
    bool maybe_adjust(Clock::time_point now = Clock::now());
    void adjust(Clock::time_point now = Clock::now());

    std::uint32_t get_window_size() const { return window_size_.load(); }
    std::chrono::milliseconds get_pacing_delay() const;

    // RTT estimation
    std::chrono::milliseconds get_smoothed_rtt() const;
    std::chrono::milliseconds get_timeout() const;

    double get_average_throughput() const;
    std::chrono::milliseconds get_average_latency() const;

    // Blocks while the outbound buffer sits above the high watermark, until it
    // drains under the low watermark. Gives up with ChannelUnavailable after
    // buffer_max_wait, or with Cancelled once `cancelled` returns true.
    TransferResult await_buffer_drain(const std::function<std::size_t()>& buffered,
                                      const std::function<bool()>& cancelled) const;

    static std::chrono::milliseconds pacing_for_throughput(double bytes_per_second);

    const FlowConfig& config() const { return config_; }

private:
    void update_rtt(std::chrono::milliseconds rtt);
    double average_of(const std::deque<double>& samples) const;

    FlowConfig config_;

    std::atomic<std::uint32_t> window_size_;
    std::atomic<std::int64_t> pacing_delay_ms_;

    mutable std::mutex mutex_;

    // RTT tracking
    bool have_rtt_;
    double smoothed_rtt_ms_;
    double rtt_variance_ms_;

    // Rolling windows, oldest first
    std::deque<double> throughput_samples_;
    std::deque<double> latency_samples_;

    std::uint64_t bytes_since_adjust_;
    std::uint32_t failures_since_adjust_;
    Clock::time_point last_adjust_;
};

} // namespace chunkrelay::transfer
