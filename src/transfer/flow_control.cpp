#include "chunkrelay/transfer/flow_control.hpp"
#include "chunkrelay/core/logger.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <thread>

namespace chunkrelay::transfer {

namespace {
    constexpr double KiB = 1024.0;
    constexpr double MiB = 1024.0 * KiB;

    constexpr double RTT_ALPHA = 0.125;
    constexpr double RTT_BETA = 0.25;
}

FlowMonitor::FlowMonitor(FlowConfig config)
    : config_(config)
    , window_size_(std::clamp(config.initial_window, config.min_window, config.max_window))
    , pacing_delay_ms_(0)
    , have_rtt_(false)
    , smoothed_rtt_ms_(0.0)
    , rtt_variance_ms_(0.0)
    , bytes_since_adjust_(0)
    , failures_since_adjust_(0)
    , last_adjust_(Clock::now()) {
}

void FlowMonitor::on_ack_received(std::chrono::milliseconds rtt, std::size_t bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    update_rtt(rtt);

    latency_samples_.push_back(static_cast<double>(rtt.count()));
    while (latency_samples_.size() > config_.sample_window) {
        latency_samples_.pop_front();
    }

    bytes_since_adjust_ += bytes;
}

void FlowMonitor::on_bytes_sent(std::size_t bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    bytes_since_adjust_ += bytes;
}

void FlowMonitor::on_failure() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++failures_since_adjust_;
}

void FlowMonitor::update_rtt(std::chrono::milliseconds rtt) {
    const double sample = static_cast<double>(rtt.count());
    if (!have_rtt_) {
        smoothed_rtt_ms_ = sample;
        rtt_variance_ms_ = sample / 2.0;
        have_rtt_ = true;
        return;
    }

    rtt_variance_ms_ = (1.0 - RTT_BETA) * rtt_variance_ms_ + RTT_BETA * std::abs(smoothed_rtt_ms_ - sample);
    smoothed_rtt_ms_ = (1.0 - RTT_ALPHA) * smoothed_rtt_ms_ + RTT_ALPHA * sample;
}

bool FlowMonitor::maybe_adjust(Clock::time_point now) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (now - last_adjust_ < config_.adjust_interval) {
            return false;
        }
    }
    adjust(now);
    return true;
}

void FlowMonitor::adjust(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto elapsed = std::chrono::duration<double>(now - last_adjust_).count();
    if (bytes_since_adjust_ > 0 && elapsed > 0.0) {
        throughput_samples_.push_back(static_cast<double>(bytes_since_adjust_) / elapsed);
        while (throughput_samples_.size() > config_.sample_window) {
            throughput_samples_.pop_front();
        }
    }

    const double avg_throughput = average_of(throughput_samples_);
    const double avg_latency = average_of(latency_samples_);
    const bool rising = throughput_samples_.size() >= 2 && throughput_samples_.back() > avg_throughput;

    auto window = window_size_.load();
    const auto old_window = window;

    if (failures_since_adjust_ > 0 || (!latency_samples_.empty() &&
                                       avg_latency >= static_cast<double>(config_.high_latency.count()))) {
        window = std::max(config_.min_window, window / 2);
    } else if (avg_latency <= static_cast<double>(config_.low_latency.count()) && rising) {
        window = std::min(config_.max_window, window + 1);
    }

    window_size_.store(window);

    std::int64_t pacing = 0;
    if (config_.pacing_enabled && !throughput_samples_.empty()) {
        pacing = pacing_for_throughput(avg_throughput).count();
    }
    pacing_delay_ms_.store(pacing);

    if (window != old_window) {
        LOG_DEBUG("Flow window {} -> {} (latency {:.1f} ms, throughput {:.0f} B/s, failures {})",
                  old_window, window, avg_latency, avg_throughput, failures_since_adjust_);
    }

    bytes_since_adjust_ = 0;
    failures_since_adjust_ = 0;
    last_adjust_ = now;
}

std::chrono::milliseconds FlowMonitor::get_pacing_delay() const {
    return std::chrono::milliseconds(pacing_delay_ms_.load());
}

std::chrono::milliseconds FlowMonitor::get_smoothed_rtt() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::chrono::milliseconds(static_cast<std::int64_t>(std::llround(smoothed_rtt_ms_)));
}

std::chrono::milliseconds FlowMonitor::get_timeout() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!have_rtt_) {
        return std::clamp(config_.initial_rto, config_.min_rto, config_.max_rto);
    }

    // Timeout = SRTT + 4 * RTTVAR
    auto timeout = std::chrono::milliseconds(
        static_cast<std::int64_t>(std::ceil(smoothed_rtt_ms_ + 4.0 * rtt_variance_ms_)));
    return std::clamp(timeout, config_.min_rto, config_.max_rto);
}

double FlowMonitor::get_average_throughput() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return average_of(throughput_samples_);
}

std::chrono::milliseconds FlowMonitor::get_average_latency() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::chrono::milliseconds(static_cast<std::int64_t>(std::llround(average_of(latency_samples_))));
}

double FlowMonitor::average_of(const std::deque<double>& samples) const {
    if (samples.empty()) {
        return 0.0;
    }
    return std::accumulate(samples.begin(), samples.end(), 0.0) / static_cast<double>(samples.size());
}

TransferResult FlowMonitor::await_buffer_drain(const std::function<std::size_t()>& buffered,
                                               const std::function<bool()>& cancelled) const {
    if (buffered() <= config_.buffer_high_watermark) {
        return TransferResult();
    }

    const auto deadline = Clock::now() + config_.buffer_max_wait;
    LOG_DEBUG("Outbound buffer above {} bytes, waiting for drain", config_.buffer_high_watermark);

    while (buffered() >= config_.buffer_low_watermark) {
        if (cancelled && cancelled()) {
            return TransferResult(TransferError::Cancelled, "Stopped while waiting for buffer drain");
        }
        if (Clock::now() >= deadline) {
            return TransferResult(TransferError::ChannelUnavailable, "Outbound buffer did not drain");
        }
        std::this_thread::sleep_for(config_.buffer_poll);
    }

    return TransferResult();
}

std::chrono::milliseconds FlowMonitor::pacing_for_throughput(double bytes_per_second) {
    if (bytes_per_second >= 2 * MiB) return std::chrono::milliseconds(0);
    if (bytes_per_second >= 500 * KiB) return std::chrono::milliseconds(5);
    if (bytes_per_second >= 200 * KiB) return std::chrono::milliseconds(10);
    if (bytes_per_second >= 100 * KiB) return std::chrono::milliseconds(20);
    return std::chrono::milliseconds(50);
}

} // namespace chunkrelay::transfer
