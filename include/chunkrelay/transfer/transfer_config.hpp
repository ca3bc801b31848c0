#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace chunkrelay::core {
class Config;
}

namespace chunkrelay::transfer {

struct SizeBudget {
    std::uint64_t max_message_size = 65536;
    std::uint64_t framing_reserve = 512;

    static SizeBudget from_config(const core::Config& config);
};

struct FlowConfig {
    std::uint32_t initial_window = 4;
    std::uint32_t min_window = 1;
    std::uint32_t max_window = 16;
    std::size_t sample_window = 10;
    std::chrono::milliseconds adjust_interval{1000};
    std::chrono::milliseconds low_latency{200};
    std::chrono::milliseconds high_latency{1000};
    bool pacing_enabled = true;
    std::size_t buffer_high_watermark = 1024 * 1024;
    std::size_t buffer_low_watermark = 256 * 1024;
    std::chrono::milliseconds buffer_poll{10};
    std::chrono::milliseconds buffer_max_wait{5000};
    std::chrono::milliseconds initial_rto{1000};
    std::chrono::milliseconds min_rto{100};
    std::chrono::milliseconds max_rto{10000};

    static FlowConfig from_config(const core::Config& config);
};

struct SenderConfig {
    bool require_ack = true;
    std::uint32_t max_chunk_retries = 3;
    std::chrono::milliseconds request_timeout{30000};
    std::chrono::milliseconds confirmation_timeout{10000};

    static SenderConfig from_config(const core::Config& config);
};

struct ReceiverConfig {
    std::chrono::milliseconds idle_timeout{120000};

    static ReceiverConfig from_config(const core::Config& config);
};

struct ResumeConfig {
    double trigger_ratio = 0.95;
    std::chrono::milliseconds stall_timeout{2000};
    std::chrono::milliseconds status_timeout{5000};
    std::uint32_t max_rounds = 5;
    std::uint32_t batch_size = 32;
    std::chrono::milliseconds batch_delay{0};

    static ResumeConfig from_config(const core::Config& config);
};

// Everything one endpoint needs to run both directions.
struct TransferOptions {
    SizeBudget budget;
    FlowConfig flow;
    SenderConfig sender;
    ReceiverConfig receiver;
    ResumeConfig resume;
    std::chrono::milliseconds session_grace{30000};
    std::chrono::milliseconds maintenance_interval{500};

    static TransferOptions from_config(const core::Config& config);
};

}
