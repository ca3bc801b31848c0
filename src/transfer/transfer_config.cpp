#include "chunkrelay/transfer/transfer_config.hpp"
#include "chunkrelay/core/config.hpp"
#include <algorithm>

namespace chunkrelay::transfer {

namespace {
    std::chrono::milliseconds get_ms(const core::Config& config, const std::string& key,
                                     std::chrono::milliseconds fallback) {
        return std::chrono::milliseconds(config.get_uint64(key, static_cast<std::uint64_t>(fallback.count())));
    }

    std::uint32_t get_u32(const core::Config& config, const std::string& key, std::uint32_t fallback) {
        return static_cast<std::uint32_t>(config.get_uint64(key, fallback));
    }
}

SizeBudget SizeBudget::from_config(const core::Config& config) {
    SizeBudget budget;
    budget.max_message_size = config.get_uint64("relay.max_message_size", budget.max_message_size);
    budget.framing_reserve = config.get_uint64("relay.framing_reserve", budget.framing_reserve);
    return budget;
}

FlowConfig FlowConfig::from_config(const core::Config& config) {
    FlowConfig flow;
    flow.initial_window = get_u32(config, "flow.initial_window", flow.initial_window);
    flow.min_window = std::max<std::uint32_t>(1, get_u32(config, "flow.min_window", flow.min_window));
    flow.max_window = std::max(flow.min_window, get_u32(config, "flow.max_window", flow.max_window));
    flow.initial_window = std::clamp(flow.initial_window, flow.min_window, flow.max_window);
    flow.sample_window = std::max<std::size_t>(1, config.get_uint64("flow.sample_window", flow.sample_window));
    flow.adjust_interval = get_ms(config, "flow.adjust_interval_ms", flow.adjust_interval);
    flow.low_latency = get_ms(config, "flow.low_latency_ms", flow.low_latency);
    flow.high_latency = get_ms(config, "flow.high_latency_ms", flow.high_latency);
    flow.pacing_enabled = config.get_bool("flow.pacing_enabled", flow.pacing_enabled);
    flow.buffer_high_watermark = config.get_uint64("flow.buffer_high_watermark", flow.buffer_high_watermark);
    flow.buffer_low_watermark = std::min<std::size_t>(
        config.get_uint64("flow.buffer_low_watermark", flow.buffer_low_watermark), flow.buffer_high_watermark);
    flow.buffer_poll = get_ms(config, "flow.buffer_poll_ms", flow.buffer_poll);
    flow.buffer_max_wait = get_ms(config, "flow.buffer_max_wait_ms", flow.buffer_max_wait);
    flow.initial_rto = get_ms(config, "flow.initial_rto_ms", flow.initial_rto);
    flow.min_rto = get_ms(config, "flow.min_rto_ms", flow.min_rto);
    flow.max_rto = std::max(flow.min_rto, get_ms(config, "flow.max_rto_ms", flow.max_rto));
    return flow;
}

SenderConfig SenderConfig::from_config(const core::Config& config) {
    SenderConfig sender;
    sender.require_ack = config.get_bool("transfer.require_ack", sender.require_ack);
    sender.max_chunk_retries = std::max<std::uint32_t>(
        1, get_u32(config, "transfer.max_chunk_retries", sender.max_chunk_retries));
    sender.request_timeout = get_ms(config, "transfer.request_timeout_ms", sender.request_timeout);
    sender.confirmation_timeout = get_ms(config, "transfer.confirmation_timeout_ms", sender.confirmation_timeout);
    return sender;
}

ReceiverConfig ReceiverConfig::from_config(const core::Config& config) {
    ReceiverConfig receiver;
    receiver.idle_timeout = get_ms(config, "transfer.receiver_idle_timeout_ms", receiver.idle_timeout);
    return receiver;
}

ResumeConfig ResumeConfig::from_config(const core::Config& config) {
    ResumeConfig resume;
    resume.trigger_ratio = std::clamp(config.get_double("resume.trigger_ratio", resume.trigger_ratio), 0.0, 1.0);
    resume.stall_timeout = get_ms(config, "resume.stall_timeout_ms", resume.stall_timeout);
    resume.status_timeout = get_ms(config, "resume.status_timeout_ms", resume.status_timeout);
    resume.max_rounds = std::max<std::uint32_t>(1, get_u32(config, "resume.max_rounds", resume.max_rounds));
    resume.batch_size = std::max<std::uint32_t>(1, get_u32(config, "resume.batch_size", resume.batch_size));
    resume.batch_delay = get_ms(config, "resume.batch_delay_ms", resume.batch_delay);
    return resume;
}

TransferOptions TransferOptions::from_config(const core::Config& config) {
    TransferOptions options;
    options.budget = SizeBudget::from_config(config);
    options.flow = FlowConfig::from_config(config);
    options.sender = SenderConfig::from_config(config);
    options.receiver = ReceiverConfig::from_config(config);
    options.resume = ResumeConfig::from_config(config);
    options.session_grace = get_ms(config, "transfer.session_grace_ms", options.session_grace);
    options.maintenance_interval = get_ms(config, "transfer.maintenance_interval_ms", options.maintenance_interval);
    return options;
}

}
