#include "chunkrelay/transfer/resume_coordinator.hpp"
#include "chunkrelay/core/logger.hpp"
#include <algorithm>
#include <thread>

namespace chunkrelay::transfer {

ResumeCoordinator::ResumeCoordinator(ResumeHost& host, ResumeConfig config)
    : host_(host)
    , config_(config)
    , rounds_run_(0)
    , chunks_retransmitted_(0) {
}

Reconciliation ResumeCoordinator::reconcile() {
    Reconciliation outcome;
    const auto total = host_.total_chunks();

    outcome.query_result = host_.request_status();

    std::optional<network::StatusResponse> response;
    if (outcome.query_result) {
        response = host_.await_status(config_.status_timeout);
    } else {
        LOG_DEBUG("Status query not sent: {}", outcome.query_result.message);
    }

    if (response) {
        outcome.authoritative = true;
        for (auto index : response->received_chunk_indices) {
            if (index < total) {
                outcome.confirmed.push_back(index);
            }
        }
        std::sort(outcome.confirmed.begin(), outcome.confirmed.end());
        outcome.confirmed.erase(std::unique(outcome.confirmed.begin(), outcome.confirmed.end()),
                                outcome.confirmed.end());
        host_.adopt_confirmed(outcome.confirmed);
    } else {
        if (outcome.query_result) {
            LOG_WARN("No status response within {} ms, using local view", config_.status_timeout.count());
        }
        outcome.confirmed = host_.local_confirmed();
        std::sort(outcome.confirmed.begin(), outcome.confirmed.end());
    }

    auto held = outcome.confirmed.begin();
    for (std::uint32_t index = 0; index < total; ++index) {
        if (held != outcome.confirmed.end() && *held == index) {
            ++held;
        } else {
            outcome.missing.push_back(index);
        }
    }

    LOG_DEBUG("Reconciled: {} held, {} missing ({})", outcome.confirmed.size(), outcome.missing.size(),
              outcome.authoritative ? "receiver view" : "local view");
    return outcome;
}

TransferResult ResumeCoordinator::run() {
    for (std::uint32_t round = 0;; ++round) {
        if (host_.resume_aborted()) {
            return TransferResult(TransferError::Cancelled, "Resume aborted");
        }

        auto outcome = reconcile();
        if (outcome.query_result.error == TransferError::ChannelUnavailable) {
            return outcome.query_result;
        }

        if (outcome.missing.empty()) {
            LOG_INFO("Resume converged after {} round(s)", round);
            return TransferResult();
        }

        if (round == config_.max_rounds) {
            LOG_ERROR("{} chunks still missing after {} resume rounds", outcome.missing.size(), round);
            return TransferResult(TransferError::ResumeRoundsExhausted,
                                  std::to_string(outcome.missing.size()) + " chunks still missing after " +
                                  std::to_string(round) + " resume rounds");
        }

        ++rounds_run_;
        LOG_INFO("Resume round {}: retransmitting {} chunks", round + 1, outcome.missing.size());

        auto result = retransmit_missing(outcome.missing);
        if (!result) {
            return result;
        }
    }
}

TransferResult ResumeCoordinator::retransmit_missing(const std::vector<std::uint32_t>& missing) {
    for (std::size_t start = 0; start < missing.size(); start += config_.batch_size) {
        auto end = std::min(missing.size(), start + config_.batch_size);

        for (auto i = start; i < end; ++i) {
            if (host_.resume_aborted()) {
                return TransferResult(TransferError::Cancelled, "Resume aborted");
            }

            auto result = host_.retransmit(missing[i]);
            if (result.error == TransferError::ChannelUnavailable || result.error == TransferError::Cancelled) {
                return result;
            }
            if (!result) {
                // Next round's status query picks it up again
                LOG_DEBUG("Retransmit of chunk {} failed: {}", missing[i], result.message);
                continue;
            }
            ++chunks_retransmitted_;
        }

        if (end < missing.size() && config_.batch_delay.count() > 0) {
            std::this_thread::sleep_for(config_.batch_delay);
        }
    }
    return TransferResult();
}

} // namespace chunkrelay::transfer
