#include "chunkrelay/core/command_handler.hpp"
#include "chunkrelay/core/config.hpp"
#include "chunkrelay/core/logger.hpp"
#include "chunkrelay/core/utils.hpp"
#include "chunkrelay/crypto/hash.hpp"
#include "chunkrelay/crypto/random.hpp"
#include "chunkrelay/network/relay_channel.hpp"
#include "chunkrelay/network/relay_client.hpp"
#include "chunkrelay/network/relay_router.hpp"
#include "chunkrelay/storage/resume_store.hpp"
#include "chunkrelay/transfer/payload_source.hpp"
#include "chunkrelay/transfer/size_budgeter.hpp"
#include "chunkrelay/transfer/transfer_manager.hpp"
#include <boost/asio.hpp>
#include <algorithm>
#include <condition_variable>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <optional>

namespace chunkrelay::core {

namespace {
    constexpr const char* SENDER_IDENTITY = "sender";
    constexpr const char* RECEIVER_IDENTITY = "receiver";
    constexpr std::uint32_t DROP_RESOLUTION = 1000000;

    bool is_chunk_frame(std::span<const std::uint8_t> frame) {
        try {
            auto header = network::MessageHeader::deserialize(frame);
            return header.type == network::MessageType::CHUNK;
        } catch (const std::runtime_error&) {
            return false;
        }
    }

    bool is_final(transfer::TransferStatus status) {
        return status != transfer::TransferStatus::Active && status != transfer::TransferStatus::Paused;
    }
}

CommandResult BudgetCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }

    std::uint64_t payload_length = 0;
    try {
        payload_length = std::stoull(args[1]);
    } catch (const std::logic_error&) {
        return CommandResult::error("Not a byte count: " + args[1]);
    }

    transfer::SizeBudgeter budgeter(transfer::SizeBudget::from_config(Config::instance()));
    transfer::ChunkPlan plan;
    auto result = budgeter.plan(payload_length, plan);
    if (!result) {
        return CommandResult::error(result.message);
    }

    std::cout << "Payload:          " << payload_length << " bytes ("
              << utils::StringUtils::format_bytes(payload_length) << ")\n";
    std::cout << "Message ceiling:  " << budgeter.budget().max_message_size << " bytes\n";
    std::cout << "Tier cap:         " << transfer::SizeBudgeter::tier_cap(payload_length) << " bytes\n";
    std::cout << "Chunk length:     " << plan.chunk_length << " bytes\n";
    std::cout << "Chunk count:      " << plan.chunk_count << "\n";
    std::cout << "Envelope bound:   " << plan.envelope_bound << " bytes\n";

    return CommandResult::ok();
}

CommandResult DigestCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }

    std::filesystem::path file_path = args[1];
    if (!utils::FileUtils::exists(file_path)) {
        return CommandResult::error("File does not exist: " + file_path.string());
    }

    crypto::Sha256Hash hash{};
    auto result = crypto::Sha256Hasher::hash_file(file_path, hash);
    if (!result) {
        return CommandResult::error("Failed to hash file: " + result.message);
    }

    std::cout << crypto::hash_utils::hash_to_hex(hash) << "  " << file_path.filename().string() << "\n";
    return CommandResult::ok();
}

CommandResult SendCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }

    std::filesystem::path input_path = args[1];
    std::filesystem::path output_path = args.size() > 2 ? std::filesystem::path(args[2])
                                                        : std::filesystem::path(input_path.string() + ".received");

    if (!utils::FileUtils::exists(input_path)) {
        return CommandResult::error("File does not exist: " + input_path.string());
    }

    try {
        auto& config = Config::instance();
        auto options = transfer::TransferOptions::from_config(config);
        auto drop_rate = std::clamp(config.get_double("demo.drop_rate", 0.0), 0.0, 1.0);
        auto drop_threshold = static_cast<std::uint32_t>(drop_rate * DROP_RESOLUTION);

        auto source = std::make_shared<transfer::FilePayloadSource>(input_path);

        boost::asio::thread_pool pool(2);
        network::RelayRouter router(network::RelayConfig::from_config(config));

        auto sender_channel = std::make_shared<network::LocalPeerChannel>(pool.get_executor());
        auto receiver_channel = std::make_shared<network::LossyPeerChannel>(
            pool.get_executor(), [drop_threshold](const network::PeerId&, std::span<const std::uint8_t> frame) {
                return drop_threshold > 0 && is_chunk_frame(frame) &&
                       crypto::SecureRandom::generate_uniform(DROP_RESOLUTION) < drop_threshold;
            });

        auto sender_client = std::make_shared<network::RelayClient>(router, SENDER_IDENTITY, sender_channel);
        auto receiver_client = std::make_shared<network::RelayClient>(router, RECEIVER_IDENTITY, receiver_channel);

        auto store = std::make_shared<storage::ResumeStore>(
            utils::FileUtils::expand_home(config.get_string("resume.database", "chunkrelay_resume.db")));
        if (!store->initialize()) {
            LOG_WARN("Continuing without checkpoints");
            store.reset();
        }

        std::mutex mutex;
        std::condition_variable cv;
        std::optional<transfer::TransferEvent> sender_outcome;
        std::optional<transfer::TransferEvent> receiver_outcome;
        bool written = false;

        transfer::TransferManager receiver(receiver_client, options, pool.get_executor());
        transfer::TransferManager sender(sender_client, options, pool.get_executor(), nullptr, store);

        receiver.on_payload_received([&](const std::string&, const network::PeerId&, const std::string&,
                                         std::vector<std::uint8_t> payload) {
            bool ok = utils::FileUtils::write_binary(output_path, payload);
            std::lock_guard<std::mutex> lock(mutex);
            written = ok;
        });
        receiver.on_status([&](const transfer::TransferEvent& event) {
            if (!is_final(event.status)) {
                return;
            }
            std::lock_guard<std::mutex> lock(mutex);
            receiver_outcome = event;
            cv.notify_all();
        });
        sender.on_status([&](const transfer::TransferEvent& event) {
            if (!is_final(event.status)) {
                std::cout << "  " << transfer::to_string(event.status) << ": " << event.message << "\n";
                return;
            }
            std::lock_guard<std::mutex> lock(mutex);
            sender_outcome = event;
            cv.notify_all();
        });

        receiver.start();
        sender.start();

        std::cout << "Relaying " << input_path.filename().string() << " ("
                  << utils::StringUtils::format_bytes(source->size()) << ")";
        if (drop_threshold > 0) {
            std::cout << " with " << std::setprecision(3) << drop_rate * 100.0 << "% chunk loss";
        }
        std::cout << "\n";

        std::string transfer_id;
        auto result = sender.send_payload(RECEIVER_IDENTITY, input_path.filename().string(),
                                          "application/octet-stream", source, transfer_id);
        if (!result) {
            sender.stop();
            receiver.stop();
            pool.join();
            return CommandResult::error("Transfer could not start: " + result.message);
        }

        {
            // Every session wait is bounded, so a terminal event always arrives
            std::unique_lock<std::mutex> lock(mutex);
            cv.wait(lock, [&] {
                if (!sender_outcome) {
                    return false;
                }
                return sender_outcome->status != transfer::TransferStatus::Completed || receiver_outcome.has_value();
            });
        }

        auto stats = sender.get_transfer_stats(transfer_id);
        sender.stop();
        receiver.stop();
        pool.join();

        std::cout << "Transfer " << transfer_id << ": " << transfer::to_string(sender_outcome->status);
        if (sender_outcome->error != transfer::TransferError::Success) {
            std::cout << " (" << transfer::transfer_error_name(sender_outcome->error) << ")";
        }
        std::cout << "\n  " << sender_outcome->message << "\n";

        if (stats) {
            std::cout << "  Chunks: " << stats->chunks_done << "/" << stats->total_chunks << " confirmed, "
                      << stats->chunks_retransmitted << " retransmitted\n";
            std::cout << "  Elapsed: " << utils::StringUtils::format_duration(stats->elapsed) << "\n";
        }
        std::cout << "  Frames dropped by relay: " << receiver_channel->frames_dropped() << "\n";

        if (sender_outcome->status != transfer::TransferStatus::Completed) {
            return CommandResult::error("Transfer did not complete: " + sender_outcome->message);
        }
        if (!written) {
            return CommandResult::error("Failed to write " + output_path.string());
        }

        std::cout << "  Written to " << output_path.string() << "\n";
        return CommandResult::ok("Transfer completed");

    } catch (const std::exception& e) {
        return CommandResult::error("Exception: " + std::string(e.what()));
    }
}

CommandResult CheckpointsCommandHandler::execute(const std::vector<std::string>& args) {
    (void)args;

    auto& config = Config::instance();
    storage::ResumeStore store(
        utils::FileUtils::expand_home(config.get_string("resume.database", "chunkrelay_resume.db")));
    if (!store.initialize()) {
        return CommandResult::error("Cannot open resume store " + store.path().string());
    }

    auto checkpoints = store.list();
    if (checkpoints.empty()) {
        std::cout << "No resumable transfers.\n";
        return CommandResult::ok();
    }

    std::cout << "Resumable transfers (" << checkpoints.size() << "):\n";
    for (const auto& checkpoint : checkpoints) {
        const auto& d = checkpoint.descriptor;
        std::cout << "  " << d.transfer_id << "  " << d.file_name << " -> " << d.peer << "\n";
        std::cout << "      " << checkpoint.confirmed_chunks.size() << "/" << d.total_chunks << " chunks, "
                  << utils::StringUtils::format_bytes(d.total_length) << ", last activity "
                  << utils::TimeUtils::format_timestamp(checkpoint.last_activity) << "\n";
    }

    return CommandResult::ok();
}

}
