#pragma once

#include <chrono>
#include <concepts>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace chunkrelay::transfer {

template<typename T>
concept RegistrableSession = requires(const T& session) {
    { session.is_terminal() } -> std::convertible_to<bool>;
};

// Owns the sessions of one direction for one endpoint. A session is inserted
// when it is created or accepted, and evicted once it has been terminal for
// the grace period, which absorbs late duplicates and confirmations.
template<RegistrableSession Session>
class SessionRegistry {
public:
    using Clock = std::chrono::steady_clock;

    explicit SessionRegistry(std::chrono::milliseconds grace_period)
        : grace_period_(grace_period) {}

    bool insert(const std::string& transfer_id, std::shared_ptr<Session> session) {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.emplace(transfer_id, Entry{std::move(session), std::nullopt}).second;
    }

    std::shared_ptr<Session> find(const std::string& transfer_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(transfer_id);
        return it != entries_.end() ? it->second.session : nullptr;
    }

    bool contains(const std::string& transfer_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.count(transfer_id) > 0;
    }

    bool remove(const std::string& transfer_id) {
        std::shared_ptr<Session> removed;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = entries_.find(transfer_id);
            if (it == entries_.end()) {
                return false;
            }
            removed = std::move(it->second.session);
            entries_.erase(it);
        }
        return true;
    }

    // Evicts sessions terminal for at least the grace period. The terminal
    // clock starts the first time a purge sees the session terminal.
    std::size_t purge_expired(Clock::time_point now = Clock::now()) {
        std::vector<std::shared_ptr<Session>> expired;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (auto it = entries_.begin(); it != entries_.end();) {
                auto& entry = it->second;
                if (!entry.session->is_terminal()) {
                    ++it;
                    continue;
                }
                if (!entry.terminal_since) {
                    entry.terminal_since = now;
                }
                if (now - *entry.terminal_since >= grace_period_) {
                    expired.push_back(std::move(entry.session));
                    it = entries_.erase(it);
                } else {
                    ++it;
                }
            }
        }
        // Sessions are destroyed here, outside the lock
        return expired.size();
    }

    std::vector<std::shared_ptr<Session>> snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::shared_ptr<Session>> sessions;
        sessions.reserve(entries_.size());
        for (const auto& [id, entry] : entries_) {
            sessions.push_back(entry.session);
        }
        return sessions;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    std::chrono::milliseconds grace_period() const { return grace_period_; }

private:
    struct Entry {
        std::shared_ptr<Session> session;
        std::optional<Clock::time_point> terminal_since;
    };

    std::chrono::milliseconds grace_period_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
};

} // namespace chunkrelay::transfer
