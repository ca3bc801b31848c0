#include "chunkrelay/core/config.hpp"
#include "chunkrelay/core/utils.hpp"
#include <algorithm>
#include <cctype>

namespace chunkrelay::core {

Config& Config::instance() {
    static Config instance;
    return instance;
}

bool Config::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);

        if (line.empty() || line[0] == '#') {
            continue;
        }

        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        if (!key.empty()) {
            values_[key] = value;
        }
    }

    return true;
}

bool Config::save_to_file(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    file << "# chunkrelay configuration\n\n";

    for (const auto& [key, value] : values_) {
        file << key << "=" << value << "\n";
    }

    return true;
}

void Config::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    values_[key] = value;
}

std::optional<std::string> Config::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = values_.find(key);
    if (it != values_.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool Config::get_bool(const std::string& key, bool default_value) const {
    auto value = get(key);
    if (!value) return default_value;

    std::string lower = utils::StringUtils::to_lower(*value);
    return lower == "true" || lower == "1" || lower == "yes";
}

int Config::get_int(const std::string& key, int default_value) const {
    auto value = get_as<int>(key);
    return value ? *value : default_value;
}

std::uint64_t Config::get_uint64(const std::string& key, std::uint64_t default_value) const {
    auto value = get_as<std::uint64_t>(key);
    return value ? *value : default_value;
}

double Config::get_double(const std::string& key, double default_value) const {
    auto value = get_as<double>(key);
    return value ? *value : default_value;
}

std::string Config::get_string(const std::string& key, const std::string& default_value) const {
    auto value = get(key);
    return value ? *value : default_value;
}

void Config::set_defaults() {
    std::lock_guard<std::mutex> lock(mutex_);

    values_["relay.max_message_size"] = "65536";
    values_["relay.framing_reserve"] = "512";
    values_["relay.hard_ceiling"] = "131072";

    values_["transfer.require_ack"] = "true";
    values_["transfer.max_chunk_retries"] = "3";
    values_["transfer.request_timeout_ms"] = "30000";
    values_["transfer.confirmation_timeout_ms"] = "10000";
    values_["transfer.receiver_idle_timeout_ms"] = "120000";
    values_["transfer.session_grace_ms"] = "30000";
    values_["transfer.maintenance_interval_ms"] = "500";

    values_["flow.initial_window"] = "4";
    values_["flow.min_window"] = "1";
    values_["flow.max_window"] = "16";
    values_["flow.sample_window"] = "10";
    values_["flow.adjust_interval_ms"] = "1000";
    values_["flow.low_latency_ms"] = "200";
    values_["flow.high_latency_ms"] = "1000";
    values_["flow.pacing_enabled"] = "true";
    values_["flow.buffer_high_watermark"] = "1048576";
    values_["flow.buffer_low_watermark"] = "262144";
    values_["flow.buffer_poll_ms"] = "10";
    values_["flow.buffer_max_wait_ms"] = "5000";
    values_["flow.initial_rto_ms"] = "1000";
    values_["flow.min_rto_ms"] = "100";
    values_["flow.max_rto_ms"] = "10000";

    values_["resume.trigger_ratio"] = "0.95";
    values_["resume.stall_timeout_ms"] = "2000";
    values_["resume.status_timeout_ms"] = "5000";
    values_["resume.max_rounds"] = "5";
    values_["resume.batch_size"] = "32";
    values_["resume.batch_delay_ms"] = "0";
    values_["resume.database"] = "chunkrelay_resume.db";

    values_["demo.drop_rate"] = "0.0";
    values_["log.level"] = "info";
    values_["log.file"] = "chunkrelay.log";
}

void Config::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    values_.clear();
}

std::string Config::trim(const std::string& str) const {
    return utils::StringUtils::trim(str);
}

}
