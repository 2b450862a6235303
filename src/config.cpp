#include "config.hpp"
#include <fstream>
#include <limits>

namespace config {

namespace {

std::chrono::milliseconds ms_value(const nlohmann::json& j, const char* key, std::chrono::milliseconds fallback) {
    return std::chrono::milliseconds(j.value(key, static_cast<int64_t>(fallback.count())));
}

// j.value() would wrap a negative number into a huge unsigned one
template <typename T>
T unsigned_value(const nlohmann::json& j, const char* key, T fallback) {
    auto it = j.find(key);
    if (it != j.end() && it->is_number() && !it->is_number_unsigned() && it->get<double>() < 0) {
        throw ConfigError(std::string(key) + " must not be negative");
    }
    return j.value(key, fallback);
}

// Longest "!chunk <name> <index> <payload>" the server can produce
std::size_t max_chunk_reply_length(const Settings& s) {
    const std::size_t max_index_digits = std::numeric_limits<uint64_t>::digits10 + 1;
    return std::string("!chunk ").size() + s.max_filename_length + 1 + max_index_digits + 1 + s.chunk_size;
}

} // namespace

void from_json(const nlohmann::json& j, Settings& s) {
    s.chunk_size = unsigned_value(j, "chunk_size", s.chunk_size);
    s.max_filename_length = unsigned_value(j, "max_filename_length", s.max_filename_length);
    s.max_file_count = unsigned_value(j, "max_file_count", s.max_file_count);
    s.max_message_length = unsigned_value(j, "max_message_length", s.max_message_length);

    s.response_timeout = ms_value(j, "response_timeout_ms", s.response_timeout);
    s.max_attempts = j.value("max_attempts", s.max_attempts);
    s.backoff_base = ms_value(j, "backoff_base_ms", s.backoff_base);
    s.backoff_cap = ms_value(j, "backoff_cap_ms", s.backoff_cap);
    s.chunk_interval = ms_value(j, "chunk_interval_ms", s.chunk_interval);
    s.poll_interval = ms_value(j, "poll_interval_ms", s.poll_interval);

    s.dedup_capacity = unsigned_value(j, "dedup_capacity", s.dedup_capacity);
    s.dedup_window = ms_value(j, "dedup_window_ms", s.dedup_window);

    s.udp_port = unsigned_value(j, "udp_port", s.udp_port);
    s.hop_limit = j.value("hop_limit", s.hop_limit);
    s.worker_threads = unsigned_value(j, "worker_threads", s.worker_threads);
    s.queue_capacity = unsigned_value(j, "queue_capacity", s.queue_capacity);
    s.node_id = j.value("node_id", s.node_id);
}

void validate(const Settings& s) {
    if (s.chunk_size == 0) {
        throw ConfigError("chunk_size must be positive");
    }
    if (s.max_filename_length == 0 || s.max_file_count == 0) {
        throw ConfigError("catalog limits must be positive");
    }
    if (max_chunk_reply_length(s) > s.max_message_length) {
        throw ConfigError("chunk_size " + std::to_string(s.chunk_size) + " with max_filename_length " +
                          std::to_string(s.max_filename_length) + " makes chunk replies longer than max_message_length " +
                          std::to_string(s.max_message_length));
    }
    if (s.max_attempts < 1) {
        throw ConfigError("max_attempts must be at least 1");
    }
    if (s.response_timeout.count() <= 0 || s.poll_interval.count() <= 0) {
        throw ConfigError("response_timeout and poll_interval must be positive");
    }
    if (s.backoff_base.count() < 0 || s.backoff_cap < s.backoff_base || s.chunk_interval.count() < 0) {
        throw ConfigError("invalid backoff or pacing interval");
    }
    // A window as long as the timeout would swallow retransmissions on id-less transports
    if (s.dedup_window >= s.response_timeout) {
        throw ConfigError("dedup_window must be shorter than response_timeout");
    }
    if (s.dedup_capacity == 0 || s.queue_capacity == 0 || s.worker_threads == 0) {
        throw ConfigError("dedup_capacity, queue_capacity and worker_threads must be positive");
    }
    if (s.hop_limit < 0) {
        throw ConfigError("hop_limit must not be negative");
    }
}

Settings load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Could not open config file: " + path);
    }

    Settings settings;
    try {
        nlohmann::json j = nlohmann::json::parse(file);
        settings = j.get<Settings>();
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError("Invalid config file " + path + ": " + e.what());
    }
    validate(settings);
    return settings;
}

} // namespace config
