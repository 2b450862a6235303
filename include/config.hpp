#pragma once

#include <string>
#include <cstdint>
#include <chrono>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace config {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

struct Settings {
    // Catalog / wire limits
    std::size_t chunk_size = 150;          // base64 characters per chunk
    std::size_t max_filename_length = 10;
    std::size_t max_file_count = 4;
    std::size_t max_message_length = 200;  // practical text payload of a mesh DM

    // Client retry policy
    std::chrono::milliseconds response_timeout{30000};
    int max_attempts = 5;
    std::chrono::milliseconds backoff_base{1000};
    std::chrono::milliseconds backoff_cap{16000};
    std::chrono::milliseconds chunk_interval{500};
    std::chrono::milliseconds poll_interval{200};

    // Duplicate filter
    std::size_t dedup_capacity = 1000;
    std::chrono::milliseconds dedup_window{20000};

    // Transport / server
    unsigned short udp_port = 45455;
    int hop_limit = 3;
    std::size_t worker_threads = 2;
    std::size_t queue_capacity = 64;
    std::string node_id;                   // empty -> random
};

void from_json(const nlohmann::json& j, Settings& settings);

// Throws ConfigError if the values cannot work together
void validate(const Settings& settings);

// Read a JSON settings file; keys that are absent keep their defaults
Settings load(const std::string& path);

} // namespace config
