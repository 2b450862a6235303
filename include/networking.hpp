#pragma once

#include <string>
#include <cstdint>
#include <vector>
#include <memory>
#include <functional>
#include <atomic>
#include <filesystem>
#include "catalog.hpp"
#include "clock.hpp"
#include "config.hpp"
#include "dedup.hpp"
#include "session_handler.hpp"
#include "transfer.hpp"
#include "transport.hpp"

namespace networking {

// Progress callback: filename, chunks_received, chunks_total
using ProgressCallback = std::function<void(const std::string&, uint64_t, uint64_t)>;
using StatusCallback = std::function<void(const std::string&)>;

struct ServerCallbacks {
    StatusCallback on_status;
    std::function<void(const std::string&)> on_error;
};

struct ClientCallbacks {
    StatusCallback on_status;
    ProgressCallback on_progress;
    std::function<void()> on_complete;
    std::function<void(const std::string&)> on_error;
    std::shared_ptr<std::atomic<bool>> cancel_flag;
};

struct DownloadResult {
    transfer::TransferState state = transfer::TransferState::IDLE;
    transfer::FailureReason failure = transfer::FailureReason::NONE;
    std::string message;
    std::vector<protocol::FileEntry> files;
    std::vector<uint8_t> content;
    std::filesystem::path saved_path;

    bool ok() const { return state == transfer::TransferState::COMPLETED; }
};

// Answers direct messages from any number of peers on a worker pool
class Server {
public:
    Server(Transport& transport, const transfer::Catalog& catalog, const config::Settings& settings,
           const transfer::Clock& clock);

    // Pull messages and serve them until `running` turns false
    void run(const std::atomic<bool>& running, ServerCallbacks callbacks = {});

    // Dedup, parse, dispatch and reply for one inbound message. Thread-safe.
    void handle(const InboundMessage& message, const ServerCallbacks& callbacks = {});

private:
    Transport& transport_;
    const config::Settings& settings_;
    transfer::SessionHandler handler_;
    DuplicateFilter filter_;
};

// Drives one Downloader at a time against a single server
class Client {
public:
    Client(Transport& transport, const std::string& server_id, const config::Settings& settings,
           const transfer::Clock& clock);

    DownloadResult list(ClientCallbacks callbacks = {});
    DownloadResult download(const std::string& file_name, ClientCallbacks callbacks = {});

    // download() and, once the checksum matched, write save_dir/file_name
    DownloadResult download_to(const std::string& file_name, const std::filesystem::path& save_dir,
                               bool overwrite, ClientCallbacks callbacks = {});

    const std::string& server_id() const { return server_id_; }

private:
    DownloadResult run(const std::string& file_name, const ClientCallbacks& callbacks);

    Transport& transport_;
    std::string server_id_;
    const config::Settings& settings_;
    const transfer::Clock& clock_;
};

// Write through a .meshpart temp file and rename. Throws std::runtime_error.
void write_download(const std::filesystem::path& path, const std::vector<uint8_t>& content);

} // namespace networking
