#include "networking.hpp"
#include "protocol/codec.hpp"
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <algorithm>
#include <chrono>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace networking {

namespace {

std::string preview(const std::string& text) {
    return text.size() > 60 ? text.substr(0, 60) + "..." : text;
}

} // namespace

// ─── Server ─────────────────────────────────────────────────────────────────

Server::Server(Transport& transport, const transfer::Catalog& catalog, const config::Settings& settings,
               const transfer::Clock& clock)
    : transport_(transport),
      settings_(settings),
      handler_(catalog),
      filter_(settings.dedup_capacity, settings.dedup_window, clock) {}

void Server::run(const std::atomic<bool>& running, ServerCallbacks callbacks) {
    boost::asio::thread_pool pool(settings_.worker_threads);

    while (running) {
        std::optional<InboundMessage> message = transport_.receive(settings_.poll_interval);
        if (!message) continue;

        boost::asio::post(pool, [this, m = std::move(*message), &callbacks]() {
            handle(m, callbacks);
        });
    }
    pool.join();
}

void Server::handle(const InboundMessage& message, const ServerCallbacks& callbacks) {
    // Only direct messages are requests
    if (message.to != transport_.local_id()) return;

    // Mesh can rebroadcast DMs and we see them multiple times
    if (filter_.is_duplicate(message)) return;

    try {
        std::optional<std::string> reply = handler_.handle_text(message.text);
        if (!reply) {
            if (callbacks.on_status) callbacks.on_status("Ignored from " + message.from + ": '" + preview(message.text) + "'");
            return;
        }
        if (!transport_.send(message.from, *reply)) {
            if (callbacks.on_error) callbacks.on_error("Failed to send reply to " + message.from);
            return;
        }
        if (callbacks.on_status) {
            callbacks.on_status(message.from + ": '" + preview(message.text) + "' -> '" + preview(*reply) + "'");
        }
    } catch (std::exception& e) {
        if (callbacks.on_error) callbacks.on_error("Error handling message from " + message.from + ": " + e.what());
    }
}

// ─── Client ─────────────────────────────────────────────────────────────────

Client::Client(Transport& transport, const std::string& server_id, const config::Settings& settings,
               const transfer::Clock& clock)
    : transport_(transport), server_id_(normalize_node_id(server_id)), settings_(settings), clock_(clock) {}

DownloadResult Client::list(ClientCallbacks callbacks) {
    return run("", callbacks);
}

DownloadResult Client::download(const std::string& file_name, ClientCallbacks callbacks) {
    if (file_name.empty()) {
        throw std::invalid_argument("file name must not be empty");
    }
    return run(file_name, callbacks);
}

DownloadResult Client::download_to(const std::string& file_name, const fs::path& save_dir, bool overwrite,
                                   ClientCallbacks callbacks) {
    fs::path output_path = save_dir / file_name;
    if (fs::exists(output_path) && !overwrite) {
        DownloadResult result;
        result.state = transfer::TransferState::FAILED;
        result.message = "File already exists: " + output_path.string();
        if (callbacks.on_error) callbacks.on_error(result.message);
        return result;
    }

    // Completion is only reported once the file is on disk
    auto on_complete = callbacks.on_complete;
    callbacks.on_complete = nullptr;

    DownloadResult result = download(file_name, callbacks);
    if (!result.ok()) {
        return result;
    }

    try {
        write_download(output_path, result.content);
        result.saved_path = output_path;
    } catch (std::exception& e) {
        result.state = transfer::TransferState::FAILED;
        result.message = e.what();
        if (callbacks.on_error) callbacks.on_error(result.message);
        return result;
    }
    if (on_complete) on_complete();
    return result;
}

DownloadResult Client::run(const std::string& file_name, const ClientCallbacks& callbacks) {
    transfer::DownloadCallbacks download_callbacks{callbacks.on_status, callbacks.on_progress,
                                                   callbacks.on_complete, callbacks.on_error};
    transfer::Downloader downloader(
        settings_, clock_,
        [this](const std::string& text) { return transport_.send(server_id_, text); },
        download_callbacks);

    // One filter per session: a new session may legitimately see the same texts again
    DuplicateFilter filter(settings_.dedup_capacity, settings_.dedup_window, clock_);

    DownloadResult result;
    try {
        downloader.start(file_name);

        while (!downloader.finished()) {
            if (callbacks.cancel_flag && callbacks.cancel_flag->load()) {
                downloader.cancel();
                break;
            }

            std::chrono::milliseconds timeout = settings_.poll_interval;
            if (auto wake = downloader.next_wakeup()) {
                auto remaining = std::chrono::ceil<std::chrono::milliseconds>(*wake - clock_.now());
                timeout = std::clamp(remaining, std::chrono::milliseconds(0), settings_.poll_interval);
            }

            std::optional<InboundMessage> message = transport_.receive(timeout);
            if (message && message->from == server_id_ &&
                (message->to == transport_.local_id() || message->to == BROADCAST_ID) &&
                !filter.is_duplicate(*message)) {
                protocol::ParseResult parsed = protocol::parse(message->text);
                if (auto* error = std::get_if<protocol::ParseError>(&parsed)) {
                    if (callbacks.on_status) callbacks.on_status("Discarded message: " + error->reason);
                } else {
                    downloader.on_command(std::get<protocol::Command>(parsed));
                }
            }
            downloader.on_tick();
        }
    } catch (std::exception& e) {
        result.state = transfer::TransferState::FAILED;
        result.message = std::string("Client error: ") + e.what();
        if (callbacks.on_error) callbacks.on_error(result.message);
        return result;
    }

    result.state = downloader.state();
    result.failure = downloader.failure();
    result.message = downloader.state() == transfer::TransferState::CANCELLED ? "Download cancelled"
                                                                               : downloader.failure_message();
    result.files = downloader.files();
    result.content = downloader.content();
    return result;
}

void write_download(const fs::path& path, const std::vector<uint8_t>& content) {
    fs::path part_file = path;
    part_file += ".meshpart";

    fs::path parent = path.parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent);
    }

    {
        std::ofstream file(part_file, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            throw std::runtime_error("Could not open file for writing: " + part_file.string());
        }
        file.write(reinterpret_cast<const char*>(content.data()), static_cast<std::streamsize>(content.size()));
        if (!file) {
            throw std::runtime_error("Failed writing " + part_file.string());
        }
    }

    std::error_code ec;
    fs::rename(part_file, path, ec);
    if (ec) {
        throw std::runtime_error("Failed to rename " + part_file.string() + " to " + path.string() + ": " + ec.message());
    }
}

} // namespace networking
