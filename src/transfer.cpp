#include "transfer.hpp"
#include "protocol/base64.hpp"
#include "protocol/codec.hpp"
#include "security.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace transfer {

const char* to_string(TransferState state) {
    switch (state) {
        case TransferState::IDLE: return "idle";
        case TransferState::AWAITING_LIST: return "awaiting list";
        case TransferState::AWAITING_CHUNK: return "awaiting chunk";
        case TransferState::AWAITING_CHECKSUM: return "awaiting checksum";
        case TransferState::COMPLETED: return "completed";
        case TransferState::CANCELLED: return "cancelled";
        case TransferState::FAILED: return "failed";
    }
    return "unknown";
}

const char* to_string(FailureReason reason) {
    switch (reason) {
        case FailureReason::NONE: return "none";
        case FailureReason::TIMEOUT: return "timeout";
        case FailureReason::SERVER_ERROR: return "server error";
        case FailureReason::INTEGRITY_MISMATCH: return "integrity mismatch";
        case FailureReason::FILE_NOT_LISTED: return "file not listed";
    }
    return "unknown";
}

// ─── Command routing ────────────────────────────────────────────────────────

struct Downloader::Router {
    Downloader& d;

    void operator()(const protocol::ListResponse& r) const { d.on_list(r); }
    void operator()(const protocol::ChunkResponse& r) const { d.on_chunk(r); }
    void operator()(const protocol::ChecksumResponse& r) const { d.on_checksum(r); }

    void operator()(const protocol::ErrorResponse& r) const {
        d.fail(FailureReason::SERVER_ERROR, "Server error: " + r.message);
    }

    // Requests are never addressed to a client
    void operator()(const protocol::ListRequest&) const {}
    void operator()(const protocol::ChunkRequest&) const {}
    void operator()(const protocol::ChecksumRequest&) const {}
};

Downloader::Downloader(const config::Settings& settings, const Clock& clock, SendFunction send,
                       DownloadCallbacks callbacks)
    : settings_(settings), clock_(clock), send_(std::move(send)), callbacks_(std::move(callbacks)) {}

void Downloader::start(const std::string& file_name) {
    if (state_ != TransferState::IDLE) {
        throw std::logic_error("Downloader already started");
    }
    target_ = file_name;
    state_ = TransferState::AWAITING_LIST;
    set_attempt(1);
    status("Requesting file list...");
    send_outstanding();
}

void Downloader::on_command(const protocol::Command& command) {
    if (finished() || state_ == TransferState::IDLE) {
        return;
    }
    std::visit(Router{*this}, command);
}

void Downloader::on_tick() {
    if (finished() || phase_ == Phase::NONE) {
        return;
    }
    if (clock_.now() < wake_at_) {
        return;
    }
    if (phase_ == Phase::SCHEDULED) {
        send_outstanding();
    } else {
        handle_timeout();
    }
}

void Downloader::cancel() {
    if (finished()) {
        return;
    }
    state_ = TransferState::CANCELLED;
    phase_ = Phase::NONE;
    session_.reset();
    status("Download cancelled.");
}

bool Downloader::finished() const {
    return state_ == TransferState::COMPLETED || state_ == TransferState::CANCELLED ||
           state_ == TransferState::FAILED;
}

uint64_t Downloader::current_index() const {
    return session_ ? session_->next_expected_index : 0;
}

std::optional<Clock::time_point> Downloader::next_wakeup() const {
    if (finished() || phase_ == Phase::NONE) {
        return std::nullopt;
    }
    return wake_at_;
}

// ─── Outstanding request ────────────────────────────────────────────────────

protocol::Command Downloader::outstanding_request() const {
    switch (state_) {
        case TransferState::AWAITING_CHUNK:
            return protocol::ChunkRequest{session_->file_name, session_->next_expected_index};
        case TransferState::AWAITING_CHECKSUM:
            return protocol::ChecksumRequest{session_->file_name};
        default:
            return protocol::ListRequest{};
    }
}

void Downloader::send_outstanding() {
    phase_ = Phase::IN_FLIGHT;
    wake_at_ = clock_.now() + settings_.response_timeout;

    // A refused send counts as an attempt that timed out
    if (!send_(protocol::serialize(outstanding_request()))) {
        status("Send failed");
        handle_timeout();
    }
}

void Downloader::schedule(std::chrono::milliseconds delay) {
    if (delay.count() <= 0) {
        send_outstanding();
        return;
    }
    phase_ = Phase::SCHEDULED;
    wake_at_ = clock_.now() + delay;
}

void Downloader::handle_timeout() {
    std::string request = protocol::serialize(outstanding_request());
    if (attempt_ >= settings_.max_attempts) {
        fail(FailureReason::TIMEOUT, "No response to '" + request + "' after " +
                                         std::to_string(attempt_) + " attempts");
        return;
    }
    set_attempt(attempt_ + 1);
    auto delay = backoff(attempt_, settings_);
    status("Timeout waiting for '" + request + "', retry " + std::to_string(attempt_) + "/" +
           std::to_string(settings_.max_attempts) + " in " + std::to_string(delay.count()) + "ms");
    schedule(delay);
}

void Downloader::set_attempt(int attempt) {
    attempt_ = attempt;
    if (session_) {
        session_->attempt = attempt;
    }
}

// ─── Responses ──────────────────────────────────────────────────────────────

void Downloader::on_list(const protocol::ListResponse& response) {
    if (state_ != TransferState::AWAITING_LIST) {
        return;
    }
    files_ = response.files;
    status("Received file list: " + std::to_string(files_.size()) + " files");

    if (target_.empty()) {
        complete();
        return;
    }

    auto it = std::find_if(files_.begin(), files_.end(),
                           [this](const protocol::FileEntry& f) { return f.name == target_; });
    if (it == files_.end()) {
        fail(FailureReason::FILE_NOT_LISTED, "File not offered by server: " + target_);
        return;
    }

    session_ = TransferSession{};
    session_->file_name = target_;
    session_->total_chunks = it->chunks;
    set_attempt(1);

    if (session_->total_chunks == 0) {
        enter_checksum();
        return;
    }
    state_ = TransferState::AWAITING_CHUNK;
    status("Downloading " + target_ + " (" + std::to_string(it->chunks) + " chunks)...");
    send_outstanding();
}

void Downloader::on_chunk(const protocol::ChunkResponse& response) {
    // Stale resends and chunks of other files never move the window
    if (state_ != TransferState::AWAITING_CHUNK || response.file_name != session_->file_name ||
        response.index != session_->next_expected_index) {
        return;
    }

    session_->buffer.push_back(response.payload);
    session_->next_expected_index++;
    set_attempt(1);

    if (callbacks_.on_progress) {
        callbacks_.on_progress(session_->file_name, session_->next_expected_index, session_->total_chunks);
    }

    if (session_->next_expected_index == session_->total_chunks) {
        enter_checksum();
        return;
    }
    schedule(settings_.chunk_interval);
}

void Downloader::enter_checksum() {
    std::string encoded;
    for (const auto& payload : session_->buffer) {
        encoded += payload;
    }

    auto decoded = protocol::base64_decode(encoded);
    if (!decoded) {
        fail(FailureReason::INTEGRITY_MISMATCH, "Reassembled data of " + session_->file_name + " is not valid base64");
        return;
    }
    content_ = std::move(*decoded);
    local_hash_ = security::md5_hex(content_);

    state_ = TransferState::AWAITING_CHECKSUM;
    set_attempt(1);
    status("Validating checksum...");
    send_outstanding();
}

void Downloader::on_checksum(const protocol::ChecksumResponse& response) {
    if (state_ != TransferState::AWAITING_CHECKSUM || response.file_name != session_->file_name) {
        return;
    }

    std::string server_hash = response.hash;
    std::transform(server_hash.begin(), server_hash.end(), server_hash.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (server_hash != local_hash_) {
        content_.clear();
        fail(FailureReason::INTEGRITY_MISMATCH,
             "Checksum mismatch for " + session_->file_name + " (local " + local_hash_ + ", server " + server_hash + ")");
        return;
    }
    status("Checksum valid: " + local_hash_);
    complete();
}

// ─── Terminal states ────────────────────────────────────────────────────────

void Downloader::complete() {
    state_ = TransferState::COMPLETED;
    phase_ = Phase::NONE;
    session_.reset();
    if (callbacks_.on_complete) callbacks_.on_complete();
}

void Downloader::fail(FailureReason reason, const std::string& message) {
    state_ = TransferState::FAILED;
    failure_ = reason;
    failure_message_ = message;
    phase_ = Phase::NONE;
    session_.reset();
    if (callbacks_.on_error) callbacks_.on_error(message);
}

void Downloader::status(const std::string& text) const {
    if (callbacks_.on_status) callbacks_.on_status(text);
}

} // namespace transfer
