#pragma once

#include <string>
#include <cstdint>
#include <vector>
#include <optional>
#include <functional>
#include "clock.hpp"
#include "config.hpp"
#include "protocol/command.hpp"

namespace transfer {

// Progress callback: filename, chunks_received, chunks_total
using TransferProgressCallback = std::function<void(const std::string&, uint64_t, uint64_t)>;

// Sends one serialized command to the server; false if the transport refused it
using SendFunction = std::function<bool(const std::string&)>;

enum class TransferState {
    IDLE,
    AWAITING_LIST,
    AWAITING_CHUNK,
    AWAITING_CHECKSUM,
    COMPLETED,
    CANCELLED,
    FAILED
};

enum class FailureReason {
    NONE,
    TIMEOUT,
    SERVER_ERROR,
    INTEGRITY_MISMATCH,
    FILE_NOT_LISTED
};

const char* to_string(TransferState state);
const char* to_string(FailureReason reason);

struct TransferSession {
    std::string file_name;
    uint64_t total_chunks = 0;
    uint64_t next_expected_index = 0;
    std::vector<std::string> buffer;   // payloads 0..next_expected_index-1
    int attempt = 1;
};

struct DownloadCallbacks {
    std::function<void(const std::string&)> on_status;
    TransferProgressCallback on_progress;
    std::function<void()> on_complete;
    std::function<void(const std::string&)> on_error;
};

// Client side of one sequential download:
//   IDLE -> AWAITING_LIST -> AWAITING_CHUNK(0..n-1) -> AWAITING_CHECKSUM -> COMPLETED
// with FAILED and CANCELLED as terminal states. Exactly one request is
// outstanding at a time; it is resent unchanged on timeout until
// max_attempts is used up. Not thread-safe: the owner feeds commands and
// ticks from a single thread.
class Downloader {
public:
    Downloader(const config::Settings& settings, const Clock& clock, SendFunction send,
               DownloadCallbacks callbacks = {});

    // Sends the list request. An empty file_name only fetches the listing.
    void start(const std::string& file_name);

    // Feed a parsed command that came from the server
    void on_command(const protocol::Command& command);

    // Fire due timeouts and scheduled (re)sends
    void on_tick();

    // Abort: no further requests are sent and the session is discarded
    void cancel();

    TransferState state() const { return state_; }
    FailureReason failure() const { return failure_; }
    const std::string& failure_message() const { return failure_message_; }
    bool finished() const;

    // Index of the outstanding chunk request while AWAITING_CHUNK
    uint64_t current_index() const;
    int attempt() const { return attempt_; }

    const std::optional<TransferSession>& session() const { return session_; }
    const std::vector<protocol::FileEntry>& files() const { return files_; }
    const std::string& file_name() const { return target_; }

    // Decoded file content, valid once COMPLETED
    const std::vector<uint8_t>& content() const { return content_; }

    // When on_tick() next has work to do; nullopt when nothing is pending
    std::optional<Clock::time_point> next_wakeup() const;

private:
    enum class Phase {
        NONE,       // nothing outstanding
        SCHEDULED,  // request waits for wake_at_ (backoff or pacing)
        IN_FLIGHT   // request sent, times out at wake_at_
    };

    struct Router;

    protocol::Command outstanding_request() const;
    void send_outstanding();
    void schedule(std::chrono::milliseconds delay);
    void handle_timeout();
    void set_attempt(int attempt);

    void on_list(const protocol::ListResponse& response);
    void on_chunk(const protocol::ChunkResponse& response);
    void on_checksum(const protocol::ChecksumResponse& response);
    void enter_checksum();

    void complete();
    void fail(FailureReason reason, const std::string& message);
    void status(const std::string& text) const;

    const config::Settings& settings_;
    const Clock& clock_;
    SendFunction send_;
    DownloadCallbacks callbacks_;

    TransferState state_ = TransferState::IDLE;
    FailureReason failure_ = FailureReason::NONE;
    std::string failure_message_;

    Phase phase_ = Phase::NONE;
    Clock::time_point wake_at_{};
    int attempt_ = 1;

    std::string target_;
    std::vector<protocol::FileEntry> files_;
    std::optional<TransferSession> session_;
    std::vector<uint8_t> content_;
    std::string local_hash_;
};

} // namespace transfer
