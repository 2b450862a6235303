#include <gtest/gtest.h>
#include <algorithm>
#include <cctype>
#include <memory>
#include "protocol/codec.hpp"
#include "security.hpp"
#include "session_handler.hpp"
#include "test_support.hpp"
#include "transfer.hpp"

using namespace std::chrono_literals;
using protocol::Command;
using transfer::Downloader;
using transfer::FailureReason;
using transfer::TransferState;

struct SentRequest {
    std::string text;
    transfer::Clock::time_point at;
};

class DownloaderTest : public ::testing::Test {
protected:
    DownloaderTest()
        : catalog_({testing_support::make_file("test.txt", 320), testing_support::make_file("big.bin", 700, 11),
                    transfer::SourceFile{"empty", {}}},
                   settings_),
          handler_(catalog_) {
        settings_.chunk_interval = 0ms;
    }

    std::unique_ptr<Downloader> make(transfer::DownloadCallbacks callbacks = {}) {
        return std::make_unique<Downloader>(
            settings_, clock_,
            [this](const std::string& text) {
                sent_.push_back({text, clock_.now()});
                return send_ok_;
            },
            callbacks);
    }

    // Answer the oldest unanswered request the way a server would
    void serve_next(Downloader& downloader) {
        ASSERT_LT(served_, sent_.size());
        std::optional<std::string> reply = handler_.handle_text(sent_[served_++].text);
        ASSERT_TRUE(reply.has_value());
        protocol::ParseResult parsed = protocol::parse(*reply);
        ASSERT_TRUE(std::holds_alternative<Command>(parsed));
        downloader.on_command(std::get<Command>(parsed));
    }

    // Answer every request and fire every timer until the download ends
    void pump(Downloader& downloader) {
        for (int guard = 0; guard < 1000 && !downloader.finished(); ++guard) {
            if (served_ < sent_.size()) {
                serve_next(downloader);
            } else if (auto wake = downloader.next_wakeup()) {
                clock_.set(*wake);
                downloader.on_tick();
            } else {
                break;
            }
        }
    }

    // Fire timers without answering anything
    void run_timers(Downloader& downloader) {
        for (int guard = 0; guard < 1000 && !downloader.finished(); ++guard) {
            auto wake = downloader.next_wakeup();
            if (!wake) break;
            clock_.set(*wake);
            downloader.on_tick();
        }
    }

    std::vector<std::string> sent_texts() const {
        std::vector<std::string> texts;
        for (const auto& s : sent_) texts.push_back(s.text);
        return texts;
    }

    size_t count_sent(const std::string& text) const {
        return static_cast<size_t>(
            std::count_if(sent_.begin(), sent_.end(), [&](const SentRequest& s) { return s.text == text; }));
    }

    config::Settings settings_;
    testing_support::ManualClock clock_;
    transfer::Catalog catalog_;
    transfer::SessionHandler handler_;
    std::vector<SentRequest> sent_;
    size_t served_ = 0;
    bool send_ok_ = true;
};

TEST_F(DownloaderTest, DownloadsFileInOrder) {
    int completed = 0;
    std::vector<uint64_t> progress;
    transfer::DownloadCallbacks callbacks;
    callbacks.on_complete = [&]() { completed++; };
    callbacks.on_progress = [&](const std::string& name, uint64_t received, uint64_t total) {
        EXPECT_EQ(name, "test.txt");
        EXPECT_EQ(total, 3u);
        progress.push_back(received);
    };

    auto downloader = make(callbacks);
    downloader->start("test.txt");
    pump(*downloader);

    EXPECT_EQ(downloader->state(), TransferState::COMPLETED);
    EXPECT_EQ(downloader->failure(), FailureReason::NONE);
    EXPECT_EQ(downloader->content(), testing_support::make_bytes(320));
    EXPECT_EQ(completed, 1);
    EXPECT_EQ(progress, (std::vector<uint64_t>{1, 2, 3}));
    EXPECT_EQ(sent_texts(), (std::vector<std::string>{"!ls", "!req test.txt 0", "!req test.txt 1",
                                                      "!req test.txt 2", "!check test.txt"}));
    EXPECT_FALSE(downloader->session().has_value());
}

TEST_F(DownloaderTest, ListOnly) {
    auto downloader = make();
    downloader->start("");
    serve_next(*downloader);

    EXPECT_EQ(downloader->state(), TransferState::COMPLETED);
    ASSERT_EQ(downloader->files().size(), 3u);
    EXPECT_EQ(downloader->files()[0], (protocol::FileEntry{"test.txt", 3}));
    EXPECT_EQ(sent_.size(), 1u);
}

TEST_F(DownloaderTest, StartTwiceThrows) {
    auto downloader = make();
    downloader->start("test.txt");
    EXPECT_THROW(downloader->start("test.txt"), std::logic_error);
}

TEST_F(DownloaderTest, RetriesWithBackoffThenFails) {
    auto downloader = make();
    downloader->start("test.txt");
    serve_next(*downloader);   // list
    serve_next(*downloader);   // chunk 0
    serve_next(*downloader);   // chunk 1
    ASSERT_EQ(sent_.back().text, "!req test.txt 2");

    // Chunk 2 never arrives
    run_timers(*downloader);

    EXPECT_EQ(downloader->state(), TransferState::FAILED);
    EXPECT_EQ(downloader->failure(), FailureReason::TIMEOUT);
    EXPECT_EQ(downloader->failure_message(), "No response to '!req test.txt 2' after 5 attempts");
    ASSERT_EQ(count_sent("!req test.txt 2"), 5u);

    std::vector<transfer::Clock::time_point> times;
    for (const auto& s : sent_) {
        if (s.text == "!req test.txt 2") times.push_back(s.at);
    }
    EXPECT_EQ(times[1] - times[0], 31s);
    EXPECT_EQ(times[2] - times[1], 32s);
    EXPECT_EQ(times[3] - times[2], 34s);
    EXPECT_EQ(times[4] - times[3], 38s);

    // Nothing more once failed
    clock_.advance(10min);
    downloader->on_tick();
    EXPECT_EQ(count_sent("!req test.txt 2"), 5u);
    EXPECT_FALSE(downloader->next_wakeup().has_value());
}

TEST_F(DownloaderTest, ReplyResetsAttempts) {
    auto downloader = make();
    downloader->start("test.txt");
    serve_next(*downloader);   // list

    // Chunk 0 is lost twice, then answered
    clock_.advance(settings_.response_timeout);
    downloader->on_tick();
    clock_.advance(1s);
    downloader->on_tick();
    ASSERT_EQ(sent_.size(), 3u);
    EXPECT_EQ(downloader->attempt(), 2);

    clock_.advance(settings_.response_timeout);
    downloader->on_tick();
    clock_.advance(2s);
    downloader->on_tick();
    ASSERT_EQ(sent_.size(), 4u);
    EXPECT_EQ(downloader->attempt(), 3);
    EXPECT_EQ(sent_.back().text, "!req test.txt 0");

    served_ = sent_.size() - 1;
    serve_next(*downloader);
    EXPECT_EQ(downloader->current_index(), 1u);
    EXPECT_EQ(downloader->attempt(), 1);
    EXPECT_EQ(downloader->session()->attempt, 1);

    pump(*downloader);
    EXPECT_EQ(downloader->state(), TransferState::COMPLETED);
}

TEST_F(DownloaderTest, AcceptsLateReplyDuringBackoff) {
    auto downloader = make();
    downloader->start("test.txt");
    clock_.advance(settings_.response_timeout);
    downloader->on_tick();
    ASSERT_EQ(sent_.size(), 1u);   // retry waits for the backoff

    serve_next(*downloader);       // the first list request is answered late
    EXPECT_EQ(downloader->state(), TransferState::AWAITING_CHUNK);
    EXPECT_EQ(sent_.back().text, "!req test.txt 0");
    EXPECT_EQ(count_sent("!ls"), 1u);

    pump(*downloader);
    EXPECT_EQ(downloader->state(), TransferState::COMPLETED);
}

TEST_F(DownloaderTest, ChecksumMismatchFails) {
    std::string error;
    transfer::DownloadCallbacks callbacks;
    callbacks.on_error = [&](const std::string& e) { error = e; };

    auto downloader = make(callbacks);
    downloader->start("test.txt");
    for (int i = 0; i < 4; ++i) serve_next(*downloader);
    ASSERT_EQ(downloader->state(), TransferState::AWAITING_CHECKSUM);

    downloader->on_command(protocol::ChecksumResponse{"test.txt", "00000000000000000000000000000000"});
    EXPECT_EQ(downloader->state(), TransferState::FAILED);
    EXPECT_EQ(downloader->failure(), FailureReason::INTEGRITY_MISMATCH);
    EXPECT_TRUE(downloader->content().empty());
    EXPECT_EQ(error.rfind("Checksum mismatch for test.txt", 0), 0u);
}

TEST_F(DownloaderTest, ChecksumComparisonIgnoresCase) {
    auto downloader = make();
    downloader->start("test.txt");
    for (int i = 0; i < 4; ++i) serve_next(*downloader);

    std::string hash = catalog_.hash_of("test.txt");
    std::transform(hash.begin(), hash.end(), hash.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    downloader->on_command(protocol::ChecksumResponse{"test.txt", hash});
    EXPECT_EQ(downloader->state(), TransferState::COMPLETED);
}

TEST_F(DownloaderTest, DuplicateChunkIsAppendedOnce) {
    auto downloader = make();
    downloader->start("big.bin");
    serve_next(*downloader);                       // list
    for (int i = 0; i < 3; ++i) serve_next(*downloader);   // chunks 0..2
    ASSERT_EQ(sent_.back().text, "!req big.bin 3");

    Command chunk3 = protocol::ChunkResponse{"big.bin", 3, catalog_.get_chunk("big.bin", 3)};
    downloader->on_command(chunk3);
    downloader->on_command(chunk3);
    served_ = sent_.size() - 1;

    EXPECT_EQ(downloader->current_index(), 4u);
    EXPECT_EQ(downloader->session()->buffer.size(), 4u);
    EXPECT_EQ(count_sent("!req big.bin 4"), 1u);

    pump(*downloader);
    EXPECT_EQ(downloader->state(), TransferState::COMPLETED);
    EXPECT_EQ(downloader->content(), testing_support::make_bytes(700, 11));
}

TEST_F(DownloaderTest, IgnoresOutOfOrderAndForeignChunks) {
    auto downloader = make();
    downloader->start("big.bin");
    serve_next(*downloader);
    ASSERT_EQ(downloader->current_index(), 0u);
    size_t sends = sent_.size();

    downloader->on_command(protocol::ChunkResponse{"big.bin", 2, catalog_.get_chunk("big.bin", 2)});
    downloader->on_command(protocol::ChunkResponse{"test.txt", 0, catalog_.get_chunk("test.txt", 0)});
    downloader->on_command(protocol::ListResponse{});

    EXPECT_EQ(downloader->current_index(), 0u);
    EXPECT_TRUE(downloader->session()->buffer.empty());
    EXPECT_EQ(sent_.size(), sends);
    EXPECT_EQ(downloader->state(), TransferState::AWAITING_CHUNK);
}

TEST_F(DownloaderTest, ServerErrorFails) {
    auto downloader = make();
    downloader->start("test.txt");
    serve_next(*downloader);
    downloader->on_command(protocol::ErrorResponse{"Invalid chunk 0 for test.txt"});

    EXPECT_EQ(downloader->state(), TransferState::FAILED);
    EXPECT_EQ(downloader->failure(), FailureReason::SERVER_ERROR);
    EXPECT_EQ(downloader->failure_message(), "Server error: Invalid chunk 0 for test.txt");
    EXPECT_FALSE(downloader->session().has_value());
}

TEST_F(DownloaderTest, FileNotListedFails) {
    auto downloader = make();
    downloader->start("nope.txt");
    serve_next(*downloader);

    EXPECT_EQ(downloader->state(), TransferState::FAILED);
    EXPECT_EQ(downloader->failure(), FailureReason::FILE_NOT_LISTED);
    EXPECT_EQ(sent_texts(), std::vector<std::string>{"!ls"});
}

TEST_F(DownloaderTest, CancelStopsEverything) {
    auto downloader = make();
    downloader->start("test.txt");
    serve_next(*downloader);
    downloader->cancel();

    EXPECT_EQ(downloader->state(), TransferState::CANCELLED);
    EXPECT_FALSE(downloader->session().has_value());
    EXPECT_FALSE(downloader->next_wakeup().has_value());

    size_t sends = sent_.size();
    clock_.advance(10min);
    downloader->on_tick();
    downloader->on_command(protocol::ChunkResponse{"test.txt", 0, catalog_.get_chunk("test.txt", 0)});
    EXPECT_EQ(sent_.size(), sends);
    EXPECT_EQ(downloader->state(), TransferState::CANCELLED);
}

TEST_F(DownloaderTest, SendFailureCountsAsAttempt) {
    send_ok_ = false;
    auto downloader = make();
    downloader->start("test.txt");
    run_timers(*downloader);

    EXPECT_EQ(downloader->state(), TransferState::FAILED);
    EXPECT_EQ(downloader->failure(), FailureReason::TIMEOUT);
    EXPECT_EQ(count_sent("!ls"), 5u);
}

TEST_F(DownloaderTest, EmptyFileGoesStraightToChecksum) {
    auto downloader = make();
    downloader->start("empty");
    pump(*downloader);

    EXPECT_EQ(downloader->state(), TransferState::COMPLETED);
    EXPECT_TRUE(downloader->content().empty());
    EXPECT_EQ(sent_texts(), (std::vector<std::string>{"!ls", "!check empty"}));
}

TEST_F(DownloaderTest, PacesChunkRequests) {
    settings_.chunk_interval = 500ms;
    auto downloader = make();
    downloader->start("test.txt");
    serve_next(*downloader);   // list -> first chunk request goes out at once
    serve_next(*downloader);   // chunk 0
    ASSERT_EQ(sent_.size(), 2u);

    clock_.advance(499ms);
    downloader->on_tick();
    EXPECT_EQ(sent_.size(), 2u);

    clock_.advance(1ms);
    downloader->on_tick();
    ASSERT_EQ(sent_.size(), 3u);
    EXPECT_EQ(sent_.back().text, "!req test.txt 1");
}
