#pragma once

#include <string>
#include <cstdint>
#include <atomic>
#include <mutex>
#include <thread>
#include <optional>
#include <boost/asio.hpp>
#include "config.hpp"
#include "clock.hpp"
#include "dedup.hpp"
#include "message_queue.hpp"
#include "transport.hpp"

namespace networking {

// Datagram layout: MESHDROP|<from>|<to>|<packet_id>|<hops>|<text>
struct MeshFrame {
    std::string from;
    std::string to;
    uint32_t packet_id;
    int hops;
    std::string text;
};

std::string encode_frame(const MeshFrame& frame);
std::optional<MeshFrame> decode_frame(const std::string& datagram);

// Emulates a flooding radio mesh with UDP broadcast on the local network.
// Every node hears every datagram; frames for other nodes are relayed once
// with one hop less until their hop budget is spent.
class UdpMeshTransport : public Transport {
public:
    UdpMeshTransport(const config::Settings& settings, const transfer::Clock& clock);
    ~UdpMeshTransport() override;

    void start();
    void stop();
    bool is_running() const { return running_; }

    std::string local_id() const override { return node_id_; }
    bool send(const std::string& to, const std::string& text) override;
    std::optional<InboundMessage> receive(std::chrono::milliseconds timeout) override;

protected:
    // Decode one datagram, queue it if it is for this node, relay it if hops remain
    void handle_datagram(const std::string& datagram);

    // Put one frame on the wire; false on socket errors
    virtual bool broadcast(const MeshFrame& frame);

private:
    void receive_loop();

    const config::Settings& settings_;
    std::string node_id_;

    boost::asio::io_context io_context_;
    boost::asio::ip::udp::socket socket_;
    boost::asio::ip::udp::endpoint broadcast_endpoint_;
    std::mutex send_mutex_;

    MessageQueue inbox_;
    DuplicateFilter relay_filter_;

    std::atomic<bool> running_{false};
    std::thread thread_;
};

} // namespace networking
