#include "udp_mesh.hpp"
#include "security.hpp"
#include <array>
#include <chrono>
#include <iostream>

using boost::asio::ip::udp;

namespace networking {

namespace {

const std::string FRAME_PREFIX = "MESHDROP";

} // namespace

std::string encode_frame(const MeshFrame& frame) {
    return FRAME_PREFIX + "|" + frame.from + "|" + frame.to + "|" + std::to_string(frame.packet_id) + "|" +
           std::to_string(frame.hops) + "|" + frame.text;
}

std::optional<MeshFrame> decode_frame(const std::string& datagram) {
    // Parse format: MESHDROP|<from>|<to>|<packet_id>|<hops>|<text>
    std::array<size_t, 5> pipes{};
    size_t pos = 0;
    for (auto& pipe : pipes) {
        pipe = datagram.find('|', pos);
        if (pipe == std::string::npos) return std::nullopt;
        pos = pipe + 1;
    }
    if (datagram.compare(0, pipes[0], FRAME_PREFIX) != 0 || pipes[0] != FRAME_PREFIX.size()) {
        return std::nullopt;
    }

    MeshFrame frame;
    frame.from = datagram.substr(pipes[0] + 1, pipes[1] - pipes[0] - 1);
    frame.to = datagram.substr(pipes[1] + 1, pipes[2] - pipes[1] - 1);
    try {
        frame.packet_id = static_cast<uint32_t>(std::stoul(datagram.substr(pipes[2] + 1, pipes[3] - pipes[2] - 1)));
        frame.hops = std::stoi(datagram.substr(pipes[3] + 1, pipes[4] - pipes[3] - 1));
    } catch (const std::exception&) {
        return std::nullopt;
    }
    frame.text = datagram.substr(pipes[4] + 1);
    if (frame.from.empty() || frame.to.empty()) {
        return std::nullopt;
    }
    return frame;
}

// ─── UdpMeshTransport ───────────────────────────────────────────────────────

UdpMeshTransport::UdpMeshTransport(const config::Settings& settings, const transfer::Clock& clock)
    : settings_(settings),
      node_id_(settings.node_id.empty() ? security::generate_node_id() : normalize_node_id(settings.node_id)),
      socket_(io_context_),
      broadcast_endpoint_(boost::asio::ip::address_v4::broadcast(), settings.udp_port),
      inbox_(settings.queue_capacity),
      relay_filter_(settings.dedup_capacity, settings.dedup_window, clock) {}

UdpMeshTransport::~UdpMeshTransport() {
    stop();
}

void UdpMeshTransport::start() {
    if (running_) return;

    socket_.open(udp::v4());
    socket_.set_option(boost::asio::socket_base::reuse_address(true));
    socket_.set_option(boost::asio::socket_base::broadcast(true));
    socket_.bind(udp::endpoint(udp::v4(), settings_.udp_port));
    // Non-blocking so the loop can check running_ periodically
    socket_.non_blocking(true);

    running_ = true;
    thread_ = std::thread([this]() { receive_loop(); });
}

void UdpMeshTransport::stop() {
    running_ = false;
    if (thread_.joinable()) {
        thread_.join();
    }
    inbox_.close();
    boost::system::error_code ec;
    socket_.close(ec);
}

bool UdpMeshTransport::send(const std::string& to, const std::string& text) {
    if (text.size() > settings_.max_message_length) {
        std::cerr << "Message too long for the mesh (" << text.size() << " > "
                  << settings_.max_message_length << " bytes), not sent\n";
        return false;
    }
    return broadcast(MeshFrame{node_id_, normalize_node_id(to), security::generate_packet_id(),
                               settings_.hop_limit, text});
}

std::optional<InboundMessage> UdpMeshTransport::receive(std::chrono::milliseconds timeout) {
    return inbox_.pop(timeout);
}

bool UdpMeshTransport::broadcast(const MeshFrame& frame) {
    std::string datagram = encode_frame(frame);
    boost::system::error_code ec;
    {
        std::lock_guard<std::mutex> lock(send_mutex_);
        socket_.send_to(boost::asio::buffer(datagram), broadcast_endpoint_, 0, ec);
    }
    if (ec) {
        std::cerr << "UdpMeshTransport send error (packet " << frame.packet_id << "): " << ec.message() << "\n";
        return false;
    }
    return true;
}

void UdpMeshTransport::receive_loop() {
    try {
        while (running_) {
            std::array<char, 1024> recv_buf;
            udp::endpoint sender_endpoint;
            boost::system::error_code ec;

            size_t len = socket_.receive_from(boost::asio::buffer(recv_buf), sender_endpoint, 0, ec);

            if (ec == boost::asio::error::would_block) {
                std::this_thread::sleep_for(std::chrono::milliseconds(20));
                continue;
            }
            if (ec) continue;

            handle_datagram(std::string(recv_buf.data(), len));
        }
    } catch (std::exception& e) {
        std::cerr << "UdpMeshTransport Exception: " << e.what() << "\n";
    }
}

void UdpMeshTransport::handle_datagram(const std::string& datagram) {
    std::optional<MeshFrame> frame = decode_frame(datagram);
    if (!frame) return;

    // Ignore our own broadcasts, including relayed copies
    if (frame->from == node_id_) return;

    bool for_us = frame->to == node_id_ || frame->to == BROADCAST_ID;
    if (for_us) {
        if (!inbox_.push(InboundMessage{frame->from, frame->to, frame->packet_id, frame->text})) {
            std::cerr << "Inbound queue full, dropped message from " << frame->from << "\n";
        }
    }

    if (frame->to != node_id_ && frame->hops > 0 &&
        !relay_filter_.is_duplicate(frame->from, frame->packet_id, frame->text)) {
        MeshFrame relay = *frame;
        relay.hops--;
        if (!broadcast(relay)) {
            std::cerr << "Relay failed for packet " << relay.packet_id << " from " << relay.from << "\n";
        }
    }
}

} // namespace networking
