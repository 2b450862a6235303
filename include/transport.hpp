#pragma once

#include <string>
#include <cstdint>
#include <chrono>
#include <optional>

namespace networking {

// Destination that every node accepts
inline const std::string BROADCAST_ID = "^all";

struct InboundMessage {
    std::string from;
    std::string to;
    uint32_t packet_id;    // 0 when the medium has no packet ids
    std::string text;
};

// Text-message medium the protocol runs on. Implementations must allow
// send() from several threads at once.
class Transport {
public:
    virtual ~Transport() = default;

    virtual std::string local_id() const = 0;

    // false if the message could not be handed to the medium
    virtual bool send(const std::string& to, const std::string& text) = 0;

    // Next inbound message, or nullopt once timeout expires
    virtual std::optional<InboundMessage> receive(std::chrono::milliseconds timeout) = 0;
};

// "abcd1234" -> "!abcd1234"
std::string normalize_node_id(const std::string& id);

} // namespace networking
