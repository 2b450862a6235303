#pragma once

#include <string>
#include <variant>
#include "protocol/command.hpp"

namespace protocol {

struct ParseError {
    std::string reason;
};

using ParseResult = std::variant<Command, ParseError>;

// Whitespace-tokenized parse of one inbound text message. Never throws;
// anything that is not a known command shape comes back as ParseError.
ParseResult parse(const std::string& text);

// Inverse of parse(). Error messages are written without surrounding whitespace,
// which is the only form parse() can produce.
std::string serialize(const Command& command);

} // namespace protocol
