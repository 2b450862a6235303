#include "protocol/codec.hpp"
#include <charconv>
#include <vector>
#include <exception>

namespace protocol {

namespace {

const char* const kWhitespace = " \t\r\n";

std::string trim(const std::string& text) {
    size_t first = text.find_first_not_of(kWhitespace);
    if (first == std::string::npos) return "";
    size_t last = text.find_last_not_of(kWhitespace);
    return text.substr(first, last - first + 1);
}

// Split into at most max_parts tokens; the last token keeps the rest of the
// line (like str.split(maxsplit=max_parts - 1))
std::vector<std::string> split(const std::string& text, size_t max_parts) {
    std::vector<std::string> parts;
    size_t pos = 0;
    while (pos < text.size()) {
        pos = text.find_first_not_of(kWhitespace, pos);
        if (pos == std::string::npos) break;
        if (parts.size() + 1 == max_parts) {
            parts.push_back(trim(text.substr(pos)));
            break;
        }
        size_t end = text.find_first_of(kWhitespace, pos);
        if (end == std::string::npos) end = text.size();
        parts.push_back(text.substr(pos, end - pos));
        pos = end;
    }
    return parts;
}

bool parse_index(const std::string& token, uint64_t& index) {
    const char* first = token.data();
    const char* last = token.data() + token.size();
    auto result = std::from_chars(first, last, index);
    return result.ec == std::errc() && result.ptr == last && !token.empty();
}

bool has_whitespace(const std::string& text) {
    return text.find_first_of(kWhitespace) != std::string::npos;
}

ParseResult malformed(const std::string& command) {
    return ParseError{"Malformed " + command + " command"};
}

ParseResult parse_file_list(const std::string& text) {
    try {
        return Command{ListResponse{load_file_list(text)}};
    } catch (const std::exception& e) {
        return ParseError{std::string("Invalid file list: ") + e.what()};
    }
}

struct Serializer {
    std::string operator()(const ListRequest&) const {
        return "!ls";
    }
    std::string operator()(const ListResponse& r) const {
        return dump_file_list(r.files);
    }
    std::string operator()(const ChunkRequest& r) const {
        return "!req " + r.file_name + " " + std::to_string(r.index);
    }
    std::string operator()(const ChunkResponse& r) const {
        return "!chunk " + r.file_name + " " + std::to_string(r.index) + " " + r.payload;
    }
    std::string operator()(const ChecksumRequest& r) const {
        return "!check " + r.file_name;
    }
    std::string operator()(const ChecksumResponse& r) const {
        return "!checksum " + r.file_name + " " + r.hash;
    }
    // parse() trims the line, so only a trimmed message survives the trip
    std::string operator()(const ErrorResponse& r) const {
        std::string message = trim(r.message);
        return message.empty() ? "!error" : "!error " + message;
    }
};

} // namespace

ParseResult parse(const std::string& raw) {
    std::string text = trim(raw);
    if (text.empty()) {
        return ParseError{"Empty message"};
    }
    if (text.front() == '{') {
        return parse_file_list(text);
    }
    if (text.front() != '!') {
        return ParseError{"Not a command: " + text.substr(0, 20)};
    }

    std::vector<std::string> head = split(text, 2);
    const std::string& command = head[0];

    if (command == "!ls") {
        if (head.size() != 1) return malformed(command);
        return Command{ListRequest{}};
    }

    if (command == "!req") {
        std::vector<std::string> parts = split(text, 3);
        if (parts.size() != 3 || has_whitespace(parts[2])) return malformed(command);
        uint64_t index = 0;
        if (!parse_index(parts[2], index)) {
            return ParseError{"Invalid chunk number format"};
        }
        return Command{ChunkRequest{parts[1], index}};
    }

    if (command == "!chunk") {
        std::vector<std::string> parts = split(text, 4);
        if (parts.size() != 4 || has_whitespace(parts[3])) return malformed(command);
        uint64_t index = 0;
        if (!parse_index(parts[2], index)) {
            return ParseError{"Invalid chunk number format"};
        }
        return Command{ChunkResponse{parts[1], index, parts[3]}};
    }

    if (command == "!check") {
        std::vector<std::string> parts = split(text, 2);
        if (parts.size() != 2 || has_whitespace(parts[1])) return malformed(command);
        return Command{ChecksumRequest{parts[1]}};
    }

    if (command == "!checksum") {
        std::vector<std::string> parts = split(text, 3);
        if (parts.size() != 3 || has_whitespace(parts[2])) return malformed(command);
        return Command{ChecksumResponse{parts[1], parts[2]}};
    }

    if (command == "!error") {
        return Command{ErrorResponse{head.size() == 2 ? head[1] : ""}};
    }

    return ParseError{"Unknown command: " + command};
}

std::string serialize(const Command& command) {
    return std::visit(Serializer{}, command);
}

} // namespace protocol
