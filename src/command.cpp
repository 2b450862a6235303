#include "protocol/command.hpp"

namespace protocol {

bool operator==(const ListRequest&, const ListRequest&) {
    return true;
}

bool operator==(const ListResponse& a, const ListResponse& b) {
    return a.files == b.files;
}

bool operator==(const ChunkRequest& a, const ChunkRequest& b) {
    return a.file_name == b.file_name && a.index == b.index;
}

bool operator==(const ChunkResponse& a, const ChunkResponse& b) {
    return a.file_name == b.file_name && a.index == b.index && a.payload == b.payload;
}

bool operator==(const ChecksumRequest& a, const ChecksumRequest& b) {
    return a.file_name == b.file_name;
}

bool operator==(const ChecksumResponse& a, const ChecksumResponse& b) {
    return a.file_name == b.file_name && a.hash == b.hash;
}

bool operator==(const ErrorResponse& a, const ErrorResponse& b) {
    return a.message == b.message;
}

namespace {

struct NameOf {
    std::string operator()(const ListRequest&) const { return "!ls"; }
    std::string operator()(const ListResponse&) const { return "list response"; }
    std::string operator()(const ChunkRequest&) const { return "!req"; }
    std::string operator()(const ChunkResponse&) const { return "!chunk"; }
    std::string operator()(const ChecksumRequest&) const { return "!check"; }
    std::string operator()(const ChecksumResponse&) const { return "!checksum"; }
    std::string operator()(const ErrorResponse&) const { return "!error"; }
};

struct IsRequest {
    bool operator()(const ListRequest&) const { return true; }
    bool operator()(const ChunkRequest&) const { return true; }
    bool operator()(const ChecksumRequest&) const { return true; }
    bool operator()(const ListResponse&) const { return false; }
    bool operator()(const ChunkResponse&) const { return false; }
    bool operator()(const ChecksumResponse&) const { return false; }
    bool operator()(const ErrorResponse&) const { return false; }
};

} // namespace

std::string command_name(const Command& command) {
    return std::visit(NameOf{}, command);
}

bool is_request(const Command& command) {
    return std::visit(IsRequest{}, command);
}

} // namespace protocol
