#pragma once

#include <string>
#include <cstdint>
#include <vector>
#include <variant>
#include "protocol/file_list.hpp"

namespace protocol {

// Client -> server

struct ListRequest {};

struct ChunkRequest {
    std::string file_name;
    uint64_t index;
};

struct ChecksumRequest {
    std::string file_name;
};

// Server -> client

struct ListResponse {
    std::vector<FileEntry> files;
};

struct ChunkResponse {
    std::string file_name;
    uint64_t index;
    std::string payload;   // base64 slice
};

struct ChecksumResponse {
    std::string file_name;
    std::string hash;      // md5, lowercase hex
};

struct ErrorResponse {
    std::string message;
};

using Command = std::variant<ListRequest, ListResponse, ChunkRequest, ChunkResponse,
                             ChecksumRequest, ChecksumResponse, ErrorResponse>;

bool operator==(const ListRequest&, const ListRequest&);
bool operator==(const ListResponse& a, const ListResponse& b);
bool operator==(const ChunkRequest& a, const ChunkRequest& b);
bool operator==(const ChunkResponse& a, const ChunkResponse& b);
bool operator==(const ChecksumRequest& a, const ChecksumRequest& b);
bool operator==(const ChecksumResponse& a, const ChecksumResponse& b);
bool operator==(const ErrorResponse& a, const ErrorResponse& b);

// Short name for log lines ("!req", "list response", ...)
std::string command_name(const Command& command);

bool is_request(const Command& command);

} // namespace protocol
