#pragma once

#include <string>
#include <cstdint>
#include <vector>
#include <nlohmann/json.hpp>

namespace protocol {

struct FileEntry {
    std::string name;
    uint64_t chunks;
};

inline bool operator==(const FileEntry& a, const FileEntry& b) {
    return a.name == b.name && a.chunks == b.chunks;
}

// Map JSON parsing automatically using nlohmann
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(FileEntry, name, chunks)

// {"files":[{"name":"a.txt","chunks":3},...]}, keys in wire order
std::string dump_file_list(const std::vector<FileEntry>& files);

// Throws nlohmann::json::exception or std::invalid_argument on malformed input
std::vector<FileEntry> load_file_list(const std::string& text);

} // namespace protocol
