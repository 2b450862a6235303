#pragma once

#include <string>
#include <cstdint>
#include <vector>
#include <stdexcept>
#include <filesystem>
#include "config.hpp"
#include "protocol/file_list.hpp"

namespace transfer {

// A candidate file handed to the catalog
struct SourceFile {
    std::string name;
    std::vector<uint8_t> bytes;
};

struct CatalogEntry {
    std::string name;
    uint64_t size;          // raw bytes
    std::string encoded;    // base64 of the whole file
    uint64_t chunk_count;
    std::string md5;
};

class CatalogError : public std::runtime_error {
public:
    enum class Code {
        FILE_NOT_FOUND,
        INVALID_CHUNK
    };

    CatalogError(Code code, const std::string& what) : std::runtime_error(what), code_(code) {}
    Code code() const { return code_; }

private:
    Code code_;
};

// The server's immutable set of servable files. Built once, then only read.
class Catalog {
public:
    Catalog(const std::vector<SourceFile>& candidates, const config::Settings& settings);

    const std::vector<CatalogEntry>& entries() const { return entries_; }
    const std::vector<std::string>& warnings() const { return warnings_; }
    std::size_t chunk_size() const { return chunk_size_; }

    std::vector<protocol::FileEntry> list() const;
    const CatalogEntry* find(const std::string& name) const;

    // Throws CatalogError
    std::string get_chunk(const std::string& name, uint64_t index) const;
    std::string hash_of(const std::string& name) const;

private:
    std::size_t chunk_size_;
    std::vector<CatalogEntry> entries_;
    std::vector<std::string> warnings_;
};

// Regular files directly inside `directory`, sorted by name. Files that cannot
// be read are skipped and reported on stderr.
std::vector<SourceFile> scan_directory(const std::filesystem::path& directory);

} // namespace transfer
