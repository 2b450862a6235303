#include "catalog.hpp"
#include "protocol/base64.hpp"
#include "security.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <iterator>

namespace fs = std::filesystem;

namespace transfer {

Catalog::Catalog(const std::vector<SourceFile>& candidates, const config::Settings& settings)
    : chunk_size_(settings.chunk_size) {
    for (const auto& file : candidates) {
        if (file.name.size() > settings.max_filename_length) {
            warnings_.push_back("Skipping: " + file.name + " (filename too long, max " +
                                std::to_string(settings.max_filename_length) + " chars)");
            continue;
        }
        // Names travel as single tokens on the wire
        if (file.name.empty() || file.name.find_first_of(" \t\r\n") != std::string::npos) {
            warnings_.push_back("Skipping: '" + file.name + "' (filename must be one word)");
            continue;
        }
        if (entries_.size() >= settings.max_file_count) {
            warnings_.push_back("Skipping: " + file.name + " (file limit reached, max " +
                                std::to_string(settings.max_file_count) + " files)");
            continue;
        }

        CatalogEntry entry;
        entry.name = file.name;
        entry.size = file.bytes.size();
        entry.encoded = protocol::base64_encode(file.bytes);
        entry.chunk_count = (entry.encoded.size() + chunk_size_ - 1) / chunk_size_;
        entry.md5 = security::md5_hex(file.bytes);
        entries_.push_back(std::move(entry));
    }
}

std::vector<protocol::FileEntry> Catalog::list() const {
    std::vector<protocol::FileEntry> files;
    for (const auto& entry : entries_) {
        files.push_back({entry.name, entry.chunk_count});
    }
    return files;
}

const CatalogEntry* Catalog::find(const std::string& name) const {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&name](const CatalogEntry& e) { return e.name == name; });
    return it == entries_.end() ? nullptr : &*it;
}

std::string Catalog::get_chunk(const std::string& name, uint64_t index) const {
    const CatalogEntry* entry = find(name);
    if (!entry) {
        throw CatalogError(CatalogError::Code::FILE_NOT_FOUND, "File not found: " + name);
    }
    if (index >= entry->chunk_count) {
        throw CatalogError(CatalogError::Code::INVALID_CHUNK,
                           "Invalid chunk " + std::to_string(index) + " for " + name);
    }
    return entry->encoded.substr(index * chunk_size_, chunk_size_);
}

std::string Catalog::hash_of(const std::string& name) const {
    const CatalogEntry* entry = find(name);
    if (!entry) {
        throw CatalogError(CatalogError::Code::FILE_NOT_FOUND, "File not found: " + name);
    }
    return entry->md5;
}

std::vector<SourceFile> scan_directory(const fs::path& directory) {
    std::vector<fs::path> paths;
    for (const auto& entry : fs::directory_iterator(directory)) {
        if (entry.is_regular_file()) {
            paths.push_back(entry.path());
        }
    }
    std::sort(paths.begin(), paths.end());

    std::vector<SourceFile> files;
    for (const auto& path : paths) {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open()) {
            std::cerr << "Could not open file for reading: " << path.string() << "\n";
            continue;
        }
        SourceFile source;
        source.name = path.filename().string();
        source.bytes.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
        if (file.bad()) {
            std::cerr << "Error reading " << path.string() << "\n";
            continue;
        }
        files.push_back(std::move(source));
    }
    return files;
}

} // namespace transfer
