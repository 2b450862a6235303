#include "protocol/file_list.hpp"
#include <stdexcept>

namespace protocol {

std::string dump_file_list(const std::vector<FileEntry>& files) {
    nlohmann::ordered_json j;
    j["files"] = nlohmann::ordered_json::array();
    for (const auto& file : files) {
        nlohmann::ordered_json entry;
        entry["name"] = file.name;
        entry["chunks"] = file.chunks;
        j["files"].push_back(entry);
    }
    return j.dump();
}

std::vector<FileEntry> load_file_list(const std::string& text) {
    nlohmann::json j = nlohmann::json::parse(text);
    const auto& files = j.at("files");
    if (!files.is_array()) {
        throw std::invalid_argument("files is not an array");
    }
    for (const auto& entry : files) {
        // Reject negative or fractional counts before the unsigned conversion
        if (!entry.at("chunks").is_number_unsigned() || !entry.at("name").is_string()) {
            throw std::invalid_argument("invalid file entry: " + entry.dump());
        }
    }
    return files.get<std::vector<FileEntry>>();
}

} // namespace protocol
