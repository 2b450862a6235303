#include "session_handler.hpp"
#include "protocol/codec.hpp"

namespace transfer {

namespace {

using protocol::Command;

struct Dispatcher {
    const Catalog& catalog;

    std::optional<Command> operator()(const protocol::ListRequest&) const {
        return Command{protocol::ListResponse{catalog.list()}};
    }

    std::optional<Command> operator()(const protocol::ChunkRequest& r) const {
        try {
            return Command{protocol::ChunkResponse{r.file_name, r.index, catalog.get_chunk(r.file_name, r.index)}};
        } catch (const CatalogError& e) {
            return Command{protocol::ErrorResponse{e.what()}};
        }
    }

    std::optional<Command> operator()(const protocol::ChecksumRequest& r) const {
        try {
            return Command{protocol::ChecksumResponse{r.file_name, catalog.hash_of(r.file_name)}};
        } catch (const CatalogError& e) {
            return Command{protocol::ErrorResponse{e.what()}};
        }
    }

    // Responses are for clients; a server never answers them
    std::optional<Command> operator()(const protocol::ListResponse&) const { return std::nullopt; }
    std::optional<Command> operator()(const protocol::ChunkResponse&) const { return std::nullopt; }
    std::optional<Command> operator()(const protocol::ChecksumResponse&) const { return std::nullopt; }
    std::optional<Command> operator()(const protocol::ErrorResponse&) const { return std::nullopt; }
};

} // namespace

std::optional<Command> SessionHandler::handle(const Command& request) const {
    return std::visit(Dispatcher{catalog_}, request);
}

std::optional<std::string> SessionHandler::handle_text(const std::string& text) const {
    protocol::ParseResult parsed = protocol::parse(text);
    if (auto* error = std::get_if<protocol::ParseError>(&parsed)) {
        size_t start = text.find_first_not_of(" \t\r\n");
        if (start != std::string::npos && text[start] == '!') {
            return protocol::serialize(protocol::ErrorResponse{error->reason});
        }
        return std::nullopt;
    }

    std::optional<Command> reply = handle(std::get<Command>(parsed));
    if (!reply) {
        return std::nullopt;
    }
    return protocol::serialize(*reply);
}

} // namespace transfer
