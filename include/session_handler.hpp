#pragma once

#include <string>
#include <optional>
#include "catalog.hpp"
#include "protocol/command.hpp"

namespace transfer {

// Answers list/chunk/checksum requests from the catalog. Keeps no per-peer
// state, so one instance can serve every worker thread.
class SessionHandler {
public:
    explicit SessionHandler(const Catalog& catalog) : catalog_(catalog) {}

    // Reply for a request; nullopt for commands that are not requests
    std::optional<protocol::Command> handle(const protocol::Command& request) const;

    // Parse + handle. Unparseable "!..." lines get an "!error <reason>" reply,
    // other unparseable text is ignored.
    std::optional<std::string> handle_text(const std::string& text) const;

private:
    const Catalog& catalog_;
};

} // namespace transfer
