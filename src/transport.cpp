#include "transport.hpp"

namespace networking {

std::string normalize_node_id(const std::string& id) {
    if (id.empty() || id.front() == '!' || id == BROADCAST_ID) {
        return id;
    }
    return "!" + id;
}

} // namespace networking
