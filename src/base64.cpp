#include "protocol/base64.hpp"
#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/binary_from_base64.hpp>
#include <boost/archive/iterators/transform_width.hpp>
#include <boost/archive/iterators/dataflow_exception.hpp>
#include <algorithm>

namespace protocol {

namespace {

bool is_base64_char(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '+' || c == '/';
}

} // namespace

std::string base64_encode(const std::vector<uint8_t>& data) {
    using namespace boost::archive::iterators;
    using Encoder = base64_from_binary<transform_width<std::vector<uint8_t>::const_iterator, 6, 8>>;

    std::string encoded(Encoder(data.begin()), Encoder(data.end()));
    encoded.append((3 - data.size() % 3) % 3, '=');
    return encoded;
}

std::optional<std::vector<uint8_t>> base64_decode(const std::string& text) {
    using namespace boost::archive::iterators;
    using Decoder = transform_width<binary_from_base64<std::string::const_iterator>, 8, 6>;

    if (text.size() % 4 != 0) {
        return std::nullopt;
    }

    size_t padding = 0;
    while (padding < 2 && padding < text.size() && text[text.size() - 1 - padding] == '=') {
        ++padding;
    }
    size_t body = text.size() - padding;
    if (!std::all_of(text.begin(), text.begin() + body, is_base64_char)) {
        return std::nullopt;
    }

    // binary_from_base64 has no notion of '='; decode zero bits and trim afterwards
    std::string normalized = text.substr(0, body) + std::string(padding, 'A');
    std::vector<uint8_t> decoded;
    try {
        for (Decoder it(normalized.cbegin()), end(normalized.cend()); it != end; ++it) {
            decoded.push_back(static_cast<uint8_t>(*it));
        }
    } catch (const dataflow_exception&) {
        return std::nullopt;
    }
    decoded.resize(decoded.size() - std::min(decoded.size(), padding));
    return decoded;
}

} // namespace protocol
