#include "security.hpp"
#include <sodium.h>
#include <openssl/evp.h>
#include <memory>
#include <sstream>
#include <iomanip>
#include <stdexcept>

namespace security {

namespace {

void ensure_sodium() {
    if (sodium_init() < 0) {
        throw std::runtime_error("libsodium initialization failed");
    }
}

std::string to_hex(const unsigned char* data, size_t size) {
    std::ostringstream oss;
    for (size_t i = 0; i < size; ++i) {
        oss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

std::string md5_raw(const unsigned char* data, size_t size) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data, size) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) {
        throw std::runtime_error("MD5 digest failed");
    }
    return to_hex(digest, digest_len);
}

} // namespace

std::string md5_hex(const std::vector<uint8_t>& data) {
    return md5_raw(data.data(), data.size());
}

std::string md5_hex(const std::string& data) {
    return md5_raw(reinterpret_cast<const unsigned char*>(data.data()), data.size());
}

std::string fingerprint(const std::string& origin, uint32_t packet_id, const std::string& content) {
    ensure_sodium();

    // Length-prefix the origin so ("ab", "c") and ("a", "bc") differ
    std::string material = std::to_string(origin.size()) + ":" + origin + "|" +
                           std::to_string(packet_id) + "|" + content;

    unsigned char hash[crypto_generichash_BYTES_MIN]; // 16 bytes
    if (crypto_generichash(hash, sizeof(hash),
                           reinterpret_cast<const unsigned char*>(material.data()), material.size(),
                           nullptr, 0) != 0) {
        throw std::runtime_error("crypto_generichash failed");
    }
    return to_hex(hash, sizeof(hash));
}

uint32_t generate_packet_id() {
    ensure_sodium();
    uint32_t id = 0;
    while (id == 0) {
        id = randombytes_random();
    }
    return id;
}

std::string generate_node_id() {
    ensure_sodium();
    std::ostringstream oss;
    oss << "!" << std::hex << std::setfill('0') << std::setw(8) << randombytes_random();
    return oss.str();
}

} // namespace security
