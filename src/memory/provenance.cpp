#include "memory/provenance.hpp"
#include <openssl/evp.h>
#include <array>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace reverie::memory {

std::string sha256_hex(const std::string& data) {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digest_len = 0;

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        throw std::runtime_error("OpenSSL: EVP_MD_CTX_new failed");
    }
    if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx, data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx, digest.data(), &digest_len) != 1) {
        EVP_MD_CTX_free(ctx);
        throw std::runtime_error("OpenSSL: EVP sha256 digest failed");
    }
    EVP_MD_CTX_free(ctx);

    std::ostringstream out;
    out << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < digest_len; ++i) {
        out << std::setw(2) << static_cast<int>(digest[i]);
    }
    return out.str();
}

std::string episode_content_hash(EpisodeKind kind, const EpisodePayload& payload) {
    // nlohmann::json objects are std::map backed, so dump() is canonical.
    nlohmann::json canonical;
    canonical["kind"] = episode_kind_to_string(kind);
    canonical["payload"] = payload;
    return sha256_hex(canonical.dump());
}

} // namespace reverie::memory
