#include "crypto/Hash.hpp"

#include <openssl/evp.h>
#include <openssl/sha.h>
#include <sodium.h>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace hl::crypto::hash {

namespace {

std::string toHex(const unsigned char* digest, const size_t len) {
    std::ostringstream result;
    for (size_t i = 0; i < len; ++i)
        result << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    return result.str();
}

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

}

std::string sha256File(const std::filesystem::path& filepath,
                       const uintmax_t chunkSize,
                       const concurrency::InterruptFlag& interrupt) {
    std::ifstream file(filepath, std::ios::binary);
    if (!file) throw std::runtime_error("Failed to open file for hashing: " + filepath.string());

    const std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1)
        throw std::runtime_error("Failed to initialize SHA-256 context");

    std::vector<char> buffer(chunkSize > 0 ? chunkSize : 64 * 1024);
    while (file) {
        concurrency::throwIfInterrupted(interrupt, "hashing " + filepath.string());

        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const auto got = file.gcount();
        if (got > 0 && EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(got)) != 1)
            throw std::runtime_error("SHA-256 update failed for " + filepath.string());
    }

    if (file.bad()) throw std::runtime_error("Read error while hashing: " + filepath.string());

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest, &len) != 1)
        throw std::runtime_error("SHA-256 finalization failed for " + filepath.string());

    return toHex(digest, len);
}

std::string sha256Hex(const std::string_view data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
    return toHex(hash, SHA256_DIGEST_LENGTH);
}

std::string b64_encode(const std::string_view data) {
    const size_t encoded_len = sodium_base64_ENCODED_LEN(data.size(), sodium_base64_VARIANT_ORIGINAL);
    std::string result(encoded_len, '\0');

    sodium_bin2base64(result.data(), result.size(),
                      reinterpret_cast<const unsigned char*>(data.data()), data.size(),
                      sodium_base64_VARIANT_ORIGINAL);

    result.resize(std::strlen(result.c_str())); // Trim null terminator
    return result;
}

}
