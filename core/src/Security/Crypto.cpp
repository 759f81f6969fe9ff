#include "balance/Crypto.h"
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/rand.h>
#include <spdlog/spdlog.h>
#include <uuid/uuid.h>
#include <stdexcept>

namespace Balance {
namespace Crypto {

std::vector<uint8_t> randomBytes(size_t count) {
    std::vector<uint8_t> result(count);
    if (count == 0) {
        return result;
    }
    if (RAND_bytes(result.data(), static_cast<int>(count)) != 1) {
        spdlog::error("Crypto::randomBytes: RAND_bytes failed");
        throw std::runtime_error("Failed to generate random bytes");
    }
    return result;
}

std::vector<uint8_t> hkdf(
    const std::vector<uint8_t>& ikm,
    const std::string& salt,
    const std::string& info,
    size_t outputLength
) {
    std::vector<uint8_t> result(outputLength);

    EVP_PKEY_CTX* pctx = EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr);
    if (!pctx) {
        throw std::runtime_error("EVP_PKEY_CTX_new_id failed");
    }

    bool success = false;
    do {
        if (EVP_PKEY_derive_init(pctx) <= 0) break;
        if (EVP_PKEY_CTX_set_hkdf_md(pctx, EVP_sha256()) <= 0) break;
        if (EVP_PKEY_CTX_set1_hkdf_salt(pctx,
            reinterpret_cast<const unsigned char*>(salt.data()),
            static_cast<int>(salt.size())) <= 0) break;
        if (EVP_PKEY_CTX_set1_hkdf_key(pctx,
            ikm.data(),
            static_cast<int>(ikm.size())) <= 0) break;
        if (EVP_PKEY_CTX_add1_hkdf_info(pctx,
            reinterpret_cast<const unsigned char*>(info.data()),
            static_cast<int>(info.size())) <= 0) break;

        size_t outlen = outputLength;
        if (EVP_PKEY_derive(pctx, result.data(), &outlen) <= 0) break;

        success = true;
    } while (false);

    EVP_PKEY_CTX_free(pctx);

    if (!success) {
        throw std::runtime_error("HKDF derivation failed");
    }

    return result;
}

std::string generateUUID() {
    uuid_t uuid;
    uuid_generate_random(uuid);
    char uuidStr[37];
    uuid_unparse_lower(uuid, uuidStr);
    return std::string(uuidStr);
}

std::string base64Encode(const std::string& input) {
    if (input.empty()) {
        return "";
    }
    std::string result(4 * ((input.size() + 2) / 3), '\0');
    int written = EVP_EncodeBlock(
        reinterpret_cast<unsigned char*>(&result[0]),
        reinterpret_cast<const unsigned char*>(input.data()),
        static_cast<int>(input.size()));
    result.resize(static_cast<size_t>(written));
    return result;
}

std::optional<std::string> base64Decode(const std::string& input) {
    if (input.empty()) {
        return std::string();
    }
    if (input.size() % 4 != 0) {
        return std::nullopt;
    }

    std::string result(3 * input.size() / 4, '\0');
    int written = EVP_DecodeBlock(
        reinterpret_cast<unsigned char*>(&result[0]),
        reinterpret_cast<const unsigned char*>(input.data()),
        static_cast<int>(input.size()));
    if (written < 0) {
        return std::nullopt;
    }

    // EVP_DecodeBlock keeps the zero bytes produced by '=' padding
    size_t padding = 0;
    if (input[input.size() - 1] == '=') padding++;
    if (input[input.size() - 2] == '=') padding++;
    result.resize(static_cast<size_t>(written) - padding);
    return result;
}

std::string toHex(const std::vector<uint8_t>& bytes) {
    static const char* digits = "0123456789abcdef";
    std::string result;
    result.reserve(bytes.size() * 2);
    for (uint8_t b : bytes) {
        result.push_back(digits[b >> 4]);
        result.push_back(digits[b & 0x0F]);
    }
    return result;
}

static int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::optional<std::vector<uint8_t>> fromHex(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        return std::nullopt;
    }
    std::vector<uint8_t> result;
    result.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int hi = hexValue(hex[i]);
        int lo = hexValue(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        result.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return result;
}

} // namespace Crypto
} // namespace Balance
