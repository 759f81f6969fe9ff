#pragma once

#include "export.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Balance {
namespace Crypto {

/// Cryptographically strong random bytes (OpenSSL RAND_bytes)
BL_API std::vector<uint8_t> randomBytes(size_t count);

/// HKDF-SHA256
BL_API std::vector<uint8_t> hkdf(
    const std::vector<uint8_t>& ikm,    // Input key material
    const std::string& salt,
    const std::string& info,
    size_t outputLength
);

/// UUID v4, lowercase
BL_API std::string generateUUID();

BL_API std::string base64Encode(const std::string& input);

/// @return nullopt if the input is not valid base64
BL_API std::optional<std::string> base64Decode(const std::string& input);

BL_API std::string toHex(const std::vector<uint8_t>& bytes);

/// @return nullopt on odd length or non-hex characters
BL_API std::optional<std::vector<uint8_t>> fromHex(const std::string& hex);

} // namespace Crypto
} // namespace Balance
