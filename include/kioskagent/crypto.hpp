#pragma once

/**
 * @file crypto.hpp
 * @brief Digest and encoding helpers for the kiosk agent
 *
 * SHA-256 (cache keys, media checksums) and Base64 decoding (claim QR
 * image) backed by OpenSSL.
 */

#include "kioskagent.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace kioskagent {
namespace crypto {

/// Lowercase hex SHA-256 of a string
[[nodiscard]] std::string sha256_hex(const std::string& input);

/// Lowercase hex SHA-256 of a file's content; nullopt if it cannot be read
[[nodiscard]] std::optional<std::string> sha256_file_hex(const std::filesystem::path& path);

/// Decode standard Base64 to bytes; whitespace is ignored, missing padding tolerated
[[nodiscard]] std::vector<uint8_t> base64_decode(const std::string& encoded);

/// Decode the claim QR image and write it as a PNG file
[[nodiscard]] Result<void> write_qr_image(const ClaimTicket& ticket, const std::filesystem::path& destination);

}  // namespace crypto
}  // namespace kioskagent
