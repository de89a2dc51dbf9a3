#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace ibmvideo::crypto {

// Lowercase hex SHA-1 digest of `data`.
std::string sha1_hex(std::string_view data);

// Bytes from the OpenSSL CSPRNG. Throws std::runtime_error on failure.
std::vector<uint8_t> random_bytes(size_t count);

// Standard (padded) base64.
std::string base64_encode(const std::vector<uint8_t> &bytes);

}  // namespace ibmvideo::crypto
