#include "crypto.hpp"

#include <fmt/format.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

#include <stdexcept>

namespace ibmvideo::crypto {

std::string sha1_hex(std::string_view data) {
	unsigned char digest[SHA_DIGEST_LENGTH];
	SHA1(reinterpret_cast<const unsigned char *>(data.data()), data.size(),
		 digest);

	std::string hex;
	hex.reserve(SHA_DIGEST_LENGTH * 2);
	for (unsigned char b : digest) { hex += fmt::format("{:02x}", b); }
	return hex;
}

std::vector<uint8_t> random_bytes(size_t count) {
	std::vector<uint8_t> bytes(count);
	if (count == 0) return bytes;
	if (RAND_bytes(bytes.data(), static_cast<int>(count)) != 1) {
		throw std::runtime_error("OpenSSL RAND_bytes failed");
	}
	return bytes;
}

std::string base64_encode(const std::vector<uint8_t> &bytes) {
	// EVP_EncodeBlock writes 4 output chars per 3 input bytes plus a NUL.
	std::string out(4 * ((bytes.size() + 2) / 3) + 1, '\0');
	int len = EVP_EncodeBlock(reinterpret_cast<unsigned char *>(out.data()),
							  bytes.data(), static_cast<int>(bytes.size()));
	out.resize(static_cast<size_t>(len));
	return out;
}

}  // namespace ibmvideo::crypto
