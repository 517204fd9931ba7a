#pragma once
#include <cstddef>
#include <string>
#include <string_view>

namespace bw {

// Standard alphabet with '=' padding (OpenSSL EVP block coding).
std::string base64_encode(const char* data, std::size_t len);
inline std::string base64_encode(std::string_view bytes) {
  return base64_encode(bytes.data(), bytes.size());
}

// Throws std::invalid_argument on malformed input.
std::string base64_decode(std::string_view encoded);

}  // namespace bw
