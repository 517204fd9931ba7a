#include "Base64.hpp"

#include <openssl/evp.h>

#include <climits>
#include <stdexcept>

namespace bw {

std::string base64_encode(const char* data, std::size_t len) {
  if (len == 0) return {};
  if (len > static_cast<std::size_t>(INT_MAX / 4 * 3)) {
    throw std::invalid_argument("base64_encode: input too large");
  }
  std::string out(4 * ((len + 2) / 3) + 1, '\0');
  const int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                reinterpret_cast<const unsigned char*>(data),
                                static_cast<int>(len));
  out.resize(static_cast<std::size_t>(n));
  return out;
}

std::string base64_decode(std::string_view encoded) {
  if (encoded.empty()) return {};
  if (encoded.size() % 4 != 0 || encoded.size() > static_cast<std::size_t>(INT_MAX)) {
    throw std::invalid_argument("base64_decode: length is not a multiple of 4");
  }
  std::string out(encoded.size() / 4 * 3, '\0');
  const int n = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                reinterpret_cast<const unsigned char*>(encoded.data()),
                                static_cast<int>(encoded.size()));
  if (n < 0) throw std::invalid_argument("base64_decode: malformed input");

  // EVP_DecodeBlock counts the padding as zero bytes.
  std::size_t pad = 0;
  if (encoded.back() == '=') ++pad;
  if (encoded.size() >= 2 && encoded[encoded.size() - 2] == '=') ++pad;
  out.resize(static_cast<std::size_t>(n) - pad);
  return out;
}

}  // namespace bw
