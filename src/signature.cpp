#include "foxess/signature.hpp"

#include <openssl/evp.h>
#include <stdexcept>

namespace foxess {

std::string md5_hex(const std::string &data) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int len = 0;
  if (EVP_Digest(data.data(), data.size(), digest, &len, EVP_md5(), nullptr) !=
      1) {
    throw std::runtime_error("EVP_Digest(md5) failed");
  }

  static const char *hex = "0123456789abcdef";
  std::string out;
  out.resize(static_cast<std::size_t>(len) * 2);
  for (unsigned int i = 0; i < len; ++i) {
    out[2 * i] = hex[(digest[i] >> 4) & 0xF];
    out[2 * i + 1] = hex[digest[i] & 0xF];
  }
  return out;
}

std::string sign(const std::string &path, const std::string &token,
                 std::int64_t timestamp_millis) {
  std::string input;
  input.reserve(path.size() + token.size() + 32);
  input += path;
  input += kSignatureSeparator;
  input += token;
  input += kSignatureSeparator;
  input += std::to_string(timestamp_millis);
  return md5_hex(input);
}

} // namespace foxess
