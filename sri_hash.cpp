#include "sri_hash.hpp"

#include <cstddef>
#include <iterator>
#include <string>

#include <boost/algorithm/hex.hpp>
#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/transform_width.hpp>

#include "errors.hpp"

namespace amo {

namespace {

// Only sha256 has been observed on AMO; anything else is rejected.
constexpr const char *SHA256_NAME = "sha256";
constexpr size_t SHA256_BYTES = 32;

std::string base64Encode(const std::string &raw) {
  using namespace boost::archive::iterators;
  using Base64 =
      base64_from_binary<transform_width<std::string::const_iterator, 6, 8>>;

  std::string encoded(Base64(raw.begin()), Base64(raw.end()));
  encoded.append((3 - raw.size() % 3) % 3, '=');
  return encoded;
}

} // namespace

std::string toSriHash(const std::string &digest) {
  size_t sep = digest.find(':');
  if (sep == std::string::npos) {
    throw MalformedHashError("hash has no algorithm separator: " + digest);
  }

  std::string algo = digest.substr(0, sep);
  std::string hex = digest.substr(sep + 1);
  if (algo != SHA256_NAME) {
    throw MalformedHashError("unsupported hash algorithm '" + algo +
                             "' in " + digest);
  }

  std::string raw;
  try {
    boost::algorithm::unhex(hex, std::back_inserter(raw));
  } catch (const boost::algorithm::hex_decode_error &) {
    throw MalformedHashError("hash digest is not valid hex: " + digest);
  }

  if (raw.size() != SHA256_BYTES) {
    throw MalformedHashError("sha256 digest must be " +
                             std::to_string(SHA256_BYTES) + " bytes, got " +
                             std::to_string(raw.size()) + ": " + digest);
  }

  return algo + "-" + base64Encode(raw);
}

} // namespace amo
