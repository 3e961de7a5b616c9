#include "sri_hash.hpp"

#include <algorithm>
#include <cassert>
#include <cctype>
#include <iostream>
#include <string>

#include <boost/algorithm/hex.hpp>
#include <boost/archive/iterators/binary_from_base64.hpp>
#include <boost/archive/iterators/transform_width.hpp>

#include "errors.hpp"

namespace {

using amo::MalformedHashError;
using amo::toSriHash;

const std::string EMPTY_SHA256 =
    "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";

std::string decodeBase64(std::string text) {
  using namespace boost::archive::iterators;
  using Binary =
      transform_width<binary_from_base64<std::string::const_iterator>, 8, 6>;

  size_t padding = std::count(text.begin(), text.end(), '=');
  std::replace(text.begin(), text.end(), '=', 'A');
  std::string raw(Binary(text.cbegin()), Binary(text.cend()));
  raw.erase(raw.end() - padding, raw.end());
  return raw;
}

void expectMalformed(const std::string &digest) {
  bool thrown = false;
  try {
    toSriHash(digest);
  } catch (const MalformedHashError &) {
    thrown = true;
  }
  assert(thrown);
}

void TestKnownDigest() {
  assert(toSriHash("sha256:" + EMPTY_SHA256) ==
         "sha256-47DEQpj8HBSa+/TImW+5JCeuQeRkm5NMpJWZG3hSuFU=");
}

void TestUppercaseHexIsAccepted() {
  std::string upper = EMPTY_SHA256;
  for (auto &c : upper) {
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  assert(toSriHash("sha256:" + upper) == toSriHash("sha256:" + EMPTY_SHA256));
}

void TestOutputDecodesToDigestBytes() {
  const std::string digests[] = {
      EMPTY_SHA256,
      "0000000000000000000000000000000000000000000000000000000000000000",
      "ffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffff",
      "5e0b0a2a1c9d1e6b8f1f7c3b2a4d6e8f0a1b2c3d4e5f60718293a4b5c6d7e8f9",
  };
  for (const auto &hex : digests) {
    std::string sri = toSriHash("sha256:" + hex);
    assert(sri.rfind("sha256-", 0) == 0);
    assert(sri.size() == 7 + 44);

    std::string raw = decodeBase64(sri.substr(7));
    assert(raw == boost::algorithm::unhex(hex));
  }
}

void TestRejectsMalformedDigests() {
  expectMalformed(EMPTY_SHA256);
  expectMalformed("sha256-" + EMPTY_SHA256);
  expectMalformed("sha512:" + EMPTY_SHA256 + EMPTY_SHA256);
  expectMalformed("md5:d41d8cd98f00b204e9800998ecf8427e");
  expectMalformed("sha256:" + EMPTY_SHA256.substr(0, 62));
  expectMalformed("sha256:" + EMPTY_SHA256 + "00");
  expectMalformed("sha256:" + EMPTY_SHA256.substr(0, 63));
  expectMalformed("sha256:zz" + EMPTY_SHA256.substr(2));
  expectMalformed("sha256:");
  expectMalformed("");
}

} // namespace

int main() {
  TestKnownDigest();
  TestUppercaseHexIsAccepted();
  TestOutputDecodesToDigestBytes();
  TestRejectsMalformedDigests();

  std::cout << "fetch_addons_unit_sri_hash: pass\n";
  return 0;
}
