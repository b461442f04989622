#include "hash_key.hpp"

#include <openssl/evp.h>

#include <memory>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace vault::identity {

namespace {

int HexNibble(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
  return -1;
}

} // namespace

bool IsNull(const HashKey& key) {
  for (uint8_t b : key) {
    if (b != 0) return false;
  }
  return true;
}

std::string ToHex(const HashKey& key) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string           out;
  out.reserve(key.size() * 2);
  for (uint8_t b : key) {
    out.push_back(kHex[b >> 4]);
    out.push_back(kHex[b & 0x0F]);
  }
  return out;
}

HashKey FromHex(std::string_view hex) {
  if (hex.size() != kHashKeySize * 2) {
    throw util::ValidationError("invalid hash key: expected 64 hex chars, got " + std::to_string(hex.size()));
  }

  HashKey key{};
  for (std::size_t i = 0; i < kHashKeySize; ++i) {
    int hi = HexNibble(hex[2 * i]);
    int lo = HexNibble(hex[2 * i + 1]);
    if (hi < 0 || lo < 0) {
      throw util::ValidationError("invalid hash key: non-hex character");
    }
    key[i] = static_cast<uint8_t>((hi << 4) | lo);
  }
  return key;
}

std::string ToBytes(const HashKey& key) {
  return std::string(AsView(key));
}

HashKey FromBytes(std::string_view bytes) {
  if (bytes.size() != kHashKeySize) {
    throw util::ValidationError("invalid hash key: expected 32 bytes, got " + std::to_string(bytes.size()));
  }
  HashKey key{};
  std::memcpy(key.data(), bytes.data(), kHashKeySize);
  return key;
}

HashKey Sha256(std::initializer_list<std::string_view> parts) {
  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
  if (!ctx) throw std::runtime_error("EVP_MD_CTX_new failed");

  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("EVP_DigestInit_ex failed");
  }
  for (auto part : parts) {
    if (EVP_DigestUpdate(ctx.get(), part.data(), part.size()) != 1) {
      throw std::runtime_error("EVP_DigestUpdate failed");
    }
  }

  HashKey      out{};
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(ctx.get(), out.data(), &len) != 1 || len != kHashKeySize) {
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }
  return out;
}

} // namespace vault::identity
