#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <initializer_list>
#include <string>
#include <string_view>

namespace vault::identity {

/*
  HashKey

  Fixed-width SHA-256 digest used as the surrogate key of every hub,
  link and session. The all-zero key is reserved as "null".
*/

using HashKey = std::array<uint8_t, 32>;

inline constexpr std::size_t kHashKeySize = 32;

bool IsNull(const HashKey& key);

std::string ToHex(const HashKey& key);

// throws util::ValidationError on wrong length or non-hex input
HashKey FromHex(std::string_view hex);

// raw 32-byte view, used for BLOB columns and protobuf bytes fields
std::string ToBytes(const HashKey& key);
HashKey     FromBytes(std::string_view bytes);

// SHA-256 over the concatenation of all parts
HashKey Sha256(std::initializer_list<std::string_view> parts);

inline std::string_view AsView(const HashKey& key) {
  return {reinterpret_cast<const char*>(key.data()), key.size()};
}

struct HashKeyHasher {
  std::size_t operator()(const HashKey& key) const noexcept {
    std::size_t h;
    std::memcpy(&h, key.data(), sizeof(h));
    return h;
  }
};

} // namespace vault::identity
