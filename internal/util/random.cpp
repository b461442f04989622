#include "random.hpp"

#include <openssl/rand.h>

#include <stdexcept>

namespace vault::util {

std::vector<uint8_t> RandomBytes(std::size_t n) {
  std::vector<uint8_t> out(n);
  if (n == 0) return out;

  if (RAND_bytes(out.data(), static_cast<int>(n)) != 1) {
    throw std::runtime_error("RAND_bytes failed");
  }
  return out;
}

std::string RandomToken(std::size_t n) {
  static constexpr char kHex[] = "0123456789abcdef";

  auto        bytes = RandomBytes(n);
  std::string out;
  out.reserve(n * 2);
  for (uint8_t b : bytes) {
    out.push_back(kHex[b >> 4]);
    out.push_back(kHex[b & 0x0F]);
  }
  return out;
}

} // namespace vault::util
