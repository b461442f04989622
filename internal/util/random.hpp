#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace vault::util {

// Cryptographically strong randomness (OpenSSL RAND_bytes).

std::vector<uint8_t> RandomBytes(std::size_t n);

// lowercase hex of n random bytes
std::string RandomToken(std::size_t n);

} // namespace vault::util
