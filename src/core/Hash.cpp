#include "starhelm/core/Hash.h"

namespace starhelm::core {

u64 fnv1a64(std::string_view text) {
  constexpr u64 offsetBasis = 14695981039346656037ull;
  constexpr u64 prime       = 1099511628211ull;

  u64 hash = offsetBasis;
  for (char c : text) {
    hash ^= static_cast<u64>(static_cast<unsigned char>(c));
    hash *= prime;
  }
  return hash;
}

u64 hashCombine(u64 a, u64 b) {
  a ^= mix64(b) + 0x9e3779b97f4a7c15ull + (a << 6) + (a >> 2);
  return a;
}

u64 mix64(u64 x) {
  x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ull;
  x = (x ^ (x >> 27)) * 0x94D049BB133111EBull;
  return x ^ (x >> 31);
}

} // namespace starhelm::core
