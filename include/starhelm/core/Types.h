#pragma once

#include <cstdint>

namespace starhelm::core {

using u8  = std::uint8_t;
using u64 = std::uint64_t;

} // namespace starhelm::core
