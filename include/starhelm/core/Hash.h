#pragma once

#include "starhelm/core/Types.h"

#include <string_view>

namespace starhelm::core {

// 64-bit FNV-1a hash (stable across runs and platforms).
// Used to turn catalog keys ("earth", "luna") into entity ids.
u64 fnv1a64(std::string_view text);

// Combine two 64-bit hashes into one.
u64 hashCombine(u64 a, u64 b);

// SplitMix64 finalizer. Spreads low-entropy values (small counters, ids that
// differ in a few bits) over the full 64-bit range.
u64 mix64(u64 x);

} // namespace starhelm::core
