#pragma once

#include <cstdint>

namespace core {
// Xorshift32. State is owned by the caller so runs replay from a seed.
uint32_t NextU32(uint32_t& state);
// Uniform integer in [0, bound]. Returns 0 when bound <= 0.
int NextInt(uint32_t& state, int bound);
}  // namespace core
