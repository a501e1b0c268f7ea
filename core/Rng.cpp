#include "core/Rng.hpp"

namespace core {
uint32_t NextU32(uint32_t& state) {
    if (state == 0u) {
        state = 0xA341316Cu;
    }
    state ^= state << 13;
    state ^= state >> 17;
    state ^= state << 5;
    return state;
}

int NextInt(uint32_t& state, int bound) {
    if (bound <= 0) {
        return 0;
    }
    const uint32_t span = static_cast<uint32_t>(bound) + 1u;
    return static_cast<int>(NextU32(state) % span);
}
}  // namespace core
