#ifndef QUIRE_CORE_UTIL_H
#define QUIRE_CORE_UTIL_H

#include <cstdint>
#include <cstddef>
#include <cstring>

static inline std::uint32_t readU32(const std::uint8_t* src, std::size_t offset) noexcept {
    std::uint32_t v;
    std::memcpy(&v, src + offset, sizeof(v));
    return v;
}

#endif // QUIRE_CORE_UTIL_H
