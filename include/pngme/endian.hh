//
// Created by igor on 10/08/2025.
//

#pragma once

#include <cstdint>
#include <cstring>

#include <pngme/pngme_config.h>

namespace pngme {
    // Platform endianness detection using CMake-generated config
#if LIBPNGME_BIG_ENDIAN
    constexpr bool is_big_endian = true;
    constexpr bool is_little_endian = false;
#else
    constexpr bool is_big_endian = false;
    constexpr bool is_little_endian = true;
#endif

    // Byte swapping functions
    inline uint32_t swap32(uint32_t x) {
        return ((x << 24) | ((x << 8) & 0x00FF0000) |
                ((x >> 8) & 0x0000FF00) | (x >> 24));
    }

    // Conditional byte swapping based on platform
    inline uint32_t swap32be(uint32_t x) {
        return is_big_endian ? x : swap32(x);
    }

    // Big-endian 32-bit load/store on unaligned memory
    inline uint32_t load_be32(const void* src) {
        uint32_t value;
        std::memcpy(&value, src, 4);
        return swap32be(value);
    }

    inline void store_be32(void* dest, uint32_t value) {
        value = swap32be(value);
        std::memcpy(dest, &value, 4);
    }
}
