//
// Created by igor on 21/08/2025.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

#include <pngme/export_pngme.h>
#include <pngme/chunk_type.hh>

namespace pngme {

    // CRC-32 as used by PNG (reflected polynomial 0xEDB88320, pre- and
    // post-inverted). Pass the previous result to continue a running CRC;
    // start from 0.
    PNGME_EXPORT std::uint32_t crc32_update(std::uint32_t crc, std::span<const std::byte> bytes) noexcept;

    // CRC of a chunk: computed over the type code followed by the data
    PNGME_EXPORT std::uint32_t chunk_crc(const chunk_type& type, std::span<const std::byte> data) noexcept;
}
