//
// Created by igor on 21/08/2025.
//

#include <pngme/crc.hh>
#include <algorithm>
#include <limits>
#include <zlib.h>

namespace pngme {

    std::uint32_t crc32_update(std::uint32_t crc, std::span<const std::byte> bytes) noexcept {
        // zlib takes a uInt length; feed larger ranges in slices
        constexpr std::size_t max_slice = std::numeric_limits<uInt>::max();

        uLong value = crc;
        while (!bytes.empty()) {
            std::size_t n = std::min(bytes.size(), max_slice);
            value = ::crc32(value, reinterpret_cast<const Bytef*>(bytes.data()), static_cast<uInt>(n));
            bytes = bytes.subspan(n);
        }
        return static_cast<std::uint32_t>(value);
    }

    std::uint32_t chunk_crc(const chunk_type& type, std::span<const std::byte> data) noexcept {
        auto type_bytes = type.bytes();
        std::uint32_t crc = crc32_update(0, std::as_bytes(std::span(type_bytes)));
        return crc32_update(crc, data);
    }

} // namespace pngme
