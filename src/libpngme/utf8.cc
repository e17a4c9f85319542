//
// Created by igor on 21/08/2025.
//

#include <pngme/utf8.hh>
#include <cstdint>

namespace pngme {

    std::optional<utf8_error> validate_utf8(std::span<const std::byte> bytes) noexcept {
        const std::size_t n = bytes.size();
        std::size_t i = 0;

        while (i < n) {
            auto lead = static_cast<std::uint8_t>(bytes[i]);
            if (lead < 0x80) {
                ++i;
                continue;
            }

            std::size_t len;
            std::uint32_t cp;
            std::uint32_t min_cp;
            if ((lead & 0xE0) == 0xC0) {
                len = 2;
                cp = lead & 0x1F;
                min_cp = 0x80;
            } else if ((lead & 0xF0) == 0xE0) {
                len = 3;
                cp = lead & 0x0F;
                min_cp = 0x800;
            } else if ((lead & 0xF8) == 0xF0) {
                len = 4;
                cp = lead & 0x07;
                min_cp = 0x10000;
            } else if ((lead & 0xC0) == 0x80) {
                return utf8_error{i, "unexpected continuation byte"};
            } else {
                return utf8_error{i, "invalid lead byte"};
            }

            if (n - i < len) {
                return utf8_error{i, "truncated sequence"};
            }

            for (std::size_t k = 1; k < len; ++k) {
                auto c = static_cast<std::uint8_t>(bytes[i + k]);
                if ((c & 0xC0) != 0x80) {
                    return utf8_error{i, "invalid continuation byte"};
                }
                cp = (cp << 6) | (c & 0x3F);
            }

            if (cp < min_cp) {
                return utf8_error{i, "overlong encoding"};
            }
            if (cp > 0x10FFFF) {
                return utf8_error{i, "code point out of range"};
            }
            if (cp >= 0xD800 && cp <= 0xDFFF) {
                return utf8_error{i, "surrogate code point"};
            }

            i += len;
        }

        return std::nullopt;
    }

} // namespace pngme
