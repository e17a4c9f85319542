//
// Created by igor on 21/08/2025.
//

#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string_view>

#include <pngme/export_pngme.h>

namespace pngme {

    // Description of the first malformed sequence in a byte range
    struct utf8_error {
        std::size_t offset = 0;   // Byte offset of the offending sequence
        std::string_view reason;  // Static description, e.g. "overlong encoding"
    };

    // Validate bytes as UTF-8 (RFC 3629: no surrogates, no overlongs,
    // nothing above U+10FFFF). Returns nullopt when the input is valid.
    PNGME_EXPORT std::optional<utf8_error> validate_utf8(std::span<const std::byte> bytes) noexcept;

    inline bool is_valid_utf8(std::span<const std::byte> bytes) noexcept {
        return !validate_utf8(bytes).has_value();
    }
}
