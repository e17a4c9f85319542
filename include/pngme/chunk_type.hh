/**
 * @file chunk_type.hh
 * @brief Four-letter PNG chunk type code
 * @author Igor
 * @date 10/08/2025
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

#include <pngme/export_pngme.h>

namespace pngme {

    /**
     * @class chunk_type
     * @brief A validated 4-byte chunk type code
     *
     * Type codes consist of uppercase and lowercase ASCII letters only.
     * A chunk_type can only be obtained through a validating constructor,
     * so every instance holds four letters. Bit 5 of each letter (the
     * case bit) carries one property of the chunk:
     *
     * | byte | bit 5 clear (uppercase) | bit 5 set (lowercase) |
     * |------|-------------------------|-----------------------|
     * | 0    | critical                | ancillary             |
     * | 1    | public                  | private               |
     * | 2    | reserved bit valid      | reserved bit invalid  |
     * | 3    | unsafe to copy          | safe to copy          |
     */
    class PNGME_EXPORT chunk_type {
    public:
        using bytes_type = std::array<std::uint8_t, 4>;

        static constexpr std::size_t size = 4;

        /**
         * @brief Construct from raw bytes
         * @param bytes Four type code bytes
         * @throws invalid_byte_error on the first byte that is not an ASCII letter
         */
        explicit chunk_type(const bytes_type& bytes);

        /**
         * @brief Construct from text
         * @param str Exactly four ASCII letters
         * @throws invalid_length_error if str is not 4 characters long
         * @throws invalid_byte_error on the first character that is not an ASCII letter
         */
        static chunk_type from_string(std::string_view str);

        /**
         * @brief Construct from a raw pointer to 4 bytes (e.g. inside a buffer)
         * @throws invalid_byte_error on the first byte that is not an ASCII letter
         */
        static chunk_type from_bytes(const void* data);

        [[nodiscard]] bytes_type bytes() const noexcept { return m_bytes; }

        /// Bit 5 of byte 0 is zero
        [[nodiscard]] bool is_critical() const noexcept { return is_bit_clear(m_bytes[0]); }

        /// Bit 5 of byte 1 is zero
        [[nodiscard]] bool is_public() const noexcept { return is_bit_clear(m_bytes[1]); }

        /// Bit 5 of byte 2 is zero, as required by the current format revision
        [[nodiscard]] bool is_reserved_bit_valid() const noexcept { return is_bit_clear(m_bytes[2]); }

        /// Bit 5 of byte 3 is one
        [[nodiscard]] bool is_safe_to_copy() const noexcept { return !is_bit_clear(m_bytes[3]); }

        /// Only the reserved bit affects validity
        [[nodiscard]] bool is_valid() const noexcept { return is_reserved_bit_valid(); }

        [[nodiscard]] std::string to_string() const {
            return {reinterpret_cast<const char*>(m_bytes.data()), size};
        }

        // Write to bytes
        void to_bytes(void* dest) const noexcept;

        [[nodiscard]] static constexpr bool is_valid_byte(std::uint8_t b) noexcept {
            return (b >= 'A' && b <= 'Z') || (b >= 'a' && b <= 'z');
        }

        // Comparison operators
        bool operator==(const chunk_type& o) const { return m_bytes == o.m_bytes; }
        bool operator!=(const chunk_type& o) const { return !(*this == o); }
        bool operator<(const chunk_type& o) const { return m_bytes < o.m_bytes; }

        // Stream output as quoted string
        friend std::ostream& operator<<(std::ostream& os, const chunk_type& t) {
            return os << '\'' << t.to_string() << '\'';
        }

    private:
        static constexpr std::uint8_t property_bit = 1u << 5;

        static constexpr bool is_bit_clear(std::uint8_t b) noexcept {
            return (b & property_bit) == 0;
        }

        bytes_type m_bytes;
    };

    // Hash function
    struct chunk_type_hash {
        std::size_t operator()(const chunk_type& t) const noexcept {
            auto b = t.bytes();
            std::uint32_t v = (std::uint32_t(b[0]) << 24) | (std::uint32_t(b[1]) << 16) |
                              (std::uint32_t(b[2]) << 8) | std::uint32_t(b[3]);
            return (static_cast<std::size_t>(v) * 0x9E3779B1u) ^ 0x85EBCA6Bu;
        }
    };

} // namespace pngme

// Specialization for std::hash
namespace std {
    template<>
    struct hash<pngme::chunk_type> {
        std::size_t operator()(const pngme::chunk_type& t) const noexcept {
            return pngme::chunk_type_hash{}(t);
        }
    };
}
