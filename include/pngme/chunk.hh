/**
 * @file chunk.hh
 * @brief PNG chunk record and its binary codec
 * @author Igor
 * @date 14/08/2025
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <span>
#include <string>
#include <vector>

#include <pngme/export_pngme.h>
#include <pngme/chunk_type.hh>

namespace pngme {

    /**
     * @class chunk
     * @brief One complete chunk: length, type code, data and CRC
     *
     * Serialized layout (all integers big-endian):
     *
     * | offset     | size   | field                      |
     * |------------|--------|----------------------------|
     * | 0          | 4      | data length                |
     * | 4          | 4      | type code                  |
     * | 8          | length | data                       |
     * | 8 + length | 4      | CRC-32 over type and data  |
     *
     * The CRC always matches the type and data: it is computed when a chunk
     * is built from its parts and verified when a chunk is decoded. A chunk
     * is immutable once constructed.
     */
    class PNGME_EXPORT chunk {
    public:
        /// Largest data length allowed by the format (2^31 - 1)
        static constexpr std::uint32_t max_length = 0x7FFFFFFFu;

        /// Bytes taken by the length, type and CRC fields
        static constexpr std::size_t overhead = 12;

        /**
         * @brief Build a chunk from its type and data, computing the CRC
         * @param type Chunk type code
         * @param data Chunk payload
         * @throws length_too_large_error if data holds more than max_length bytes
         */
        chunk(chunk_type type, std::vector<std::byte> data);

        /**
         * @brief Decode one chunk from the start of a buffer
         *
         * The buffer may hold further bytes after the chunk; they are not
         * examined. Use encoded_size() to find where the chunk ends.
         *
         * @param buffer Bytes starting at the chunk's length field
         * @return The decoded chunk
         * @throws length_too_large_error if the declared length is 2^31 or more
         * @throws chunk_type_error if the type code is not four ASCII letters
         * @throws truncated_buffer_error if the buffer ends inside the chunk
         * @throws checksum_mismatch_error if the stored CRC is wrong
         */
        static chunk from_bytes(std::span<const std::byte> buffer);

        [[nodiscard]] std::uint32_t length() const noexcept { return m_length; }
        [[nodiscard]] const chunk_type& type() const noexcept { return m_type; }
        [[nodiscard]] std::span<const std::byte> data() const noexcept { return m_data; }
        [[nodiscard]] std::uint32_t crc() const noexcept { return m_crc; }

        /// Size of the serialized chunk: overhead + length
        [[nodiscard]] std::size_t encoded_size() const noexcept { return overhead + m_length; }

        /**
         * @brief Interpret the data as UTF-8 text
         * @throws not_utf8_error if the data is not valid UTF-8
         */
        [[nodiscard]] std::string data_as_string() const;

        /// Serialize to the exact on-disk layout
        [[nodiscard]] std::vector<std::byte> to_bytes() const;

        /**
         * @brief Write the serialized chunk to a stream
         * @throws io_error if the stream fails
         */
        void write(std::ostream& os) const;

        /// Short description for diagnostics; never includes the data
        [[nodiscard]] std::string to_string() const;

        bool operator==(const chunk& o) const;
        bool operator!=(const chunk& o) const { return !(*this == o); }

        friend PNGME_EXPORT std::ostream& operator<<(std::ostream& os, const chunk& c);

    private:
        chunk(std::uint32_t length, chunk_type type, std::vector<std::byte> data, std::uint32_t crc);

        std::uint32_t m_length;
        chunk_type m_type;
        std::vector<std::byte> m_data;
        std::uint32_t m_crc;
    };

} // namespace pngme
