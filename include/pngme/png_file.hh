/**
 * @file png_file.hh
 * @brief PNG document: signature plus an ordered list of chunks
 * @author Igor
 * @date 22/08/2025
 */

#pragma once

#include <array>
#include <cstdint>
#include <iosfwd>
#include <span>
#include <string>
#include <vector>

#include <pngme/export_pngme.h>
#include <pngme/chunk.hh>
#include <pngme/parse_options.hh>

namespace pngme {

    /**
     * @class png_file
     * @brief In-memory PNG document
     *
     * Holds the chunks of a PNG file in order. Chunks are kept exactly as
     * decoded; no image semantics are applied, so a document round-trips
     * byte for byte through read() and write().
     */
    class PNGME_EXPORT png_file {
    public:
        /// The 8 bytes every PNG file starts with
        static constexpr std::array<std::uint8_t, 8> signature{137, 80, 78, 71, 13, 10, 26, 10};

        png_file() = default;
        explicit png_file(std::vector<chunk> chunks);

        /**
         * @brief Parse a whole PNG document from memory
         * @throws signature_error if the signature is missing or wrong
         * @throws parse_error (or a subclass) for a malformed chunk in strict mode
         */
        static png_file from_bytes(std::span<const std::byte> bytes, const parse_options& options = {});

        /**
         * @brief Parse a whole PNG document from a stream
         * @throws signature_error if the signature is missing or wrong
         * @throws parse_error (or a subclass) for a malformed chunk in strict mode
         * @throws io_error if the stream fails
         */
        static png_file read(std::istream& stream, const parse_options& options = {});

        void append_chunk(chunk c);

        /**
         * @brief Remove the first chunk of the given type
         * @return The removed chunk
         * @throws chunk_not_found_error if no chunk has that type
         */
        chunk remove_first_chunk(const chunk_type& type);

        /// First chunk of the given type, or nullptr
        [[nodiscard]] const chunk* find_chunk(const chunk_type& type) const;

        [[nodiscard]] const std::vector<chunk>& chunks() const { return m_chunks; }

        /// Signature followed by every chunk, serialized
        [[nodiscard]] std::vector<std::byte> to_bytes() const;

        /**
         * @brief Write the serialized document to a stream
         * @throws io_error if the stream fails
         */
        void write(std::ostream& os) const;

        /// One line per chunk
        [[nodiscard]] std::string to_string() const;

        friend PNGME_EXPORT std::ostream& operator<<(std::ostream& os, const png_file& png);

    private:
        std::vector<chunk> m_chunks;
    };

} // namespace pngme
