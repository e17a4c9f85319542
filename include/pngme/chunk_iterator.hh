/**
 * @file chunk_iterator.hh
 * @brief Forward iterator over the chunks of a PNG stream
 * @author Igor
 * @date 13/08/2025
 */

#pragma once

#include <iosfwd>
#include <memory>
#include <optional>
#include <string_view>
#include <pngme/chunk.hh>
#include <pngme/parse_options.hh>
#include <pngme/export_pngme.h>

namespace pngme {

    class reader;

    /**
     * @class chunk_iterator
     * @brief Iterator over the chunks of a PNG stream
     *
     * Verifies the 8-byte PNG signature on construction, then decodes one
     * chunk at a time in file order. Iteration continues to the end of the
     * stream, so chunks placed after IEND are visited as well. The stream is
     * only read forward.
     */
    class PNGME_EXPORT chunk_iterator {
    public:
        /**
         * @brief Factory method with default parse options
         * @param stream Input stream positioned at the PNG signature
         * @return Unique pointer to an iterator positioned on the first chunk
         * @throws signature_error if the stream does not start with the PNG signature
         */
        static std::unique_ptr<chunk_iterator> get_iterator(std::istream& stream);

        /**
         * @brief Factory method with custom parse options
         * @param stream Input stream positioned at the PNG signature
         * @param options Parse options for strictness, limits and warnings
         * @return Unique pointer to an iterator positioned on the first chunk
         */
        static std::unique_ptr<chunk_iterator> get_iterator(std::istream& stream, const parse_options& options);

        /**
         * @struct chunk_info
         * @brief Information about the current chunk being iterated
         */
        struct chunk_info {
            chunk value;                    ///< The decoded chunk
            std::uint64_t file_offset = 0;  ///< Offset of the length field from the stream start
            std::size_t index = 0;          ///< Position among the chunks delivered so far
        };

        chunk_iterator(std::istream& stream, const parse_options& options);
        ~chunk_iterator();

        chunk_iterator(const chunk_iterator&) = delete;
        chunk_iterator& operator=(const chunk_iterator&) = delete;

        /**
         * @brief Get current chunk information
         * @return Reference to current chunk information; only valid while has_next()
         */
        const chunk_info& current() const { return *m_current; }
        chunk_info& current() { return *m_current; }

        /**
         * @brief Advance to the next chunk
         */
        void next();

        bool has_next() const { return m_current.has_value(); }
        bool at_end() const { return !m_current.has_value(); }

    private:
        void read_signature();
        bool read_next_chunk();
        void warn(std::uint64_t offset, std::string_view category, const std::string& message) const;

        std::unique_ptr<reader> m_reader;
        parse_options m_options;
        std::optional<chunk_info> m_current;
        std::size_t m_index;
    };

} // namespace pngme
