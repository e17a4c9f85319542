//
// Created by igor on 13/08/2025.
//

#include <pngme/chunk_iterator.hh>
#include <pngme/endian.hh>
#include <pngme/exceptions.hh>
#include <pngme/png_file.hh>
#include "input.hh"

#include <algorithm>
#include <array>
#include <vector>

namespace pngme {

    namespace {
        constexpr std::size_t read_step = 64 * 1024;
    }

    std::unique_ptr<chunk_iterator> chunk_iterator::get_iterator(std::istream& stream) {
        // Use default options
        parse_options default_opts;
        return get_iterator(stream, default_opts);
    }

    std::unique_ptr<chunk_iterator> chunk_iterator::get_iterator(std::istream& stream, const parse_options& options) {
        return std::make_unique<chunk_iterator>(stream, options);
    }

    chunk_iterator::chunk_iterator(std::istream& stream, const parse_options& options)
        : m_reader(std::make_unique<reader>(stream))
        , m_options(options)
        , m_index(0) {
        read_signature();

        // Read the first chunk
        read_next_chunk();
    }

    chunk_iterator::~chunk_iterator() = default;

    void chunk_iterator::next() {
        if (!m_current) {
            return;
        }
        read_next_chunk();
    }

    void chunk_iterator::read_signature() {
        std::array<std::uint8_t, 8> magic{};
        std::size_t got = m_reader->read(magic.data(), magic.size());
        if (got != magic.size()) {
            throw signature_error(build_error_msg("Stream too short for a PNG signature: got ", got,
                                                  " of 8 bytes"));
        }
        if (magic != png_file::signature) {
            throw signature_error("Stream does not start with the PNG signature");
        }
    }

    bool chunk_iterator::read_next_chunk() {
        m_current.reset();

        for (;;) {
            const std::uint64_t start_pos = m_reader->tell();

            // length + type
            std::array<std::byte, 8> header;
            std::size_t got = m_reader->read(header.data(), header.size());
            if (got == 0) {
                return false;  // Clean end of stream
            }
            if (got < header.size()) {
                const char* field = got < 4 ? "length" : "type";
                std::size_t needed = got < 4 ? 4 : chunk_type::size;
                std::size_t available = got < 4 ? got : got - 4;
                if (m_options.strict) {
                    throw truncated_buffer_error(field, needed, available);
                }
                warn(start_pos, "truncated",
                     build_error_msg("Stream ends inside chunk header (", got, " of 8 bytes)"));
                return false;
            }

            const std::uint32_t length = load_be32(header.data());

            // Format limit first, then the configured one
            if (length > chunk::max_length) {
                if (m_options.strict) {
                    throw length_too_large_error(length);
                }
                warn(start_pos, "size_limit",
                     build_error_msg("Chunk length ", length, " exceeds format maximum, stopping"));
                return false;
            }

            std::optional<chunk_type> type;
            try {
                type = chunk_type::from_bytes(header.data() + 4);
            } catch (const chunk_type_error& e) {
                if (m_options.strict) {
                    throw;
                }
                warn(start_pos, "invalid_type", build_error_msg(e.what(), ", skipping chunk"));
                if (m_reader->skip(std::uint64_t(length) + 4) != std::uint64_t(length) + 4) {
                    warn(start_pos, "truncated", "Stream ends inside skipped chunk");
                    return false;
                }
                continue;
            }

            if (length > m_options.max_chunk_size) {
                if (m_options.strict) {
                    THROW_PARSE("Chunk ", *type, " at offset ", start_pos, " has length ", length,
                                " bytes, which exceeds maximum allowed size of ",
                                m_options.max_chunk_size, " bytes");
                }
                warn(start_pos, "size_limit",
                     build_error_msg("Chunk ", *type, " length ", length, " exceeds maximum ",
                                     m_options.max_chunk_size, ", skipping chunk"));
                if (m_reader->skip(std::uint64_t(length) + 4) != std::uint64_t(length) + 4) {
                    warn(start_pos, "truncated", "Stream ends inside skipped chunk");
                    return false;
                }
                continue;
            }

            // data + crc, in bounded steps
            std::vector<std::byte> buffer(header.begin(), header.end());
            const std::size_t body = std::size_t(length) + 4;
            got = 0;
            while (got < body) {
                const std::size_t step = std::min<std::size_t>(body - got, read_step);
                const std::size_t old_size = buffer.size();
                buffer.resize(old_size + step);
                const std::size_t n = m_reader->read(buffer.data() + old_size, step);
                got += n;
                if (n < step) {
                    buffer.resize(old_size + n);
                    break;
                }
            }
            if (got < body) {
                if (m_options.strict) {
                    if (got < length) {
                        throw truncated_buffer_error("data", length, got);
                    }
                    throw truncated_buffer_error("crc", 4, got - length);
                }
                warn(start_pos, "truncated",
                     build_error_msg("Stream ends inside chunk ", *type, " (", got, " of ", body,
                                     " bytes after header)"));
                return false;
            }

            try {
                m_current = chunk_info{chunk::from_bytes(buffer), start_pos, m_index};
            } catch (const checksum_mismatch_error& e) {
                if (m_options.strict) {
                    throw;
                }
                warn(start_pos, "crc_mismatch",
                     build_error_msg("Chunk ", *type, ": ", e.what(), ", skipping chunk"));
                continue;
            }

            if (!type->is_reserved_bit_valid()) {
                warn(start_pos, "reserved_bit",
                     build_error_msg("Chunk ", *type, " has the reserved bit set"));
            }

            ++m_index;
            return true;
        }
    }

    void chunk_iterator::warn(std::uint64_t offset, std::string_view category, const std::string& message) const {
        if (m_options.on_warning) {
            m_options.on_warning(offset, category, message);
        }
    }

} // namespace pngme
