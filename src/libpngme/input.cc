//
// Created by igor on 12/08/2025.
//

#include <istream>
#include <algorithm>
#include <array>

#include "input.hh"

namespace pngme {

    reader::reader(std::istream& is)
        : m_stream(is)
        , m_position(0) {}

    std::size_t reader::read(void* dst, std::size_t size) {
        THROW_IO_UNLESS(dst, "Null buffer in read");

        if (size == 0) {
            return 0;
        }

        // A previous short read left eof set; nothing more to deliver
        if (m_stream.eof()) {
            return 0;
        }
        THROW_IO_UNLESS(m_stream.good(), "Stream in bad state");

        m_stream.read(static_cast<char*>(dst), static_cast<std::streamsize>(size));
        std::size_t bytes_read = static_cast<std::size_t>(m_stream.gcount());

        THROW_IO_IF(m_stream.bad(), "Stream read failed at offset ", m_position);
        m_position += bytes_read;
        return bytes_read;
    }

    std::uint64_t reader::skip(std::uint64_t size) {
        std::uint64_t skipped = 0;
        std::array<char, 4096> scratch;

        while (skipped < size) {
            auto want = static_cast<std::size_t>(std::min<std::uint64_t>(scratch.size(), size - skipped));
            std::size_t got = read(scratch.data(), want);
            skipped += got;
            if (got < want) {
                break;
            }
        }
        return skipped;
    }
}
