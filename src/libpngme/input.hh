//
// Created by igor on 12/08/2025.
//

#pragma once

#include <iosfwd>
#include <cstddef>
#include <cstdint>

#include <pngme/exceptions.hh>

namespace pngme {

    // Forward-only reader over an input stream - throws on stream failure.
    // Positions are counted from where the stream stood at construction, so
    // non-seekable streams (pipes, stdin) work as well.
    class reader {
        public:
            explicit reader(std::istream& is);

            reader(const reader&) = delete;
            reader& operator = (const reader&) = delete;

            // Read up to size bytes; a short count means end of stream
            std::size_t read(void* dst, std::size_t size);

            // Discard up to size bytes; returns how many were discarded
            std::uint64_t skip(std::uint64_t size);

            [[nodiscard]] std::uint64_t tell() const { return m_position; }

        private:
            std::istream& m_stream;
            std::uint64_t m_position;
    };
}
