//
// Created by igor on 10/08/2025.
//

#include <pngme/chunk_type.hh>
#include <pngme/exceptions.hh>
#include <cstring>

namespace pngme {

    chunk_type::chunk_type(const bytes_type& bytes)
        : m_bytes(bytes) {
        for (std::uint8_t b : m_bytes) {
            if (!is_valid_byte(b)) {
                throw invalid_byte_error(b);
            }
        }
    }

    chunk_type chunk_type::from_string(std::string_view str) {
        if (str.size() != size) {
            throw invalid_length_error(str.size());
        }
        return from_bytes(str.data());
    }

    chunk_type chunk_type::from_bytes(const void* data) {
        bytes_type bytes;
        std::memcpy(bytes.data(), data, size);
        return chunk_type(bytes);
    }

    void chunk_type::to_bytes(void* dest) const noexcept {
        std::memcpy(dest, m_bytes.data(), size);
    }

} // namespace pngme
