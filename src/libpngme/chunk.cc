//
// Created by igor on 14/08/2025.
//

#include <pngme/chunk.hh>
#include <pngme/crc.hh>
#include <pngme/endian.hh>
#include <pngme/exceptions.hh>
#include <pngme/utf8.hh>

#include <cstring>
#include <iomanip>
#include <ostream>
#include <sstream>

namespace pngme {

    chunk::chunk(chunk_type type, std::vector<std::byte> data)
        : m_length(0)
        , m_type(type)
        , m_data(std::move(data))
        , m_crc(0) {
        if (m_data.size() > max_length) {
            throw length_too_large_error(m_data.size());
        }
        m_length = static_cast<std::uint32_t>(m_data.size());
        m_crc = chunk_crc(m_type, m_data);
    }

    chunk::chunk(std::uint32_t length, chunk_type type, std::vector<std::byte> data, std::uint32_t crc)
        : m_length(length)
        , m_type(type)
        , m_data(std::move(data))
        , m_crc(crc) {
    }

    chunk chunk::from_bytes(std::span<const std::byte> buffer) {
        std::size_t pos = 0;

        auto require = [&](const char* field, std::size_t needed) {
            std::size_t available = buffer.size() - pos;
            if (available < needed) {
                throw truncated_buffer_error(field, needed, available);
            }
        };

        require("length", 4);
        std::uint32_t length = load_be32(buffer.data());
        pos += 4;

        // Checked before anything else is looked at
        if (length > max_length) {
            throw length_too_large_error(length);
        }

        require("type", chunk_type::size);
        chunk_type type = chunk_type::from_bytes(buffer.data() + pos);
        pos += chunk_type::size;

        require("data", length);
        auto payload = buffer.subspan(pos, length);
        pos += length;

        require("crc", 4);
        std::uint32_t supplied = load_be32(buffer.data() + pos);

        std::uint32_t expected = chunk_crc(type, payload);
        if (supplied != expected) {
            throw checksum_mismatch_error(supplied, expected);
        }

        return chunk(length, type, std::vector<std::byte>(payload.begin(), payload.end()), supplied);
    }

    std::string chunk::data_as_string() const {
        if (auto err = validate_utf8(m_data)) {
            throw not_utf8_error(*err);
        }
        return {reinterpret_cast<const char*>(m_data.data()), m_data.size()};
    }

    std::vector<std::byte> chunk::to_bytes() const {
        std::vector<std::byte> out(encoded_size());
        std::byte* p = out.data();

        store_be32(p, m_length);
        m_type.to_bytes(p + 4);
        if (!m_data.empty()) {
            std::memcpy(p + 8, m_data.data(), m_data.size());
        }
        store_be32(p + 8 + m_data.size(), m_crc);

        return out;
    }

    void chunk::write(std::ostream& os) const {
        auto bytes = to_bytes();
        os.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        THROW_IO_IF(!os, "Failed to write chunk ", m_type, " (", bytes.size(), " bytes)");
    }

    std::string chunk::to_string() const {
        std::ostringstream oss;
        oss << *this;
        return oss.str();
    }

    bool chunk::operator==(const chunk& o) const {
        return m_length == o.m_length && m_type == o.m_type && m_crc == o.m_crc && m_data == o.m_data;
    }

    std::ostream& operator<<(std::ostream& os, const chunk& c) {
        auto flags = os.flags();
        auto fill = os.fill();
        os << "chunk " << c.m_type << " length=" << std::dec << c.m_length
           << " crc=0x" << std::hex << std::setfill('0') << std::setw(8) << c.m_crc;
        os.flags(flags);
        os.fill(fill);
        return os;
    }

} // namespace pngme
