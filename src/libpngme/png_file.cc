//
// Created by igor on 22/08/2025.
//

#include <pngme/png_file.hh>
#include <pngme/chunk_iterator.hh>
#include <pngme/exceptions.hh>

#include <algorithm>
#include <ostream>
#include <sstream>

namespace pngme {

    png_file::png_file(std::vector<chunk> chunks)
        : m_chunks(std::move(chunks)) {
    }

    png_file png_file::from_bytes(std::span<const std::byte> bytes, const parse_options& options) {
        std::istringstream stream(std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size()));
        return read(stream, options);
    }

    png_file png_file::read(std::istream& stream, const parse_options& options) {
        png_file png;
        auto it = chunk_iterator::get_iterator(stream, options);
        while (it->has_next()) {
            png.m_chunks.push_back(std::move(it->current().value));
            it->next();
        }
        return png;
    }

    void png_file::append_chunk(chunk c) {
        m_chunks.push_back(std::move(c));
    }

    chunk png_file::remove_first_chunk(const chunk_type& type) {
        auto it = std::find_if(m_chunks.begin(), m_chunks.end(),
                               [&type](const chunk& c) { return c.type() == type; });
        if (it == m_chunks.end()) {
            throw chunk_not_found_error(type);
        }
        chunk removed = std::move(*it);
        m_chunks.erase(it);
        return removed;
    }

    const chunk* png_file::find_chunk(const chunk_type& type) const {
        auto it = std::find_if(m_chunks.begin(), m_chunks.end(),
                               [&type](const chunk& c) { return c.type() == type; });
        return it == m_chunks.end() ? nullptr : &*it;
    }

    std::vector<std::byte> png_file::to_bytes() const {
        std::size_t total = signature.size();
        for (const auto& c : m_chunks) {
            total += c.encoded_size();
        }

        std::vector<std::byte> out;
        out.reserve(total);
        for (auto b : signature) {
            out.push_back(std::byte{b});
        }
        for (const auto& c : m_chunks) {
            auto bytes = c.to_bytes();
            out.insert(out.end(), bytes.begin(), bytes.end());
        }
        return out;
    }

    void png_file::write(std::ostream& os) const {
        os.write(reinterpret_cast<const char*>(signature.data()), static_cast<std::streamsize>(signature.size()));
        THROW_IO_IF(!os, "Failed to write PNG signature");
        for (const auto& c : m_chunks) {
            c.write(os);
        }
    }

    std::string png_file::to_string() const {
        std::ostringstream oss;
        oss << *this;
        return oss.str();
    }

    std::ostream& operator<<(std::ostream& os, const png_file& png) {
        os << "PNG file, " << png.m_chunks.size() << " chunk(s)\n";
        for (const auto& c : png.m_chunks) {
            os << "  " << c << '\n';
        }
        return os;
    }

} // namespace pngme
