/**
 * @file pngme.cpp
 * @brief Hide and recover text messages in PNG chunks
 *
 * Usage:
 *   pngme encode <file.png> <type> <message> [output.png]
 *   pngme decode <file.png> <type>
 *   pngme remove <file.png> <type>
 *   pngme print  <file.png>
 *
 * The message is stored as the data of a chunk with the given type code,
 * appended at the end of the file. Pick an ancillary, private type (first
 * two letters lowercase) so that image viewers ignore it.
 */

#include <pngme/png_file.hh>
#include <pngme/exceptions.hh>
#include <algorithm>
#include <iostream>
#include <fstream>
#include <string>
#include <vector>

namespace {

    void print_usage(const char* prog) {
        std::cout << "Usage:\n";
        std::cout << "  " << prog << " encode <file.png> <type> <message> [output.png]\n";
        std::cout << "  " << prog << " decode <file.png> <type>\n";
        std::cout << "  " << prog << " remove <file.png> <type>\n";
        std::cout << "  " << prog << " print  <file.png>\n";
    }

    pngme::png_file load(const std::string& path) {
        std::ifstream file(path, std::ios::binary);
        THROW_IO_UNLESS(file, "Cannot open file '", path, "'");
        return pngme::png_file::read(file);
    }

    void save(const pngme::png_file& png, const std::string& path) {
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        THROW_IO_UNLESS(file, "Cannot create file '", path, "'");
        png.write(file);
    }

    int encode(const std::string& path, const std::string& type, const std::string& message,
               const std::string& output) {
        auto png = load(path);

        std::vector<std::byte> data(message.size());
        std::transform(message.begin(), message.end(), data.begin(),
                       [](char c) { return static_cast<std::byte>(c); });
        png.append_chunk(pngme::chunk(pngme::chunk_type::from_string(type), std::move(data)));

        save(png, output);
        std::cout << "Message stored in chunk '" << type << "' of " << output << "\n";
        return 0;
    }

    int decode(const std::string& path, const std::string& type) {
        auto png = load(path);
        const pngme::chunk* c = png.find_chunk(pngme::chunk_type::from_string(type));
        if (!c) {
            std::cerr << "No chunk of type '" << type << "' in " << path << "\n";
            return 1;
        }
        std::cout << c->data_as_string() << "\n";
        return 0;
    }

    int remove_chunk(const std::string& path, const std::string& type) {
        auto png = load(path);
        auto removed = png.remove_first_chunk(pngme::chunk_type::from_string(type));
        save(png, path);
        std::cout << "Removed " << removed << "\n";
        return 0;
    }

    int print(const std::string& path) {
        auto png = load(path);
        std::cout << "File: " << path << "\n";
        for (const auto& c : png.chunks()) {
            const auto& type = c.type();
            std::cout << c << "  ["
                      << (type.is_critical() ? "critical" : "ancillary") << ", "
                      << (type.is_public() ? "public" : "private") << ", "
                      << (type.is_safe_to_copy() ? "safe-to-copy" : "unsafe-to-copy")
                      << (type.is_valid() ? "" : ", reserved bit set") << "]\n";
        }
        return 0;
    }
}

int main(int argc, char* argv[]) {
    if (argc < 3) {
        print_usage(argv[0]);
        return 1;
    }

    const std::string command = argv[1];

    try {
        if (command == "encode" && (argc == 5 || argc == 6)) {
            return encode(argv[2], argv[3], argv[4], argc == 6 ? argv[5] : argv[2]);
        }
        if (command == "decode" && argc == 4) {
            return decode(argv[2], argv[3]);
        }
        if (command == "remove" && argc == 4) {
            return remove_chunk(argv[2], argv[3]);
        }
        if (command == "print" && argc == 3) {
            return print(argv[2]);
        }
    } catch (const pngme::pngme_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    print_usage(argv[0]);
    return 1;
}
