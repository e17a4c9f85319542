/**
 * @file simple_example.cpp
 * @brief Simple example demonstrating basic libpngme usage
 *
 * This is a minimal example showing how to walk the chunks of a PNG file
 * and print information about each of them. Damaged chunks are reported
 * and skipped instead of aborting the listing.
 */

#include <pngme/parser.hh>
#include <iostream>
#include <fstream>

int main(int argc, char* argv[]) {
    if (argc != 2) {
        std::cout << "Usage: " << argv[0] << " <file.png>\n";
        std::cout << "\n";
        std::cout << "Simple example that lists all chunks in a PNG file.\n";
        return 1;
    }

    // Open the file
    std::ifstream file(argv[1], std::ios::binary);
    if (!file) {
        std::cerr << "Error: Cannot open file '" << argv[1] << "'\n";
        return 1;
    }

    std::cout << "Parsing: " << argv[1] << "\n";
    std::cout << "====================\n\n";

    pngme::parse_options options;
    options.strict = false;
    options.on_warning = [](std::uint64_t offset, std::string_view category, std::string_view message) {
        std::cerr << "Warning [" << category << "] at offset " << offset << ": " << message << "\n";
    };

    try {
        pngme::for_each_chunk(file, [](const auto& info) {
            const auto& type = info.value.type();
            std::cout << "Chunk: " << type.to_string()
                      << " (" << info.value.length() << " bytes) at offset " << info.file_offset << "\n";
            std::cout << "  " << (type.is_critical() ? "critical" : "ancillary")
                      << ", " << (type.is_public() ? "public" : "private")
                      << ", " << (type.is_safe_to_copy() ? "safe to copy" : "unsafe to copy")
                      << (type.is_valid() ? "" : ", RESERVED BIT SET") << "\n";
        }, options);

        std::cout << "\nParsing completed successfully!\n";

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
