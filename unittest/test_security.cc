//
// Created by igor on 14/08/2025.
//
// Hardening tests for hostile chunk streams

#include <doctest/doctest.h>
#include <sstream>
#include <string>

#include <pngme/parser.hh>
#include <pngme/chunk_iterator.hh>
#include <pngme/exceptions.hh>
#include <pngme/parse_options.hh>

#include "test_utils.hh"

using namespace pngme;

TEST_CASE("Security - max chunk size enforcement") {
    SUBCASE("chunk exceeding max size in strict mode") {
        auto data = png_bytes({raw_chunk(0x7FFFFFFFu, "IDAT", "", 0)});
        auto stream = as_stream(data);

        parse_options opts;
        opts.strict = true;
        opts.max_chunk_size = 1024 * 1024;

        CHECK_THROWS_AS(chunk_iterator::get_iterator(stream, opts), parse_error);
    }

    SUBCASE("chunk exceeding max size in lenient mode is skipped") {
        std::string big(2048, 'b');
        auto data = png_bytes({make_chunk("IHDR", "0123456789abc").to_bytes(),
                               make_chunk("IDAT", big).to_bytes(),
                               make_chunk("IEND", "").to_bytes()});
        auto stream = as_stream(data);

        parse_options opts;
        opts.strict = false;
        opts.max_chunk_size = 1024;

        std::vector<std::string> types;
        for_each_chunk(stream, [&types](chunk_iterator::chunk_info& info) {
            types.push_back(info.value.type().to_string());
        }, opts);

        REQUIRE(types.size() == 2);
        CHECK(types[0] == "IHDR");
        CHECK(types[1] == "IEND");
    }

    SUBCASE("limit is inclusive") {
        std::string exact(1024, 'e');
        auto data = png_bytes({make_chunk("IDAT", exact).to_bytes()});
        auto stream = as_stream(data);

        parse_options opts;
        opts.max_chunk_size = 1024;

        auto it = chunk_iterator::get_iterator(stream, opts);
        REQUIRE(it->has_next());
        CHECK(it->current().value.length() == 1024);
    }
}

TEST_CASE("Security - forged lengths") {
    SUBCASE("declared length far beyond the stream") {
        auto data = png_bytes({raw_chunk(0x7FFFFFF0u, "IDAT", "tiny", 0)});
        auto stream = as_stream(data);
        try {
            (void)chunk_iterator::get_iterator(stream);
            FAIL("Should have thrown exception");
        } catch (const truncated_buffer_error& e) {
            CHECK(std::string(e.field()) == "data");
            CHECK(e.available() == 8);
        }
    }

    SUBCASE("declared length beyond the format limit") {
        auto data = png_bytes({raw_chunk(0xFFFFFFFFu, "IDAT", "", 0)});
        auto stream = as_stream(data);
        CHECK_THROWS_AS(chunk_iterator::get_iterator(stream), length_too_large_error);
    }

    SUBCASE("lenient mode stops at a length beyond the format limit") {
        auto data = png_bytes({make_chunk("IHDR", "0123456789abc").to_bytes(),
                               raw_chunk(0x80000000u, "IDAT", "", 0),
                               make_chunk("IEND", "").to_bytes()});
        auto stream = as_stream(data);

        parse_options opts;
        opts.strict = false;

        std::size_t count = 0;
        for_each_chunk(stream, [&count](chunk_iterator::chunk_info&) { ++count; }, opts);
        CHECK(count == 1);
    }
}

TEST_CASE("Security - garbage input") {
    SUBCASE("random bytes after the signature") {
        std::vector<std::byte> noise;
        std::uint32_t state = 0x12345678u;
        for (int i = 0; i < 4096; ++i) {
            state = state * 1103515245u + 12345u;
            noise.push_back(std::byte(state >> 24));
        }
        auto data = png_bytes({noise});

        SUBCASE("strict mode reports an error") {
            auto stream = as_stream(data);
            CHECK_THROWS_AS(
                for_each_chunk(stream, [](chunk_iterator::chunk_info&) {}),
                pngme_error);
        }

        SUBCASE("lenient mode terminates") {
            auto stream = as_stream(data);
            parse_options opts;
            opts.strict = false;
            opts.max_chunk_size = 1024;
            std::size_t count = 0;
            CHECK_NOTHROW(for_each_chunk(stream, [&count](chunk_iterator::chunk_info&) { ++count; }, opts));
        }
    }

    SUBCASE("every truncation of a valid document") {
        auto chunks = minimal_chunks();
        auto full = png_bytes({chunks[0].to_bytes(), chunks[1].to_bytes(), chunks[2].to_bytes()});

        for (std::size_t n = 8; n < full.size(); ++n) {
            std::vector<std::byte> cut(full.begin(), full.begin() + static_cast<std::ptrdiff_t>(n));
            INFO("truncated to " << n << " bytes");

            bool complete = (n == 8 || n == 8 + 25 || n == 8 + 50);
            auto strict_stream = as_stream(cut);
            if (complete) {
                CHECK_NOTHROW(png_file::read(strict_stream));
            } else {
                CHECK_THROWS_AS(png_file::read(strict_stream), truncated_buffer_error);
            }

            parse_options opts;
            opts.strict = false;
            auto lenient_stream = as_stream(cut);
            CHECK_NOTHROW(png_file::read(lenient_stream, opts));
        }
    }
}
