//
// Test that error messages carry enough detail to locate the problem
//

#include <doctest/doctest.h>
#include <sstream>
#include <vector>
#include <string>

#include <pngme/chunk_iterator.hh>
#include <pngme/exceptions.hh>
#include <pngme/parse_options.hh>

#include "test_utils.hh"

using namespace pngme;

namespace {
    template<typename E, typename Func>
    std::string message_of(Func func) {
        try {
            func();
        } catch (const E& e) {
            return e.what();
        }
        return {};
    }

    bool contains(const std::string& haystack, std::string_view needle) {
        return haystack.find(needle) != std::string::npos;
    }
}

TEST_CASE("Error messages") {
    SUBCASE("chunk size limit exceeded - shows chunk details") {
        auto data = png_bytes({make_chunk("IHDR", "0123456789abc").to_bytes(),
                               raw_chunk(10000000, "IDAT", "", 0)});
        auto stream = as_stream(data);

        parse_options opts;
        opts.strict = true;
        opts.max_chunk_size = 1024;

        try {
            auto it = chunk_iterator::get_iterator(stream, opts);
            it->next();
            FAIL("Should have thrown exception");
        } catch (const parse_error& e) {
            std::string msg = e.what();
            INFO("Error message: " << msg);
            CHECK(contains(msg, "IDAT"));
            CHECK(contains(msg, "offset 33"));
            CHECK(contains(msg, "10000000"));
            CHECK(contains(msg, "1024"));
        }
    }

    SUBCASE("invalid type byte") {
        auto msg = message_of<invalid_byte_error>([] { (void)chunk_type::from_string("Ru1t"); });
        CHECK(msg == "Invalid chunk type byte: 49 (not an ASCII letter)");
    }

    SUBCASE("invalid type length") {
        auto msg = message_of<invalid_length_error>([] { (void)chunk_type::from_string("RuStR"); });
        CHECK(msg == "Invalid chunk type length: 5 (expected 4)");
    }

    SUBCASE("checksum mismatch shows both values") {
        auto bytes = raw_chunk(42, "RuSt", "This is where your secret message will be!", 2882656333u);
        auto msg = message_of<checksum_mismatch_error>([&bytes] { (void)chunk::from_bytes(bytes); });
        CHECK(msg == "Chunk CRC mismatch: stored 2882656333, computed 2882656334");
    }

    SUBCASE("length too large") {
        auto bytes = raw_chunk(0x80000000u, "RuSt", "", 0);
        auto msg = message_of<length_too_large_error>([&bytes] { (void)chunk::from_bytes(bytes); });
        CHECK(msg == "Chunk length 2147483648 exceeds maximum of 2147483647 bytes");
    }

    SUBCASE("truncated buffer names the field") {
        auto bytes = to_bytes(std::string("\x00\x00\x00\x10RuStabc", 11));
        auto msg = message_of<truncated_buffer_error>([&bytes] { (void)chunk::from_bytes(bytes); });
        CHECK(msg == "Truncated chunk: data field needs 16 bytes, only 3 available");
    }

    SUBCASE("data that is not text") {
        auto c = make_chunk("teXt", std::string("ab\xff", 3));
        auto msg = message_of<not_utf8_error>([&c] { (void)c.data_as_string(); });
        CHECK(msg == "Chunk data is not valid UTF-8: invalid lead byte at offset 2");
    }

    SUBCASE("bad signature") {
        auto stream = as_stream(to_bytes("not a png file"));
        auto msg = message_of<signature_error>([&stream] { (void)chunk_iterator::get_iterator(stream); });
        CHECK(msg == "Stream does not start with the PNG signature");
    }
}
