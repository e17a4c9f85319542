#include <doctest/doctest.h>
#include <pngme/utf8.hh>

#include <string>

#include "test_utils.hh"

using namespace pngme;

namespace {
    std::optional<utf8_error> check(const std::string& s) {
        auto bytes = to_bytes(s);
        return validate_utf8(bytes);
    }
}

TEST_SUITE("UTF8") {
    TEST_CASE("valid input") {
        CHECK_FALSE(check("").has_value());
        CHECK_FALSE(check("plain ascii").has_value());
        CHECK_FALSE(check("caf\xc3\xa9").has_value());                 // 2-byte
        CHECK_FALSE(check("\xe2\x82\xac").has_value());                // U+20AC
        CHECK_FALSE(check("\xf0\x9f\xa6\x80").has_value());            // U+1F980
        CHECK_FALSE(check("\xf4\x8f\xbf\xbf").has_value());            // U+10FFFF
        CHECK_FALSE(check(std::string("a\0b", 3)).has_value());
        CHECK(is_valid_utf8(to_bytes("abc")));
    }

    TEST_CASE("invalid input") {
        SUBCASE("stray continuation byte") {
            auto e = check("ab\x80");
            REQUIRE(e.has_value());
            CHECK(e->offset == 2);
            CHECK(e->reason == "unexpected continuation byte");
        }

        SUBCASE("invalid lead byte") {
            auto e = check("x\xff");
            REQUIRE(e.has_value());
            CHECK(e->offset == 1);
            CHECK(e->reason == "invalid lead byte");
        }

        SUBCASE("truncated sequence") {
            auto e = check("abc\xe2\x82");
            REQUIRE(e.has_value());
            CHECK(e->offset == 3);
            CHECK(e->reason == "truncated sequence");
        }

        SUBCASE("bad continuation") {
            auto e = check("\xc3(");
            REQUIRE(e.has_value());
            CHECK(e->offset == 0);
            CHECK(e->reason == "invalid continuation byte");
        }

        SUBCASE("overlong encoding") {
            auto e = check("\xc0\xaf");
            REQUIRE(e.has_value());
            CHECK(e->reason == "overlong encoding");

            auto e3 = check("\xe0\x80\xaf");
            REQUIRE(e3.has_value());
            CHECK(e3->reason == "overlong encoding");
        }

        SUBCASE("beyond U+10FFFF") {
            auto e = check("\xf4\x90\x80\x80");
            REQUIRE(e.has_value());
            CHECK(e->reason == "code point out of range");
        }

        SUBCASE("surrogate") {
            auto e = check("ok\xed\xa0\x80");
            REQUIRE(e.has_value());
            CHECK(e->offset == 2);
            CHECK(e->reason == "surrogate code point");
        }

        CHECK_FALSE(is_valid_utf8(to_bytes("\xfe")));
    }
}
