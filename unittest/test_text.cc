//
// Text views of payloads and type codes
//

#include <doctest/doctest.h>
#include <pngchunk/chunk.hh>
#include <pngchunk/exceptions.hh>

#include <string>
#include <vector>

#include "test_utils.hh"

using namespace pngchunk;

namespace {
    chunk text_chunk(std::string_view bytes) {
        return chunk("teXt"_ctype, to_byte_vector(bytes));
    }

    std::size_t invalid_offset(std::string_view bytes) {
        try {
            (void)text_chunk(bytes).payload_as_string();
        } catch (const invalid_utf8_error& e) {
            return e.offset();
        }
        FAIL("Should have thrown invalid_utf8_error");
        return 0;
    }
}

TEST_CASE("Payload as text") {
    SUBCASE("ASCII") {
        CHECK(text_chunk("hello").payload_as_string() == "hello");
    }

    SUBCASE("empty payload") {
        CHECK(text_chunk("").payload_as_string().empty());
    }

    SUBCASE("multi-byte sequences") {
        // é, €, 𝄞
        std::string text = "caf\xC3\xA9 \xE2\x82\xAC \xF0\x9D\x84\x9E";
        CHECK(text_chunk(text).payload_as_string() == text);
    }

    SUBCASE("embedded NUL is valid text") {
        std::string_view text("a\0b", 3);
        CHECK(text_chunk(text).payload_as_string().size() == 3);
    }

    SUBCASE("stray continuation byte") {
        CHECK(invalid_offset("ab\x80") == 2);
    }

    SUBCASE("truncated sequence") {
        CHECK(invalid_offset("abc\xE2\x82") == 3);
    }

    SUBCASE("overlong encodings") {
        CHECK(invalid_offset("\xC0\xAF") == 0);
        CHECK(invalid_offset("x\xE0\x80\xAF") == 1);
        CHECK(invalid_offset("\xF0\x80\x80\xAF") == 0);
    }

    SUBCASE("surrogates and out of range") {
        CHECK(invalid_offset("\xED\xA0\x80") == 0);
        CHECK(invalid_offset("\xF4\x90\x80\x80") == 0);
        CHECK(invalid_offset("\xFF") == 0);
    }

    SUBCASE("bad continuation inside a sequence") {
        CHECK(invalid_offset("\xE2\x28\xA1") == 0);
    }

    SUBCASE("error is an encoding_error") {
        CHECK_THROWS_AS((void)text_chunk("\xFF").payload_as_string(), encoding_error);
        CHECK_THROWS_AS((void)text_chunk("\xFF").payload_as_string(), chunk_error);
    }
}

TEST_CASE("Type code as text") {
    SUBCASE("letters") {
        auto c = chunk::parse(secret_chunk_bytes());
        CHECK(c.type().to_string() == "RuSt");
    }

    SUBCASE("parsed binary type renders only through operator<<") {
        unsigned char raw[4] = {0xC3, 0xA9, 0xFF, 'x'};
        auto t = chunk_type::from_bytes(raw);
        try {
            (void)t.to_string();
            FAIL("Should have thrown exception");
        } catch (const invalid_utf8_error& e) {
            CHECK(e.offset() == 2);
        }
    }

    SUBCASE("valid UTF-8 that is not letters") {
        unsigned char raw[4] = {0xC3, 0xA9, '1', '2'};
        CHECK(chunk_type::from_bytes(raw).to_string() == "\xC3\xA9" "12");
    }
}
