//
// Construction, parsing and serialization of chunk records
//

#include <doctest/doctest.h>
#include <pngchunk/chunk.hh>
#include <pngchunk/crc.hh>
#include <pngchunk/exceptions.hh>

#include <sstream>
#include <string>
#include <vector>

#include "test_utils.hh"

using namespace pngchunk;

TEST_SUITE("CHUNK") {
    TEST_CASE("chunk construction") {
        SUBCASE("from type and payload") {
            chunk c(chunk_type::from_text("RuSt"), to_byte_vector(secret_message));
            CHECK(c.length() == 42);
            CHECK(c.crc() == secret_crc);
            CHECK(c.type() == "RuSt"_ctype);
            CHECK(c.payload() == to_byte_vector(secret_message));
        }

        SUBCASE("from text payload") {
            chunk c("RuSt"_ctype, secret_message);
            CHECK(c.length() == 42);
            CHECK(c.crc() == secret_crc);
            CHECK(c.payload_as_string() == secret_message);
        }

        SUBCASE("empty payload") {
            chunk c("IEND"_ctype, std::vector<std::byte>{});
            CHECK(c.length() == 0);
            CHECK(c.payload().empty());
            CHECK(c.crc() == 0xAE426082u);
            CHECK(c.wire_size() == chunk::overhead);
        }

        SUBCASE("crc covers type and payload") {
            auto payload = to_byte_vector("hidden");
            chunk c("ruSt"_ctype, payload);
            CHECK(c.crc() == chunk_crc("ruSt"_ctype, payload.data(), payload.size()));
            CHECK(c.crc() != chunk("RuSt"_ctype, payload).crc());
        }

        SUBCASE("type with reserved bit is accepted") {
            chunk c(chunk_type::from_text("Rust"), std::string_view("x"));
            CHECK_FALSE(c.type().is_valid());
            CHECK(c.length() == 1);
        }
    }

    TEST_CASE("chunk parsing") {
        SUBCASE("reference chunk") {
            auto data = secret_chunk_bytes();
            REQUIRE(data.size() == 54);

            auto c = chunk::parse(data);
            CHECK(c.length() == 42);
            CHECK(c.type().to_string() == "RuSt");
            CHECK(c.payload_as_string() == secret_message);
            CHECK(c.crc() == 2882656334u);
            CHECK(c.wire_size() == 54);
        }

        SUBCASE("reference chunk with wrong crc") {
            auto data = secret_chunk_bytes(2882656333u);
            CHECK_THROWS_AS(chunk::parse(data), crc_mismatch_error);
        }

        SUBCASE("raw pointer overload") {
            auto data = secret_chunk_bytes();
            auto c = chunk::parse(data.data(), data.size());
            CHECK(c.length() == 42);
        }

        SUBCASE("zero-length payload") {
            auto data = make_chunk_bytes(0, "IEND", "", 0xAE426082u);
            REQUIRE(data.size() == 12);
            auto c = chunk::parse(data);
            CHECK(c.length() == 0);
            CHECK(c.type() == "IEND"_ctype);
            CHECK(c.payload().empty());
        }

        SUBCASE("trailing bytes are ignored") {
            auto data = secret_chunk_bytes();
            auto next = make_chunk_bytes(0, "IEND", "", 0xAE426082u);
            data.insert(data.end(), next.begin(), next.end());

            auto first = chunk::parse(data);
            CHECK(first.payload_as_string() == secret_message);

            // The caller walks a sequence of records using wire_size()
            auto offset = first.wire_size();
            auto second = chunk::parse(data.data() + offset, data.size() - offset);
            CHECK(second.type() == "IEND"_ctype);
            CHECK(offset + second.wire_size() == data.size());
        }

        SUBCASE("binary payload") {
            std::vector<std::byte> payload;
            for (int i = 0; i < 256; i++) {
                payload.push_back(static_cast<std::byte>(i));
            }
            chunk built("biNy"_ctype, payload);
            auto parsed = chunk::parse(built.serialize());
            CHECK(parsed.payload() == payload);
            CHECK(parsed.length() == 256);
        }
    }

    TEST_CASE("chunk serialization") {
        SUBCASE("matches the hand-assembled wire bytes") {
            chunk c("RuSt"_ctype, secret_message);
            CHECK(c.serialize() == secret_chunk_bytes());
        }

        SUBCASE("length and crc are big-endian") {
            chunk c("IEND"_ctype, std::vector<std::byte>{});
            auto bytes = c.serialize();
            REQUIRE(bytes.size() == 12);
            CHECK(std::to_integer<int>(bytes[0]) == 0);
            CHECK(std::to_integer<int>(bytes[3]) == 0);
            CHECK(std::to_integer<int>(bytes[4]) == 'I');
            CHECK(std::to_integer<int>(bytes[7]) == 'D');
            CHECK(std::to_integer<int>(bytes[8]) == 0xAE);
            CHECK(std::to_integer<int>(bytes[9]) == 0x42);
            CHECK(std::to_integer<int>(bytes[10]) == 0x60);
            CHECK(std::to_integer<int>(bytes[11]) == 0x82);
        }

        SUBCASE("serialize_to appends") {
            chunk a("RuSt"_ctype, secret_message);
            chunk b("IEND"_ctype, std::vector<std::byte>{});

            std::vector<std::byte> out;
            a.serialize_to(out);
            b.serialize_to(out);
            CHECK(out.size() == a.wire_size() + b.wire_size());
            CHECK(chunk::parse(out) == a);
            CHECK(chunk::parse(out.data() + a.wire_size(), b.wire_size()) == b);
        }

        SUBCASE("round trip") {
            const std::vector<std::pair<std::string_view, std::string_view>> samples = {
                {"RuSt", secret_message},
                {"tEXt", std::string_view("Comment\0hidden", 14)},
                {"IEND", ""},
                {"Rust", "reserved bit set"},
                {"prIv", "\x01\x02\x03\xff"},
            };

            for (const auto& [type_text, payload_text] : samples) {
                CAPTURE(type_text);
                auto type = chunk_type::from_text(type_text);
                auto payload = to_byte_vector(payload_text);

                auto parsed = chunk::parse(chunk(type, payload).serialize());
                CHECK(parsed.length() == payload.size());
                CHECK(parsed.type() == type);
                CHECK(parsed.payload() == payload);
                CHECK(parsed.crc() == chunk_crc(type, payload.data(), payload.size()));
            }
        }
    }

    TEST_CASE("chunk stream output") {
        chunk c("RuSt"_ctype, secret_message);
        std::ostringstream oss;
        oss << c;
        CHECK(oss.str() == "chunk 'RuSt' length=42 crc=0xabd1d84e");

        // Formatting state is restored
        oss.str("");
        oss << c << " " << 10;
        CHECK(oss.str() == "chunk 'RuSt' length=42 crc=0xabd1d84e 10");
    }
}
