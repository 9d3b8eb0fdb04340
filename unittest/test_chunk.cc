#include <doctest/doctest.h>
#include <pngchunk/chunk.hh>
#include <pngchunk/exceptions.hh>

#include <sstream>
#include <string>
#include <vector>

#include "test_utils.hh"

using namespace pngchunk;

namespace {
    chunk testing_chunk() {
        return chunk::parse(golden::bytes());
    }
}

TEST_SUITE("CHUNK") {
    TEST_CASE("new chunk") {
        chunk c(type_code::from_text("RuSt"), golden::payload());
        CHECK(c.length() == golden::message.size());
        CHECK(c.length() == 42);
        CHECK(c.crc() == golden::crc);
        CHECK(c.type() == type_code::from_text("RuSt"));
        CHECK(c.data() == golden::payload());
    }

    TEST_CASE("new chunk does not validate the type code") {
        chunk c(type_code({'1', 0x00, 'x', 0xFF}), {1, 2, 3});
        CHECK(c.length() == 3);
        CHECK_FALSE(c.type().is_valid());
    }

    TEST_CASE("parsed golden chunk") {
        auto c = testing_chunk();

        SUBCASE("length") {
            CHECK(c.length() == golden::message.size());
            CHECK(c.length() == c.data().size());
        }

        SUBCASE("type") {
            CHECK(c.type().to_string() == "RuSt");
            CHECK(c.type().bytes() == std::array<std::uint8_t, 4>{82, 117, 83, 116});
        }

        SUBCASE("data as string") {
            CHECK(c.data_as_string() == golden::message);
        }

        SUBCASE("crc") {
            CHECK(c.crc() == golden::crc);
        }
    }

    TEST_CASE("serialization") {
        SUBCASE("golden bytes") {
            chunk c(type_code::from_text("RuSt"), golden::payload());
            CHECK(c.to_bytes() == golden::bytes());
        }

        SUBCASE("layout") {
            chunk c(type_code::from_text("RuSt"), golden::payload());
            auto bytes = c.to_bytes();
            REQUIRE(bytes.size() == chunk::min_size + golden::message.size());
            CHECK(bytes[0] == 0);
            CHECK(bytes[1] == 0);
            CHECK(bytes[2] == 0);
            CHECK(bytes[3] == 42);
            CHECK(bytes[4] == 'R');
            CHECK(bytes[7] == 't');
            CHECK(bytes[8] == 'T');
            // 2882656334 == 0xABD1D84E
            CHECK(bytes[bytes.size() - 4] == 0xAB);
            CHECK(bytes[bytes.size() - 3] == 0xD1);
            CHECK(bytes[bytes.size() - 2] == 0xD8);
            CHECK(bytes[bytes.size() - 1] == 0x4E);
        }

        SUBCASE("empty data") {
            chunk c(chunk_types::IEND, {});
            auto bytes = c.to_bytes();
            // IEND as found at the end of every PNG file
            std::vector<std::uint8_t> expected = {
                0x00, 0x00, 0x00, 0x00,
                'I', 'E', 'N', 'D',
                0xAE, 0x42, 0x60, 0x82
            };
            CHECK(bytes == expected);
            CHECK(c.crc() == 0xAE426082u);
        }
    }

    TEST_CASE("round trip") {
        const char* codes[] = {"RuSt", "IHDR", "tEXt", "ruST", "Rust", "abcd"};
        std::vector<std::vector<std::uint8_t>> payloads = {
            {},
            {0x00},
            {0xFF, 0x00, 0x80, 0x7F},
            std::vector<std::uint8_t>(1000, 0xA5),
            golden::payload()
        };

        for (const char* code : codes) {
            for (const auto& payload : payloads) {
                CAPTURE(code);
                CAPTURE(payload.size());
                chunk original(type_code::from_text(code), payload);
                chunk parsed = chunk::parse(original.to_bytes());
                CHECK(parsed == original);
                CHECK(parsed.type().bytes() == original.type().bytes());
                CHECK(parsed.data() == payload);
                CHECK(parsed.length() == payload.size());
                CHECK(parsed.crc() == original.crc());
            }
        }
    }

    TEST_CASE("crc determinism") {
        chunk a(type_code::from_text("RuSt"), golden::payload());
        chunk b(type_code::from_text("RuSt"), golden::payload());
        CHECK(a.crc() == b.crc());

        SUBCASE("flipping a data byte changes the crc") {
            auto payload = golden::payload();
            payload[10] ^= 0x01;
            chunk flipped(type_code::from_text("RuSt"), payload);
            CHECK(flipped.crc() != a.crc());
        }

        SUBCASE("changing the type changes the crc") {
            chunk other(type_code::from_text("RuST"), golden::payload());
            CHECK(other.crc() != a.crc());
        }
    }

    TEST_CASE("data as string") {
        SUBCASE("UTF-8 data") {
            std::string text = "gr\xC3\xBC\xC3\x9F dich";
            chunk c(chunk_types::tEXt, {text.begin(), text.end()});
            CHECK(c.data_as_string() == text);
        }

        SUBCASE("empty data") {
            chunk c(chunk_types::tEXt, {});
            CHECK(c.data_as_string().empty());
        }

        SUBCASE("invalid UTF-8") {
            chunk c(chunk_types::tEXt, {'o', 'k', 0xC3, 0x28});
            try {
                (void)c.data_as_string();
                FAIL("Should have thrown exception");
            } catch (const text_decode_error& e) {
                CHECK(e.kind() == error_kind::text_decode);
                CHECK(e.offset() == 2);
            }
        }
    }

    TEST_CASE("human readable output") {
        std::ostringstream ss;
        ss << testing_chunk();
        std::string out = ss.str();

        CHECK(out.find("Length: 42") != std::string::npos);
        CHECK(out.find("'RuSt'") != std::string::npos);
        CHECK(out.find("[82, 117, 83, 116]") != std::string::npos);
        CHECK(out.find("Data: 42 bytes") != std::string::npos);
        CHECK(out.find("CRC: 2882656334") != std::string::npos);
    }

    TEST_CASE("human readable output of unrenderable type") {
        std::ostringstream ss;
        ss << chunk(type_code({0xFF, 0xFE, 'A', 'B'}), {});
        CHECK(ss.str().find("'\\xff\\xfeAB'") != std::string::npos);
        CHECK(ss.str().find("[255, 254, 65, 66]") != std::string::npos);
    }
}
