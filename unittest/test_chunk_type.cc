#include <doctest/doctest.h>
#include <pngme/chunk_type.hh>
#include <pngme/exceptions.hh>

#include <array>
#include <map>
#include <sstream>
#include <unordered_set>

using namespace pngme;

namespace {
    std::array<std::uint8_t, 4> bytes_of(const char* s) {
        return {static_cast<std::uint8_t>(s[0]), static_cast<std::uint8_t>(s[1]),
                static_cast<std::uint8_t>(s[2]), static_cast<std::uint8_t>(s[3])};
    }
}

TEST_SUITE("CHUNK_TYPE") {
    TEST_CASE("chunk_type construction") {
        SUBCASE("from bytes") {
            const std::array<std::uint8_t, 4> expected = {82, 117, 83, 116};
            chunk_type t(expected);
            CHECK(t.bytes() == expected);
        }

        SUBCASE("from string") {
            chunk_type from_bytes(std::array<std::uint8_t, 4>{82, 117, 83, 116});
            chunk_type from_text("RuSt");
            CHECK(from_bytes == from_text);
            CHECK(from_text.to_string() == "RuSt");
        }

        SUBCASE("from std::string and string_view") {
            std::string s = "IHDR";
            CHECK(chunk_type(s).to_string() == "IHDR");
            CHECK(chunk_type(std::string_view("IEND")).to_string() == "IEND");
        }

        SUBCASE("from raw memory") {
            const unsigned char raw[6] = {'t', 'E', 'X', 't', 0, 0};
            auto t = chunk_type::from_bytes(raw);
            CHECK(t.to_string() == "tEXt");
        }

        SUBCASE("case is preserved") {
            CHECK(chunk_type("aBcD").to_string() == "aBcD");
            CHECK(chunk_type("aBcD") != chunk_type("AbCd"));
        }
    }

    TEST_CASE("chunk_type accepts exactly the ASCII letters") {
        for (unsigned v = 0; v < 256; v++) {
            const auto b = static_cast<std::uint8_t>(v);
            const bool letter = (v >= 'A' && v <= 'Z') || (v >= 'a' && v <= 'z');
            CAPTURE(v);
            CHECK(is_chunk_type_byte(b) == letter);

            for (std::size_t pos = 0; pos < 4; pos++) {
                std::array<std::uint8_t, 4> bytes = bytes_of("RuSt");
                bytes[pos] = b;
                if (letter) {
                    CHECK(chunk_type(bytes).bytes() == bytes);
                } else {
                    CHECK_THROWS_AS(chunk_type{bytes}, chunk_type_error);
                }
            }
        }
    }

    TEST_CASE("chunk_type rejects invalid input") {
        SUBCASE("digit") {
            try {
                chunk_type t("Ru1t");
                FAIL("Should have thrown exception");
            } catch (const chunk_type_error& e) {
                CHECK(e.code() == error_code::invalid_byte);
                CHECK(e.value() == '1');
                CHECK(e.index() == 2);
            }
        }

        SUBCASE("bytes between the upper and lower case ranges") {
            for (std::uint8_t b = 0x5B; b <= 0x60; b++) {
                std::array<std::uint8_t, 4> bytes = {b, 'a', 'a', 'a'};
                CHECK_THROWS_AS(chunk_type{bytes}, chunk_type_error);
            }
        }

        SUBCASE("bytes just outside the letter ranges") {
            CHECK_THROWS_AS(chunk_type(bytes_of("@aaa")), chunk_type_error);
            CHECK_THROWS_AS(chunk_type(bytes_of("aaa{")), chunk_type_error);
            const std::array<std::uint8_t, 4> high = {0xC3, 'a', 'a', 'a'};
            CHECK_THROWS_AS(chunk_type{high}, chunk_type_error);
        }

        SUBCASE("wrong length") {
            for (const char* text : {"", "R", "RuS", "RuStX"}) {
                CAPTURE(text);
                try {
                    chunk_type t(text);
                    FAIL("Should have thrown exception");
                } catch (const chunk_type_error& e) {
                    CHECK(e.code() == error_code::wrong_length);
                    CHECK(e.value() == std::string_view(text).size());
                }
            }
        }

        SUBCASE("null C string") {
            const char* text = nullptr;
            try {
                chunk_type t(text);
                FAIL("Should have thrown exception");
            } catch (const chunk_type_error& e) {
                CHECK(e.code() == error_code::wrong_length);
                CHECK(e.value() == 0);
            }
        }

        SUBCASE("multi-byte UTF-8 text") {
            // "Ruß" is 4 bytes long, the last two are not letters
            CHECK_THROWS_AS(chunk_type("Ru\xC3\x9F"), chunk_type_error);
            try {
                chunk_type t("Ru\xC3\x9F");
            } catch (const chunk_type_error& e) {
                CHECK(e.code() == error_code::invalid_byte);
                CHECK(e.index() == 2);
            }
            // "Rußt" is 5 bytes long
            CHECK_THROWS_AS(chunk_type("Ru\xC3\x9Ft"), chunk_type_error);
        }

        SUBCASE("errors are pngme errors") {
            CHECK_THROWS_AS(chunk_type("1234"), pngme_error);
        }
    }

    TEST_CASE("chunk_type property bits") {
        SUBCASE("RuSt") {
            chunk_type t("RuSt");
            CHECK(t.is_critical());
            CHECK_FALSE(t.is_public());
            CHECK(t.is_reserved_bit_valid());
            CHECK(t.is_safe_to_copy());
            CHECK(t.is_valid());
        }

        SUBCASE("ancillary") {
            CHECK_FALSE(chunk_type("ruSt").is_critical());
        }

        SUBCASE("public") {
            CHECK(chunk_type("RUSt").is_public());
        }

        SUBCASE("reserved bit") {
            chunk_type t("Rust");
            CHECK_FALSE(t.is_reserved_bit_valid());
            CHECK_FALSE(t.is_valid());
        }

        SUBCASE("unsafe to copy") {
            CHECK_FALSE(chunk_type("RuST").is_safe_to_copy());
        }

        SUBCASE("standard chunks") {
            CHECK(chunk_types::IHDR.is_critical());
            CHECK(chunk_types::IHDR.is_public());
            CHECK(chunk_types::IHDR.is_valid());
            CHECK_FALSE(chunk_types::IHDR.is_safe_to_copy());

            CHECK_FALSE(chunk_types::tEXt.is_critical());
            CHECK(chunk_types::tEXt.is_public());
            CHECK(chunk_types::tEXt.is_safe_to_copy());
        }

        SUBCASE("flags struct matches accessors") {
            for (const char* text : {"RuSt", "ruSt", "RUSt", "Rust", "RuST", "rust", "IHDR"}) {
                CAPTURE(text);
                chunk_type t(text);
                auto f = t.flags();
                CHECK(f == decode_flags(t.bytes()));
                CHECK(f.ancillary == !t.is_critical());
                CHECK(f.is_public == t.is_public());
                CHECK(f.reserved_bit_valid == t.is_reserved_bit_valid());
                CHECK(f.safe_to_copy == t.is_safe_to_copy());
            }
        }

        SUBCASE("each flag depends only on its own byte") {
            auto base = decode_flags(bytes_of("RUSt"));
            auto f = decode_flags(bytes_of("rUSt"));
            CHECK(f.ancillary != base.ancillary);
            CHECK(f.is_public == base.is_public);
            CHECK(f.reserved_bit_valid == base.reserved_bit_valid);
            CHECK(f.safe_to_copy == base.safe_to_copy);

            f = decode_flags(bytes_of("RUST"));
            CHECK(f.ancillary == base.ancillary);
            CHECK(f.is_public == base.is_public);
            CHECK(f.reserved_bit_valid == base.reserved_bit_valid);
            CHECK(f.safe_to_copy != base.safe_to_copy);
        }
    }

    TEST_CASE("chunk_type conversions") {
        SUBCASE("to_string and to_string_view") {
            chunk_type t("tEXt");
            CHECK(t.to_string() == "tEXt");
            CHECK(t.to_string_view() == "tEXt");
            CHECK(t.to_string_view().size() == 4);
        }

        SUBCASE("to_uint32 is big-endian") {
            CHECK(chunk_type("IHDR").to_uint32() == 0x49484452u);
            CHECK(chunk_type("IEND").to_uint32() == 0x49454E44u);
        }

        SUBCASE("to_bytes") {
            unsigned char out[4];
            chunk_type("IDAT").to_bytes(out);
            CHECK(out[0] == 'I');
            CHECK(out[1] == 'D');
            CHECK(out[2] == 'A');
            CHECK(out[3] == 'T');
        }

        SUBCASE("element access and iteration") {
            chunk_type t("PLTE");
            CHECK(t[0] == 'P');
            CHECK(t[3] == 'E');
            std::string s;
            for (auto c : t) {
                s += static_cast<char>(c);
            }
            CHECK(s == "PLTE");
        }
    }

    TEST_CASE("chunk_type output") {
        SUBCASE("stream output is quoted") {
            std::ostringstream oss;
            oss << chunk_type("RuSt");
            CHECK(oss.str() == "'RuSt'");
        }

        SUBCASE("describe lists bytes and properties") {
            CHECK(chunk_type("RuSt").describe() ==
                  "RuSt [82, 117, 83, 116] Critical Private Reserved SafeToCopy");
            CHECK(chunk_type("rUsT").describe() ==
                  "rUsT [114, 85, 115, 84] Ancillary Public NotReserved UnsafeToCopy");
        }
    }

    TEST_CASE("chunk_type comparison and hashing") {
        SUBCASE("equality") {
            CHECK(chunk_type("RuSt") == chunk_type(bytes_of("RuSt")));
            CHECK(chunk_type("RuSt") != chunk_type("Rust"));
        }

        SUBCASE("ordering") {
            CHECK(chunk_type("AAAA") < chunk_type("BBBB"));
            CHECK(chunk_type("IDAT") < chunk_type("IEND"));
            CHECK(chunk_type("ZZZZ") < chunk_type("aaaa"));
            CHECK(chunk_type("IHDR") >= chunk_type("IHDR"));
        }

        SUBCASE("map key") {
            std::map<chunk_type, int> counts;
            counts[chunk_type("IDAT")]++;
            counts[chunk_type("IDAT")]++;
            counts[chunk_type("IHDR")]++;
            CHECK(counts.size() == 2);
            CHECK(counts[chunk_type("IDAT")] == 2);
        }

        SUBCASE("unordered set") {
            std::unordered_set<chunk_type> seen;
            seen.insert(chunk_type("IHDR"));
            seen.insert(chunk_type("IHDR"));
            seen.insert(chunk_type("IEND"));
            CHECK(seen.size() == 2);
            CHECK(seen.count(chunk_type("IEND")) == 1);
            CHECK(std::hash<chunk_type>{}(chunk_type("IHDR")) == chunk_type_hash{}(chunk_type("IHDR")));
        }
    }
}
