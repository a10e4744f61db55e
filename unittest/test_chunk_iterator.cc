//
// Test sequential chunk traversal
//

#include <doctest/doctest.h>
#include <pngme/chunk_iterator.hh>
#include <pngme/exceptions.hh>

#include <string>
#include <vector>

#include "test_utils.hh"

using namespace pngme;

TEST_SUITE("CHUNK_ITERATOR") {
    TEST_CASE("Iterate over consecutive chunks") {
        auto chunks = minimal_image_chunks();
        auto data = encode_all(chunks);

        SUBCASE("offsets and indices") {
            chunk_iterator it(data.data(), data.size());

            REQUIRE(it.has_next());
            CHECK(it.current().index == 0);
            CHECK(it.current().header.type == chunk_types::IHDR);
            CHECK(it.current().header.length == 13);
            CHECK(it.current().header.file_offset == 0);
            CHECK(it.current().header.end_offset() == 25);
            CHECK(it.current().header.end_offset() ==
                  it.current().header.file_offset + chunk::OVERHEAD_BYTES + it.current().header.length);
            CHECK(it.current().header.end_offset() - it.current().header.file_offset == chunks[0].encoded_size());
            CHECK(it.current().header.crc == chunks[0].crc());
            CHECK(it.current().value == chunks[0]);

            it.next();
            REQUIRE(it.has_next());
            CHECK(it.current().index == 1);
            CHECK(it.current().header.type == chunk_types::IDAT);
            CHECK(it.current().header.file_offset == 25);
            CHECK(it.current().header.length == 10);

            it.next();
            REQUIRE(it.has_next());
            CHECK(it.current().index == 2);
            CHECK(it.current().header.type == chunk_types::IEND);
            CHECK(it.current().header.file_offset == 47);
            CHECK(it.current().header.crc == IEND_CRC);

            it.next();
            CHECK(it.at_end());
            CHECK_FALSE(it.has_next());
            CHECK(it.offset() == data.size());

            // Advancing past the end is a no-op
            it.next();
            CHECK(it.at_end());
        }

        SUBCASE("start offset") {
            std::vector<std::byte> prefixed(5, std::byte(0xEE));
            prefixed.insert(prefixed.end(), data.begin(), data.end());

            chunk_iterator it(prefixed.data(), prefixed.size(), 5);
            REQUIRE(it.has_next());
            CHECK(it.current().header.file_offset == 5);
            CHECK(it.current().header.type == chunk_types::IHDR);
        }

        SUBCASE("for_each_chunk") {
            std::vector<std::string> types;
            std::vector<std::size_t> indices;
            for_each_chunk(data.data(), data.size(), [&](const chunk_iterator::chunk_info& info) {
                types.push_back(info.header.type.to_string());
                indices.push_back(info.index);
            });
            CHECK(types == std::vector<std::string>{"IHDR", "IDAT", "IEND"});
            CHECK(indices == std::vector<std::size_t>{0, 1, 2});
        }

        SUBCASE("parse_chunks") {
            auto parsed = parse_chunks(data.data(), data.size());
            REQUIRE(parsed.size() == chunks.size());
            for (std::size_t i = 0; i < parsed.size(); i++) {
                CAPTURE(i);
                CHECK(parsed[i] == chunks[i]);
            }
        }
    }

    TEST_CASE("Iterator edge cases") {
        SUBCASE("empty buffer has no chunks") {
            chunk_iterator it(nullptr, 0);
            CHECK(it.at_end());
            CHECK(parse_chunks(nullptr, 0).empty());
        }

        SUBCASE("start offset equal to size has no chunks") {
            auto data = make_frame(0, "IEND", "", IEND_CRC);
            chunk_iterator it(data.data(), data.size(), data.size());
            CHECK(it.at_end());
        }

        SUBCASE("start offset beyond size") {
            auto data = make_frame(0, "IEND", "", IEND_CRC);
            try {
                chunk_iterator it(data.data(), data.size(), data.size() + 1);
                FAIL("Should have thrown exception");
            } catch (const frame_error& e) {
                CHECK(e.code() == error_code::too_short);
                CHECK(e.actual_size() == 12);
                CHECK(e.declared() == 13);
            }
        }

        SUBCASE("trailing garbage throws in strict mode") {
            auto data = make_frame(0, "IEND", "", IEND_CRC);
            data.push_back(std::byte(0));
            data.push_back(std::byte(0));

            chunk_iterator it(data.data(), data.size());
            REQUIRE(it.has_next());
            try {
                it.next();
                FAIL("Should have thrown exception");
            } catch (const frame_error& e) {
                CHECK(e.code() == error_code::too_short);
                // only the two bytes after IEND are left
                CHECK(e.actual_size() == 2);
            }
        }

        SUBCASE("bad checksum in the middle throws") {
            auto data = encode_all(minimal_image_chunks());
            // flip one byte of the IDAT payload (IDAT data starts at 25 + 8)
            data[35] ^= std::byte(0xFF);

            chunk_iterator it(data.data(), data.size());
            CHECK(it.current().header.type == chunk_types::IHDR);
            CHECK_THROWS_AS(it.next(), checksum_error);
        }

        SUBCASE("bad type in the middle throws") {
            auto data = make_frame(0, "IEND", "", IEND_CRC);
            auto bad = make_frame(0, "I3ND", "", 0);
            data.insert(data.end(), bad.begin(), bad.end());
            CHECK_THROWS_AS(parse_chunks(data.data(), data.size()), bad_type_error);
        }

        SUBCASE("error in the first chunk is raised by the constructor") {
            auto data = secret_frame(1);
            CHECK_THROWS_AS(chunk_iterator(data.data(), data.size()), checksum_error);
        }
    }
}
