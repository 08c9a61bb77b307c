#include <doctest/doctest.h>
#include <pngstash/pngstash.hpp>

#include "helpers/png_fixtures.hpp"

#include <string>
#include <vector>

namespace {

// Chunk types in file order, space separated
std::string chunk_types(const pngstash::png_file& png) {
    std::string types;
    for (const auto& c : png.chunks()) {
        if (!types.empty()) types += ' ';
        types += c.type().to_string();
    }
    return types;
}

std::vector<std::uint8_t> sample_bytes() {
    return pngstash_test::make_sample_png().to_bytes();
}

} // namespace

// ============================================================================
// PNG File Tests
// ============================================================================

TEST_CASE("png_file: sniff") {
    SUBCASE("Valid signature") {
        CHECK(pngstash::png_file::sniff(sample_bytes()));
    }

    SUBCASE("Invalid - too short") {
        std::vector<std::uint8_t> data = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A};
        CHECK_FALSE(pngstash::png_file::sniff(data));
    }

    SUBCASE("Not confused with BMP") {
        std::vector<std::uint8_t> data = {'B', 'M', 0x00, 0x00, 0x00, 0x00, 0x00, 0x00};
        CHECK_FALSE(pngstash::png_file::sniff(data));
    }
}

TEST_CASE("png_file: parse") {
    SUBCASE("Sample file") {
        pngstash::png_file png;
        auto result = pngstash::png_file::parse(sample_bytes(), png);

        REQUIRE(result.ok);
        CHECK(chunk_types(png) == "IHDR ruSt IDAT IEND");
        CHECK(png.header() == pngstash::png_file::SIGNATURE);
    }

    SUBCASE("Signature only") {
        const std::vector<std::uint8_t> data(pngstash::png_file::SIGNATURE.begin(),
                                             pngstash::png_file::SIGNATURE.end());
        pngstash::png_file png;
        REQUIRE(pngstash::png_file::parse(data, png).ok);
        CHECK(png.chunks().empty());
    }

    SUBCASE("Real encoder output") {
        const auto data = pngstash_test::make_carrier_png();
        REQUIRE(!data.empty());

        pngstash::png_file png;
        REQUIRE(pngstash::png_file::parse(data, png).ok);
        REQUIRE(png.chunks().size() >= 3);
        CHECK(png.chunks().front().type().to_string() == "IHDR");
        CHECK(png.chunks().back().type().to_string() == "IEND");
        CHECK(png.to_bytes() == data);
    }

    SUBCASE("Invalid signature") {
        auto data = sample_bytes();
        data[1] = 'J';

        pngstash::png_file png;
        auto result = pngstash::png_file::parse(data, png);
        CHECK(result.error == pngstash::stash_error::invalid_signature);
    }

    SUBCASE("Empty input") {
        std::vector<std::uint8_t> data;
        pngstash::png_file png;
        CHECK(pngstash::png_file::parse(data, png).error == pngstash::stash_error::invalid_signature);
    }

    SUBCASE("Corrupted chunk") {
        auto data = sample_bytes();
        // First data byte of IHDR
        data[pngstash::png_file::SIGNATURE.size() + pngstash::chunk::HEADER_SIZE] ^= 0xFF;

        pngstash::png_file png;
        auto result = pngstash::png_file::parse(data, png);
        CHECK(result.error == pngstash::stash_error::invalid_format);
        CHECK(result.message.find("Chunk 0 at offset 8") != std::string::npos);
    }

    SUBCASE("Truncated trailing chunk") {
        auto data = sample_bytes();
        data.pop_back();

        pngstash::png_file png;
        auto result = pngstash::png_file::parse(data, png);
        CHECK(result.error == pngstash::stash_error::invalid_format);
        CHECK(result.message.find("Chunk 3") != std::string::npos);
    }

    SUBCASE("Failure leaves output untouched") {
        auto data = sample_bytes();
        data.pop_back();

        pngstash::png_file png = pngstash_test::make_sample_png();
        CHECK_FALSE(pngstash::png_file::parse(data, png).ok);
        CHECK(png.chunks().size() == 4);
    }
}

TEST_CASE("png_file: round trip") {
    const auto original = pngstash_test::make_sample_png();
    const auto bytes = original.to_bytes();

    pngstash::png_file parsed;
    REQUIRE(pngstash::png_file::parse(bytes, parsed).ok);
    CHECK(parsed == original);
    CHECK(parsed.to_bytes() == bytes);
}

TEST_CASE("png_file: chunk_by_type") {
    const auto png = pngstash_test::make_sample_png();

    SUBCASE("Found") {
        const auto* found = png.chunk_by_type("ruSt");
        REQUIRE(found != nullptr);

        std::string text;
        REQUIRE(found->data_as_string(text).ok);
        CHECK(text == "This is a secret message!");
    }

    SUBCASE("Found by chunk_type") {
        const auto* found = png.chunk_by_type(pngstash::chunk_type({'I', 'D', 'A', 'T'}));
        REQUIRE(found != nullptr);
        CHECK(found->length() == 6);
    }

    SUBCASE("Case sensitive") {
        CHECK(png.chunk_by_type("RUST") == nullptr);
    }

    SUBCASE("Missing") {
        CHECK(png.chunk_by_type("zzzz") == nullptr);
        CHECK(png.chunk_by_type("") == nullptr);
    }

    SUBCASE("First match wins") {
        auto copy = png;
        copy.append_chunk(pngstash_test::make_chunk("ruSt", "second"));

        const auto* found = copy.chunk_by_type("ruSt");
        REQUIRE(found != nullptr);
        CHECK(found->length() == 25);
    }
}

TEST_CASE("png_file: append_chunk") {
    auto png = pngstash_test::make_sample_png();
    png.append_chunk(pngstash_test::make_chunk("TeSt", "Message"));

    CHECK(chunk_types(png) == "IHDR ruSt IDAT IEND TeSt");
}

TEST_CASE("png_file: insert_before_iend") {
    SUBCASE("With IEND") {
        auto png = pngstash_test::make_sample_png();
        png.insert_before_iend(pngstash_test::make_chunk("TeSt", "Message"));
        CHECK(chunk_types(png) == "IHDR ruSt IDAT TeSt IEND");
    }

    SUBCASE("Without IEND") {
        pngstash::png_file png;
        png.insert_before_iend(pngstash_test::make_chunk("TeSt", "Message"));
        CHECK(chunk_types(png) == "TeSt");
    }
}

TEST_CASE("png_file: remove_first_chunk") {
    SUBCASE("Removes and returns the chunk") {
        auto png = pngstash_test::make_sample_png();

        pngstash::chunk removed;
        REQUIRE(png.remove_first_chunk("ruSt", &removed).ok);
        CHECK(chunk_types(png) == "IHDR IDAT IEND");
        CHECK(removed == pngstash_test::make_chunk("ruSt", "This is a secret message!"));
    }

    SUBCASE("By chunk_type") {
        auto png = pngstash_test::make_sample_png();
        REQUIRE(png.remove_first_chunk(pngstash::chunk_type({'I', 'D', 'A', 'T'})).ok);
        CHECK(chunk_types(png) == "IHDR ruSt IEND");
    }

    SUBCASE("Only the first duplicate") {
        auto png = pngstash_test::make_sample_png();
        png.append_chunk(pngstash_test::make_chunk("ruSt", "second"));

        REQUIRE(png.remove_first_chunk("ruSt").ok);
        CHECK(chunk_types(png) == "IHDR IDAT IEND ruSt");

        const auto* left = png.chunk_by_type("ruSt");
        REQUIRE(left != nullptr);
        CHECK(left->length() == 6);
    }

    SUBCASE("Missing") {
        auto png = pngstash_test::make_sample_png();
        auto result = png.remove_first_chunk("zzzz");

        CHECK(result.error == pngstash::stash_error::not_found);
        CHECK(result.message.find("zzzz") != std::string::npos);
        CHECK(png.chunks().size() == 4);
    }
}
