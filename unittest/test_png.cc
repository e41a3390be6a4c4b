#include <doctest/doctest.h>
#include <pngchunk/png.hh>
#include <pngchunk/exceptions.hh>

#include <sstream>
#include <string>
#include "test_utils.hh"

using namespace pngchunk;

static png testing_png() {
    return png::from_chunks({
        text_chunk("FrSt", "I am the first chunk"),
        text_chunk("miDl", "I am another chunk"),
        text_chunk("LASt", "I am the last chunk")
    });
}

TEST_CASE("png construction") {
    SUBCASE("from chunks") {
        auto p = testing_png();
        CHECK(p.size() == 3);
        CHECK_FALSE(p.empty());
        CHECK(p.chunks()[1].type().to_string() == "miDl");
    }

    SUBCASE("default is empty") {
        png p;
        CHECK(p.empty());
        CHECK(p.serialize() == png_signature_bytes());
    }

    SUBCASE("header is the png signature") {
        const auto& h = png::header();
        CHECK(h[0] == 137);
        CHECK(h[1] == 'P');
        CHECK(h[2] == 'N');
        CHECK(h[3] == 'G');
        CHECK(h[7] == 10);
    }
}

TEST_CASE("png parsing") {
    SUBCASE("valid buffer") {
        auto bytes = png_bytes({text_chunk("FrSt", "first"), text_chunk("miDl", "second")});
        auto p = png::parse(bytes);
        REQUIRE(p.size() == 2);
        CHECK(p.chunks()[0].data_as_string() == std::string("first"));
        CHECK(p.chunks()[1].data_as_string() == std::string("second"));
    }

    SUBCASE("signature only") {
        auto p = png::parse(png_signature_bytes());
        CHECK(p.empty());
    }

    SUBCASE("minimal image keeps order") {
        auto chunks = minimal_image_chunks();
        auto bytes = png_signature_bytes();
        for (const auto& c : chunks) {
            c.serialize_to(bytes);
        }
        auto p = png::parse(bytes);
        REQUIRE(p.size() == 3);
        CHECK(p.chunks()[0].type() == chunk_id::IHDR);
        CHECK(p.chunks()[1].type() == chunk_id::IDAT);
        CHECK(p.chunks()[2].type() == chunk_id::IEND);
    }

    SUBCASE("bad signature") {
        auto bytes = png_bytes({text_chunk("FrSt", "first")});
        bytes[1] = std::byte('X');
        CHECK_THROWS_AS(png::parse(bytes), bad_signature_error);

        std::vector<std::byte> short_buffer(bytes.begin(), bytes.begin() + 4);
        CHECK_THROWS_AS(png::parse(short_buffer), bad_signature_error);

        CHECK_THROWS_AS(png::parse(std::vector<std::byte>{}), bad_signature_error);
    }

    SUBCASE("bad signature checked before chunks") {
        // Chunk after the wrong signature is corrupt too; signature must win
        auto bytes = png_bytes({text_chunk("FrSt", "first")});
        bytes[0] = std::byte(0);
        bytes.back() ^= std::byte(1);
        std::error_code ec;
        CHECK_FALSE(png::parse(bytes, ec).has_value());
        CHECK(ec == errc::bad_signature);
    }

    SUBCASE("chunk error aborts the whole parse") {
        auto bytes = png_bytes({text_chunk("FrSt", "first"), text_chunk("miDl", "second")});
        bytes.back() ^= std::byte(0x10);
        CHECK_THROWS_AS(png::parse(bytes), bad_checksum_error);

        std::error_code ec;
        CHECK_FALSE(png::parse(bytes, ec).has_value());
        CHECK(ec == errc::bad_checksum);
    }

    SUBCASE("truncated final chunk") {
        auto bytes = png_bytes({text_chunk("FrSt", "first"), text_chunk("miDl", "second")});
        for (std::size_t cut = 1; cut < 18; cut++) {
            std::vector<std::byte> truncated(bytes.begin(), bytes.end() - cut);
            CAPTURE(cut);
            CHECK_THROWS_AS(png::parse(truncated), insufficient_bytes_error);
        }
    }

    SUBCASE("non-throwing parse success") {
        std::error_code ec = make_error_code(errc::io_failure);
        auto p = png::parse(testing_png().serialize(), ec);
        REQUIRE(p.has_value());
        CHECK_FALSE(ec);
        CHECK(p->size() == 3);
    }
}

TEST_CASE("png serialization") {
    SUBCASE("round trip is byte identical") {
        auto bytes = testing_png().serialize();
        CHECK(png::parse(bytes).serialize() == bytes);
        CHECK(testing_png().serialized_size() == bytes.size());
    }

    SUBCASE("layout is signature then chunks in order") {
        auto p = testing_png();
        std::vector<std::byte> expected = png_signature_bytes();
        for (const auto& c : p.chunks()) {
            auto b = c.serialize();
            expected.insert(expected.end(), b.begin(), b.end());
        }
        CHECK(p.serialize() == expected);
    }
}

TEST_CASE("png chunk operations") {
    SUBCASE("append then find") {
        auto p = testing_png();
        p.append_chunk(text_chunk("TeSt", "Message"));
        CHECK(p.size() == 4);
        CHECK(p.chunks().back().type().to_string() == "TeSt");

        const chunk* found = p.find_first("TeSt");
        REQUIRE(found != nullptr);
        CHECK(found->data_as_string() == std::string("Message"));
    }

    SUBCASE("find missing type") {
        auto p = testing_png();
        CHECK(p.find_first("NoNe") == nullptr);
        CHECK(p.find_first(chunk_id::IEND) == nullptr);
    }

    SUBCASE("find with invalid type string") {
        auto p = testing_png();
        CHECK_THROWS_AS((void)p.find_first("toolong"), chunk_type_error);
        CHECK_THROWS_AS((void)p.find_first("1234"), chunk_type_error);
    }

    SUBCASE("duplicates are allowed and find returns the first") {
        auto p = testing_png();
        p.append_chunk(text_chunk("DuPe", "one"));
        p.append_chunk(text_chunk("DuPe", "two"));
        CHECK(p.size() == 5);
        CHECK(p.find_first("DuPe")->data_as_string() == std::string("one"));
    }

    SUBCASE("remove existing") {
        auto p = testing_png();
        auto removed = p.remove_first("miDl");
        CHECK(removed.data_as_string() == std::string("I am another chunk"));
        CHECK(p.size() == 2);
        CHECK(p.find_first("miDl") == nullptr);
        CHECK(p.chunks()[0].type().to_string() == "FrSt");
        CHECK(p.chunks()[1].type().to_string() == "LASt");
    }

    SUBCASE("remove missing leaves sequence unchanged") {
        auto p = testing_png();
        auto before = p.serialize();
        try {
            (void)p.remove_first("NoNe");
            FAIL("Should have thrown exception");
        } catch (const chunk_not_found_error& e) {
            CHECK(e.code() == errc::chunk_type_not_found);
            CHECK(e.type() == "NoNe");
        }
        CHECK(p.size() == 3);
        CHECK(p.serialize() == before);
    }

    SUBCASE("remove targets the earliest match") {
        auto p = testing_png();
        p.append_chunk(text_chunk("DuPe", "one"));
        p.append_chunk(text_chunk("DuPe", "two"));

        auto removed = p.remove_first("DuPe");
        CHECK(removed.data_as_string() == std::string("one"));
        CHECK(p.size() == 4);
        CHECK(p.find_first("DuPe")->data_as_string() == std::string("two"));

        (void)p.remove_first("DuPe");
        CHECK(p.size() == 3);
        CHECK(p.find_first("DuPe") == nullptr);
    }

    SUBCASE("non-throwing remove") {
        auto p = testing_png();
        std::error_code ec;
        CHECK_FALSE(p.remove_first("NoNe", ec).has_value());
        CHECK(ec == errc::chunk_type_not_found);
        CHECK(p.size() == 3);

        CHECK_FALSE(p.remove_first("bad", ec).has_value());
        CHECK(ec == errc::invalid_type_length);

        auto removed = p.remove_first("FrSt", ec);
        REQUIRE(removed.has_value());
        CHECK_FALSE(ec);
        CHECK(p.size() == 2);
    }

    SUBCASE("appended chunk survives a round trip") {
        auto p = png::from_chunks(minimal_image_chunks());
        p.append_chunk(text_chunk("ruSt", std::string(secret_message)));
        auto reparsed = png::parse(p.serialize());
        REQUIRE(reparsed.size() == 4);
        const chunk* found = reparsed.find_first("ruSt");
        REQUIRE(found != nullptr);
        CHECK(found->data_as_string() == std::string(secret_message));
    }
}

TEST_CASE("png display") {
    std::ostringstream oss;
    oss << testing_png();
    auto text = oss.str();
    CHECK(text.find("3 chunk(s)") != std::string::npos);
    CHECK(text.find("Type: FrSt") != std::string::npos);
    CHECK(text.find("Data: I am the last chunk") != std::string::npos);
    CHECK(text.find("Type: FrSt") < text.find("Type: miDl"));
}
