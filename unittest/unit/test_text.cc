#include <doctest/doctest.h>
#include <byteio/text.hh>
#include <byteio/error.hh>
#include "../test_helpers.hh"
#include <string>
#include <vector>

using namespace byteio;
using namespace byteio::test;

namespace {
    // Minimal ISO-8859-1 codec standing in for a caller-supplied encoding
    class latin1_encoding : public text_encoding {
    public:
        const char* name() const override { return "iso-8859-1"; }

        std::string decode(const uint8* data, size length) const override {
            std::string out;
            for (size i = 0; i < length; ++i) {
                if (data[i] < 0x80) {
                    out.push_back(static_cast<char>(data[i]));
                } else {
                    out.push_back(static_cast<char>(0xC0 | (data[i] >> 6)));
                    out.push_back(static_cast<char>(0x80 | (data[i] & 0x3F)));
                }
            }
            return out;
        }

        std::vector<uint8> encode(std::string_view text) const override {
            std::vector<uint8> out;
            for (size i = 0; i < text.size(); ++i) {
                const auto c = static_cast<uint8>(text[i]);
                if (c < 0x80) {
                    out.push_back(c);
                } else if ((c & 0xE0) == 0xC0 && i + 1 < text.size()) {
                    out.push_back(static_cast<uint8>(((c & 0x1F) << 6) | (static_cast<uint8>(text[++i]) & 0x3F)));
                } else {
                    out.push_back('?');
                }
            }
            return out;
        }
    };

    const std::string hello_accented = "h\xC3\xA9llo";  // "héllo"
}

TEST_SUITE("Text::Utf8") {
    TEST_CASE("Round trip through a stream") {
        memory_io_stream stream;
        CHECK(write_string(&stream, hello_accented) == 6);
        CHECK(stream.data().size() == 6);

        stream.seek(0, seek_origin::set);
        CHECK(read_string(&stream, 6) == hello_accented);
    }

    TEST_CASE("No length prefix or terminator is written") {
        memory_io_stream stream;
        write_string(&stream, "ab");
        write_string(&stream, "");
        write_string(&stream, "cd");
        CHECK(stream.data() == std::vector<uint8_t>{'a', 'b', 'c', 'd'});
    }

    TEST_CASE("Reads take exactly the requested length") {
        memory_io_stream stream({'a', 'b', 'c', 'd', 'e'});
        CHECK(read_string(&stream, 2) == "ab");
        CHECK(read_string(&stream, 0).empty());
        CHECK(read_string(&stream, 3) == "cde");
        CHECK_THROWS_AS(read_string(&stream, 1), end_of_stream_error);
    }

    TEST_CASE("Four-byte sequences are preserved") {
        const std::string text = "\xF0\x9F\x8E\xB5 notes";
        memory_io_stream stream;
        CHECK(write_string(&stream, text) == text.size());
        stream.seek(0, seek_origin::set);
        CHECK(read_string(&stream, text.size()) == text);
    }

    TEST_CASE("Malformed input is replaced with U+FFFD") {
        const auto& utf8 = utf8_encoding();
        const std::string replacement = "\xEF\xBF\xBD";

        SUBCASE("stray continuation byte") {
            const uint8_t bytes[] = {'a', 0x80, 'b'};
            CHECK(utf8.decode(bytes, 3) == "a" + replacement + "b");
        }

        SUBCASE("truncated sequence") {
            const uint8_t bytes[] = {'x', 0xE2, 0x82};
            CHECK(utf8.decode(bytes, 3) == "x" + replacement);
        }

        SUBCASE("overlong encoding") {
            const uint8_t bytes[] = {0xC0, 0xAF};
            CHECK(utf8.decode(bytes, 2) == replacement);
        }

        SUBCASE("overlong sequence counts once") {
            const uint8_t bytes[] = {0xE0, 0x80, 0x80};
            CHECK(utf8.decode(bytes, 3) == replacement);
        }

        SUBCASE("decoding resumes at the byte that broke a sequence") {
            const uint8_t bytes[] = {0xE2, 0x82, 'A'};
            CHECK(utf8.decode(bytes, 3) == replacement + "A");
        }

        SUBCASE("encoded surrogate") {
            const uint8_t bytes[] = {0xED, 0xA0, 0x80};
            CHECK(utf8.decode(bytes, 3) == replacement);
        }

        SUBCASE("invalid text on the way out") {
            const auto encoded = utf8.encode("ok\xFF");
            CHECK(encoded == std::vector<uint8>{'o', 'k', 0xEF, 0xBF, 0xBD});
        }
    }

    TEST_CASE("Encoding name") {
        CHECK(std::string(utf8_encoding().name()) == "utf-8");
    }
}

TEST_SUITE("Text::Ascii") {
    TEST_CASE("Plain ASCII round trip") {
        memory_io_stream stream;
        CHECK(write_ascii(&stream, "RIFF") == 4);
        stream.seek(0, seek_origin::set);
        CHECK(read_ascii(&stream, 4) == "RIFF");
    }

    TEST_CASE("Non-ASCII characters become '?'") {
        memory_io_stream stream;
        CHECK(write_ascii(&stream, hello_accented) == 5);
        CHECK(stream.data() == std::vector<uint8_t>{'h', '?', 'l', 'l', 'o'});

        stream.seek(0, seek_origin::set);
        CHECK(read_ascii(&stream, 5) == "h?llo");
    }

    TEST_CASE("High bytes decode to '?'") {
        memory_io_stream stream({'A', 0xC3, 0xA9, 'Z'});
        CHECK(read_ascii(&stream, 4) == "A??Z");
    }

    TEST_CASE("Explicit encoding argument matches the convenience call") {
        memory_io_stream stream;
        CHECK(write_string(&stream, hello_accented, ascii_encoding()) == 5);
        CHECK(std::string(ascii_encoding().name()) == "us-ascii");
    }
}

TEST_SUITE("Text::CustomEncoding") {
    TEST_CASE("Caller-supplied encodings are used as given") {
        const latin1_encoding latin1;

        memory_io_stream stream;
        CHECK(write_string(&stream, hello_accented, latin1) == 5);
        CHECK(stream.data() == std::vector<uint8_t>{'h', 0xE9, 'l', 'l', 'o'});

        stream.seek(0, seek_origin::set);
        CHECK(read_string(&stream, 5, latin1) == hello_accented);
    }
}

TEST_SUITE("Text::Errors") {
    TEST_CASE("Null stream") {
        CHECK_THROWS_AS(read_string(nullptr, 1), argument_error);
        CHECK_THROWS_AS(write_string(nullptr, "x"), argument_error);
    }

    TEST_CASE("Rejected write") {
        limited_sink sink(1);
        CHECK_THROWS_AS(write_ascii(&sink, "abc"), io_error);
    }
}
