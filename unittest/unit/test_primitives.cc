#include <doctest/doctest.h>
#include <byteio/primitives.hh>
#include <byteio/endian.hh>
#include <byteio/error.hh>
#include "../test_helpers.hh"
#include <cstring>
#include <limits>
#include <vector>

using namespace byteio;
using namespace byteio::test;

TEST_SUITE("Primitives::ByteOrder") {
    TEST_CASE("32-bit value 0x01020304 on the wire") {
        SUBCASE("little-endian") {
            memory_io_stream stream;
            write_u32le(&stream, 0x01020304u);
            CHECK(stream.data() == std::vector<uint8_t>{0x04, 0x03, 0x02, 0x01});
        }

        SUBCASE("big-endian") {
            memory_io_stream stream;
            write_u32be(&stream, 0x01020304u);
            CHECK(stream.data() == std::vector<uint8_t>{0x01, 0x02, 0x03, 0x04});
        }
    }

    TEST_CASE("Reads decode literal byte sequences") {
        const std::vector<uint8_t> bytes = {0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08};

        memory_io_stream a(bytes);
        CHECK(read_u16le(&a) == 0x0201);
        memory_io_stream b(bytes);
        CHECK(read_u16be(&b) == 0x0102);
        memory_io_stream c(bytes);
        CHECK(read_u32le(&c) == 0x04030201u);
        memory_io_stream d(bytes);
        CHECK(read_u32be(&d) == 0x01020304u);
        memory_io_stream e(bytes);
        CHECK(read_u64le(&e) == 0x0807060504030201ull);
        memory_io_stream f(bytes);
        CHECK(read_u64be(&f) == 0x0102030405060708ull);
    }

    TEST_CASE("Writes emit one byte per call") {
        memory_io_stream stream;
        write_u16be(&stream, 0x1234);
        CHECK(stream.write_calls() == 2);
        write_u64le(&stream, 1);
        CHECK(stream.write_calls() == 10);
    }

    TEST_CASE("64-bit writes match the conceptual 8-byte expansion") {
        const uint64_t value = 0x8899AABBCCDDEEFFull;
        uint8_t le[8];
        uint8_t be[8];
        store_le64(le, value);
        store_be64(be, value);

        memory_io_stream s1;
        write_u64le(&s1, value);
        CHECK(s1.data() == to_vector(le, 8));

        memory_io_stream s2;
        write_u64be(&s2, value);
        CHECK(s2.data() == to_vector(be, 8));

        memory_io_stream s3;
        write_s64le(&s3, static_cast<int64_t>(value));
        CHECK(s3.data() == to_vector(le, 8));

        memory_io_stream s4;
        write_s64be(&s4, static_cast<int64_t>(value));
        CHECK(s4.data() == to_vector(be, 8));
    }
}

TEST_SUITE("Primitives::Signedness") {
    TEST_CASE("Negative values") {
        memory_io_stream stream;
        write_s16le(&stream, -2);
        write_s16be(&stream, -2);
        write_s32le(&stream, -123456);
        write_s32be(&stream, -123456);
        write_s64le(&stream, -1);
        write_s64be(&stream, std::numeric_limits<int64_t>::min());

        CHECK(stream.data()[0] == 0xFE);
        CHECK(stream.data()[1] == 0xFF);
        CHECK(stream.data()[2] == 0xFF);
        CHECK(stream.data()[3] == 0xFE);

        stream.seek(0, seek_origin::set);
        CHECK(read_s16le(&stream) == -2);
        CHECK(read_s16be(&stream) == -2);
        CHECK(read_s32le(&stream) == -123456);
        CHECK(read_s32be(&stream) == -123456);
        CHECK(read_s64le(&stream) == -1);
        CHECK(read_s64be(&stream) == std::numeric_limits<int64_t>::min());
    }

    TEST_CASE("Low half with its top bit set keeps the high half intact") {
        // 0x00000001_80000000: the low half alone would be negative as int32
        const int64_t value = 0x0000000180000000ll;

        memory_io_stream le;
        write_s64le(&le, value);
        le.seek(0, seek_origin::set);
        CHECK(read_s64le(&le) == value);

        memory_io_stream be;
        write_s64be(&be, value);
        be.seek(0, seek_origin::set);
        CHECK(read_s64be(&be) == value);
    }

    TEST_CASE("Unsigned extremes") {
        memory_io_stream stream;
        write_u16le(&stream, 0xFFFF);
        write_u32be(&stream, 0xFFFFFFFFu);
        write_u64le(&stream, std::numeric_limits<uint64_t>::max());
        write_u64be(&stream, 0x8000000000000000ull);

        stream.seek(0, seek_origin::set);
        CHECK(read_u16le(&stream) == 0xFFFF);
        CHECK(read_u32be(&stream) == 0xFFFFFFFFu);
        CHECK(read_u64le(&stream) == std::numeric_limits<uint64_t>::max());
        CHECK(read_u64be(&stream) == 0x8000000000000000ull);
    }
}

TEST_SUITE("Primitives::Float") {
    TEST_CASE("Floats use the host layout") {
        const float value = -1234.5f;
        uint8_t native[4];
        std::memcpy(native, &value, sizeof(value));

        memory_io_stream stream;
        write_f32(&stream, value);
        CHECK(stream.data() == to_vector(native, 4));
        CHECK(stream.write_calls() == 4);

        stream.seek(0, seek_origin::set);
        CHECK(read_f32(&stream) == value);
    }

    TEST_CASE("Doubles use the host layout") {
        const double value = 6.02214076e23;
        uint8_t native[8];
        std::memcpy(native, &value, sizeof(value));

        memory_io_stream stream;
        write_f64(&stream, value);
        CHECK(stream.data() == to_vector(native, 8));

        stream.seek(0, seek_origin::set);
        CHECK(read_f64(&stream) == value);
    }

    TEST_CASE("Special values survive") {
        memory_io_stream stream;
        write_f32(&stream, std::numeric_limits<float>::infinity());
        write_f32(&stream, -0.0f);
        write_f64(&stream, std::numeric_limits<double>::quiet_NaN());
        write_f64(&stream, std::numeric_limits<double>::denorm_min());

        stream.seek(0, seek_origin::set);
        CHECK(read_f32(&stream) == std::numeric_limits<float>::infinity());
        const float neg_zero = read_f32(&stream);
        CHECK(bit_cast<uint32_t>(neg_zero) == 0x80000000u);
        const double nan = read_f64(&stream);
        CHECK(nan != nan);
        CHECK(read_f64(&stream) == std::numeric_limits<double>::denorm_min());
    }
}

TEST_SUITE("Primitives::Errors") {
    TEST_CASE("Truncated input raises end_of_stream_error") {
        const std::vector<uint8_t> three = {1, 2, 3};

        memory_io_stream s16(std::vector<uint8_t>{1});
        CHECK_THROWS_AS(read_u16be(&s16), end_of_stream_error);

        memory_io_stream s32(three);
        CHECK_THROWS_AS(read_s32le(&s32), end_of_stream_error);

        memory_io_stream s64(std::vector<uint8_t>(7, 0));
        CHECK_THROWS_AS(read_u64be(&s64), end_of_stream_error);

        memory_io_stream f32(three);
        CHECK_THROWS_AS(read_f32(&f32), end_of_stream_error);

        memory_io_stream f64(std::vector<uint8_t>(7, 0));
        CHECK_THROWS_AS(read_f64(&f64), end_of_stream_error);
    }

    TEST_CASE("Partial reads do not disturb multi-byte values") {
        memory_io_stream source;
        write_u64be(&source, 0x0102030405060708ull);
        write_u32le(&source, 0xCAFEBABEu);

        trickle_stream stream(source.data(), 3);
        CHECK(read_u64be(&stream) == 0x0102030405060708ull);
        CHECK(read_u32le(&stream) == 0xCAFEBABEu);
    }

    TEST_CASE("Rejected writes raise io_error") {
        limited_sink sink(3);
        CHECK_THROWS_AS(write_u32be(&sink, 1), io_error);
        CHECK(sink.data().size() == 3);
    }
}
