#include <byteio/primitives.hh>
#include <byteio/byte_io.hh>
#include <byteio/endian.hh>

namespace byteio {
    // Multi-byte reads pull bytes one by one. Each byte is fetched in its
    // own statement: the operands of | are unsequenced.

    uint16 read_u16le(io_stream* stream) {
        const uint16 b0 = read_u8(stream);
        const uint16 b1 = read_u8(stream);
        return static_cast<uint16>(b0 | (b1 << 8));
    }

    uint16 read_u16be(io_stream* stream) {
        const uint16 b0 = read_u8(stream);
        const uint16 b1 = read_u8(stream);
        return static_cast<uint16>((b0 << 8) | b1);
    }

    int16 read_s16le(io_stream* stream) {
        return static_cast<int16>(read_u16le(stream));
    }

    int16 read_s16be(io_stream* stream) {
        return static_cast<int16>(read_u16be(stream));
    }

    uint32 read_u32le(io_stream* stream) {
        uint8 b[4];
        for (auto& v : b) {
            v = read_u8(stream);
        }
        return load_le32(b);
    }

    uint32 read_u32be(io_stream* stream) {
        uint8 b[4];
        for (auto& v : b) {
            v = read_u8(stream);
        }
        return load_be32(b);
    }

    int32 read_s32le(io_stream* stream) {
        return static_cast<int32>(read_u32le(stream));
    }

    int32 read_s32be(io_stream* stream) {
        return static_cast<int32>(read_u32be(stream));
    }

    // 64-bit values: one exact read, then two 32-bit halves. Both halves are
    // combined unsigned so the low half never sign-extends into the high one;
    // the signed variants reinterpret the finished pattern.
    uint64 read_u64le(io_stream* stream) {
        uint8 b[8];
        read_exact(stream, b, sizeof(b));
        return load_le64(b);
    }

    uint64 read_u64be(io_stream* stream) {
        uint8 b[8];
        read_exact(stream, b, sizeof(b));
        return load_be64(b);
    }

    int64 read_s64le(io_stream* stream) {
        return static_cast<int64>(read_u64le(stream));
    }

    int64 read_s64be(io_stream* stream) {
        return static_cast<int64>(read_u64be(stream));
    }

    float read_f32(io_stream* stream) {
        uint8 b[4];
        for (auto& v : b) {
            v = read_u8(stream);
        }
        return bit_cast<float>(load_native32(b));
    }

    double read_f64(io_stream* stream) {
        uint8 b[8];
        read_exact(stream, b, sizeof(b));
        return bit_cast<double>(load_native64(b));
    }

    void write_u16le(io_stream* stream, uint16 value) {
        write_u8(stream, static_cast<uint8>(value));
        write_u8(stream, static_cast<uint8>(value >> 8));
    }

    void write_u16be(io_stream* stream, uint16 value) {
        write_u8(stream, static_cast<uint8>(value >> 8));
        write_u8(stream, static_cast<uint8>(value));
    }

    void write_s16le(io_stream* stream, int16 value) {
        write_u16le(stream, static_cast<uint16>(value));
    }

    void write_s16be(io_stream* stream, int16 value) {
        write_u16be(stream, static_cast<uint16>(value));
    }

    void write_u32le(io_stream* stream, uint32 value) {
        write_u8(stream, static_cast<uint8>(value));
        write_u8(stream, static_cast<uint8>(value >> 8));
        write_u8(stream, static_cast<uint8>(value >> 16));
        write_u8(stream, static_cast<uint8>(value >> 24));
    }

    void write_u32be(io_stream* stream, uint32 value) {
        write_u8(stream, static_cast<uint8>(value >> 24));
        write_u8(stream, static_cast<uint8>(value >> 16));
        write_u8(stream, static_cast<uint8>(value >> 8));
        write_u8(stream, static_cast<uint8>(value));
    }

    void write_s32le(io_stream* stream, int32 value) {
        write_u32le(stream, static_cast<uint32>(value));
    }

    void write_s32be(io_stream* stream, int32 value) {
        write_u32be(stream, static_cast<uint32>(value));
    }

    void write_u64le(io_stream* stream, uint64 value) {
        write_u32le(stream, static_cast<uint32>(value));
        write_u32le(stream, static_cast<uint32>(value >> 32));
    }

    void write_u64be(io_stream* stream, uint64 value) {
        write_u32be(stream, static_cast<uint32>(value >> 32));
        write_u32be(stream, static_cast<uint32>(value));
    }

    void write_s64le(io_stream* stream, int64 value) {
        write_u64le(stream, static_cast<uint64>(value));
    }

    void write_s64be(io_stream* stream, int64 value) {
        write_u64be(stream, static_cast<uint64>(value));
    }

    void write_f32(io_stream* stream, float value) {
        uint8 b[4];
        store_native32(b, bit_cast<uint32>(value));
        for (auto v : b) {
            write_u8(stream, v);
        }
    }

    void write_f64(io_stream* stream, double value) {
        uint8 b[8];
        store_native64(b, bit_cast<uint64>(value));
        write_bytes(stream, b, sizeof(b));
    }
}
