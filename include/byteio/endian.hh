#ifndef BYTEIO_ENDIAN_HH
#define BYTEIO_ENDIAN_HH

#include <byteio/types.hh>
#include <byteio/byteio_config.h>
#include <cstring>
#include <type_traits>

namespace byteio {

// Platform endianness detection using CMake-generated config
#if BYTEIO_BIG_ENDIAN
    constexpr bool is_big_endian = true;
    constexpr bool is_little_endian = false;
#else
    constexpr bool is_big_endian = false;
    constexpr bool is_little_endian = true;
#endif

// Reinterpret the object representation of one trivially copyable type as another
template<typename To, typename From>
inline To bit_cast(const From& from) {
    static_assert(sizeof(To) == sizeof(From), "bit_cast requires equally sized types");
    static_assert(std::is_trivially_copyable_v<To> && std::is_trivially_copyable_v<From>,
                  "bit_cast requires trivially copyable types");
    To to;
    std::memcpy(&to, &from, sizeof(To));
    return to;
}

// Buffer decoders. Little-endian: first byte is least significant.
inline uint16 load_le16(const uint8* p) {
    return static_cast<uint16>(p[0] | (p[1] << 8));
}

inline uint32 load_le32(const uint8* p) {
    return static_cast<uint32>(p[0]) |
           (static_cast<uint32>(p[1]) << 8) |
           (static_cast<uint32>(p[2]) << 16) |
           (static_cast<uint32>(p[3]) << 24);
}

// 64-bit values are assembled from an unsigned low and high half
inline uint64 load_le64(const uint8* p) {
    return static_cast<uint64>(load_le32(p)) |
           (static_cast<uint64>(load_le32(p + 4)) << 32);
}

// Big-endian: first byte is most significant
inline uint16 load_be16(const uint8* p) {
    return static_cast<uint16>((p[0] << 8) | p[1]);
}

inline uint32 load_be32(const uint8* p) {
    return (static_cast<uint32>(p[0]) << 24) |
           (static_cast<uint32>(p[1]) << 16) |
           (static_cast<uint32>(p[2]) << 8) |
           static_cast<uint32>(p[3]);
}

inline uint64 load_be64(const uint8* p) {
    return (static_cast<uint64>(load_be32(p)) << 32) |
           static_cast<uint64>(load_be32(p + 4));
}

// Buffer encoders
inline void store_le16(uint8* p, uint16 v) {
    p[0] = static_cast<uint8>(v);
    p[1] = static_cast<uint8>(v >> 8);
}

inline void store_le32(uint8* p, uint32 v) {
    p[0] = static_cast<uint8>(v);
    p[1] = static_cast<uint8>(v >> 8);
    p[2] = static_cast<uint8>(v >> 16);
    p[3] = static_cast<uint8>(v >> 24);
}

inline void store_le64(uint8* p, uint64 v) {
    store_le32(p, static_cast<uint32>(v));
    store_le32(p + 4, static_cast<uint32>(v >> 32));
}

inline void store_be16(uint8* p, uint16 v) {
    p[0] = static_cast<uint8>(v >> 8);
    p[1] = static_cast<uint8>(v);
}

inline void store_be32(uint8* p, uint32 v) {
    p[0] = static_cast<uint8>(v >> 24);
    p[1] = static_cast<uint8>(v >> 16);
    p[2] = static_cast<uint8>(v >> 8);
    p[3] = static_cast<uint8>(v);
}

inline void store_be64(uint8* p, uint64 v) {
    store_be32(p, static_cast<uint32>(v >> 32));
    store_be32(p + 4, static_cast<uint32>(v));
}

// Host byte order, used for float/double bit patterns
inline uint32 load_native32(const uint8* p) {
    return is_little_endian ? load_le32(p) : load_be32(p);
}

inline uint64 load_native64(const uint8* p) {
    return is_little_endian ? load_le64(p) : load_be64(p);
}

inline void store_native32(uint8* p, uint32 v) {
    if (is_little_endian) {
        store_le32(p, v);
    } else {
        store_be32(p, v);
    }
}

inline void store_native64(uint8* p, uint64 v) {
    if (is_little_endian) {
        store_le64(p, v);
    } else {
        store_be64(p, v);
    }
}

} // namespace byteio

#endif // BYTEIO_ENDIAN_HH
