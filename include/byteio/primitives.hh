/**
 * @file primitives.hh
 * @brief Endian-explicit integer and native floating-point stream codecs
 * @ingroup byteio_primitives
 */

#ifndef BYTEIO_PRIMITIVES_HH
#define BYTEIO_PRIMITIVES_HH

#include <byteio/io_stream.hh>
#include <byteio/export_byteio.h>

namespace byteio {

/**
 * @defgroup byteio_primitives Primitive codecs
 * @brief Fixed-width numbers in explicit byte order
 *
 * The `le` functions put the least significant byte first, the `be`
 * functions the most significant byte first, independent of the host.
 * Reads throw end_of_stream_error when the stream runs dry; writes throw
 * io_error when the stream rejects a byte.
 *
 * @code
 * // RIFF chunk header
 * uint32 id = read_u32be(stream);
 * uint32 length = read_u32le(stream);
 * @endcode
 *
 * Floating-point values have no byte-order variant: they are stored in
 * the host's native IEEE-754 layout.
 *
 * @{
 */

/**
 * @brief Read unsigned 16-bit little-endian value
 * @param stream Stream to read from
 * @return Value read (converted to native endian)
 * @throws end_of_stream_error if fewer than 2 bytes are left
 */
BYTEIO_EXPORT uint16 read_u16le(io_stream* stream);

/**
 * @brief Read unsigned 16-bit big-endian value
 * @param stream Stream to read from
 * @return Value read (converted to native endian)
 * @throws end_of_stream_error if fewer than 2 bytes are left
 */
BYTEIO_EXPORT uint16 read_u16be(io_stream* stream);

/**
 * @brief Read signed 16-bit little-endian value
 * @param stream Stream to read from
 * @return Value read (converted to native endian)
 * @throws end_of_stream_error if fewer than 2 bytes are left
 */
BYTEIO_EXPORT int16 read_s16le(io_stream* stream);

/**
 * @brief Read signed 16-bit big-endian value
 * @param stream Stream to read from
 * @return Value read (converted to native endian)
 * @throws end_of_stream_error if fewer than 2 bytes are left
 */
BYTEIO_EXPORT int16 read_s16be(io_stream* stream);

/**
 * @brief Read unsigned 32-bit little-endian value
 * @param stream Stream to read from
 * @return Value read (converted to native endian)
 * @throws end_of_stream_error if fewer than 4 bytes are left
 *
 * @code
 * // WAV "fmt " chunk length
 * uint32 chunk_size = read_u32le(stream);
 * @endcode
 */
BYTEIO_EXPORT uint32 read_u32le(io_stream* stream);

/**
 * @brief Read unsigned 32-bit big-endian value
 * @param stream Stream to read from
 * @return Value read (converted to native endian)
 * @throws end_of_stream_error if fewer than 4 bytes are left
 */
BYTEIO_EXPORT uint32 read_u32be(io_stream* stream);

/**
 * @brief Read signed 32-bit little-endian value
 * @param stream Stream to read from
 * @return Value read (converted to native endian)
 * @throws end_of_stream_error if fewer than 4 bytes are left
 */
BYTEIO_EXPORT int32 read_s32le(io_stream* stream);

/**
 * @brief Read signed 32-bit big-endian value
 * @param stream Stream to read from
 * @return Value read (converted to native endian)
 * @throws end_of_stream_error if fewer than 4 bytes are left
 */
BYTEIO_EXPORT int32 read_s32be(io_stream* stream);

/**
 * @brief Read unsigned 64-bit little-endian value
 * @param stream Stream to read from
 * @return Value read (converted to native endian)
 * @throws end_of_stream_error if fewer than 8 bytes are left
 */
BYTEIO_EXPORT uint64 read_u64le(io_stream* stream);

/**
 * @brief Read unsigned 64-bit big-endian value
 * @param stream Stream to read from
 * @return Value read (converted to native endian)
 * @throws end_of_stream_error if fewer than 8 bytes are left
 */
BYTEIO_EXPORT uint64 read_u64be(io_stream* stream);

/**
 * @brief Read signed 64-bit little-endian value
 * @param stream Stream to read from
 * @return Value read (converted to native endian)
 * @throws end_of_stream_error if fewer than 8 bytes are left
 *
 * Both 32-bit halves are combined unsigned before the sign is applied.
 */
BYTEIO_EXPORT int64 read_s64le(io_stream* stream);

/**
 * @brief Read signed 64-bit big-endian value
 * @param stream Stream to read from
 * @return Value read (converted to native endian)
 * @throws end_of_stream_error if fewer than 8 bytes are left
 *
 * Both 32-bit halves are combined unsigned before the sign is applied.
 */
BYTEIO_EXPORT int64 read_s64be(io_stream* stream);

/**
 * @brief Read a 32-bit float in native byte order
 * @param stream Stream to read from
 * @return Value read
 * @throws end_of_stream_error if fewer than 4 bytes are left
 */
BYTEIO_EXPORT float read_f32(io_stream* stream);

/**
 * @brief Read a 64-bit double in native byte order
 * @param stream Stream to read from
 * @return Value read
 * @throws end_of_stream_error if fewer than 8 bytes are left
 */
BYTEIO_EXPORT double read_f64(io_stream* stream);

/**
 * @brief Write unsigned 16-bit little-endian value
 * @param stream Stream to write to
 * @param value Value to write (native endian)
 * @throws io_error if the stream rejects a byte
 */
BYTEIO_EXPORT void write_u16le(io_stream* stream, uint16 value);

/**
 * @brief Write unsigned 16-bit big-endian value
 * @param stream Stream to write to
 * @param value Value to write (native endian)
 * @throws io_error if the stream rejects a byte
 */
BYTEIO_EXPORT void write_u16be(io_stream* stream, uint16 value);

/**
 * @brief Write signed 16-bit little-endian value
 * @param stream Stream to write to
 * @param value Value to write (native endian)
 * @throws io_error if the stream rejects a byte
 */
BYTEIO_EXPORT void write_s16le(io_stream* stream, int16 value);

/**
 * @brief Write signed 16-bit big-endian value
 * @param stream Stream to write to
 * @param value Value to write (native endian)
 * @throws io_error if the stream rejects a byte
 */
BYTEIO_EXPORT void write_s16be(io_stream* stream, int16 value);

/**
 * @brief Write unsigned 32-bit little-endian value
 * @param stream Stream to write to
 * @param value Value to write (native endian)
 * @throws io_error if the stream rejects a byte
 */
BYTEIO_EXPORT void write_u32le(io_stream* stream, uint32 value);

/**
 * @brief Write unsigned 32-bit big-endian value
 * @param stream Stream to write to
 * @param value Value to write (native endian)
 * @throws io_error if the stream rejects a byte
 */
BYTEIO_EXPORT void write_u32be(io_stream* stream, uint32 value);

/**
 * @brief Write signed 32-bit little-endian value
 * @param stream Stream to write to
 * @param value Value to write (native endian)
 * @throws io_error if the stream rejects a byte
 */
BYTEIO_EXPORT void write_s32le(io_stream* stream, int32 value);

/**
 * @brief Write signed 32-bit big-endian value
 * @param stream Stream to write to
 * @param value Value to write (native endian)
 * @throws io_error if the stream rejects a byte
 */
BYTEIO_EXPORT void write_s32be(io_stream* stream, int32 value);

/**
 * @brief Write unsigned 64-bit little-endian value
 * @param stream Stream to write to
 * @param value Value to write (native endian)
 * @throws io_error if the stream rejects a byte
 */
BYTEIO_EXPORT void write_u64le(io_stream* stream, uint64 value);

/**
 * @brief Write unsigned 64-bit big-endian value
 * @param stream Stream to write to
 * @param value Value to write (native endian)
 * @throws io_error if the stream rejects a byte
 */
BYTEIO_EXPORT void write_u64be(io_stream* stream, uint64 value);

/**
 * @brief Write signed 64-bit little-endian value
 * @param stream Stream to write to
 * @param value Value to write (native endian)
 * @throws io_error if the stream rejects a byte
 */
BYTEIO_EXPORT void write_s64le(io_stream* stream, int64 value);

/**
 * @brief Write signed 64-bit big-endian value
 * @param stream Stream to write to
 * @param value Value to write (native endian)
 * @throws io_error if the stream rejects a byte
 */
BYTEIO_EXPORT void write_s64be(io_stream* stream, int64 value);

/**
 * @brief Write a 32-bit float in native byte order
 * @param stream Stream to write to
 * @param value Value to write
 * @throws io_error if the stream rejects a byte
 */
BYTEIO_EXPORT void write_f32(io_stream* stream, float value);

/**
 * @brief Write a 64-bit double in native byte order
 * @param stream Stream to write to
 * @param value Value to write
 * @throws io_error on a short write
 */
BYTEIO_EXPORT void write_f64(io_stream* stream, double value);

/** @} */

} // namespace byteio

#endif // BYTEIO_PRIMITIVES_HH
