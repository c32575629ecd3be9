/**
 * @file byte_io.hh
 * @brief Exact, unbounded and raw byte reads/writes, and forward skip
 * @ingroup byteio_bytes
 */

#ifndef BYTEIO_BYTE_IO_HH
#define BYTEIO_BYTE_IO_HH

#include <byteio/io_stream.hh>
#include <byteio/buffer.hh>
#include <byteio/export_byteio.h>

namespace byteio {

/**
 * @defgroup byteio_bytes Byte-level stream helpers
 * @brief Reading exact byte counts, draining streams and skipping data
 *
 * All argument checks happen before the stream is touched. A length
 * above PTRDIFF_MAX is a negative value that was converted to size and
 * raises argument_error. A function that throws end_of_stream_error has
 * already consumed whatever the stream still had.
 *
 * @{
 */

/**
 * @brief Read exactly @p length bytes into @p ptr
 *
 * Keeps calling io_stream::read() until the request is satisfied.
 *
 * @return @p length
 * @throws argument_error if @p stream or @p ptr is null
 * @throws end_of_stream_error if the stream ends first
 */
BYTEIO_EXPORT size read_exact(io_stream* stream, void* ptr, size length);

/**
 * @brief Read exactly @p length bytes into @p buf at @p offset
 *
 * @throws argument_error if @p stream is null or offset + length exceeds buf.size()
 * @throws end_of_stream_error if the stream ends first
 */
BYTEIO_EXPORT size read_exact(io_stream* stream, byte_buffer& buf, size offset, size length);

/**
 * @brief Read up to @p length bytes, stopping early only at end of stream
 *
 * Unlike io_stream::read(), a short count here always means the stream
 * is exhausted.
 *
 * @return Number of bytes read
 * @throws argument_error if @p stream or @p ptr is null
 */
BYTEIO_EXPORT size try_read_exact(io_stream* stream, void* ptr, size length);

/**
 * @brief Tolerant variant of read_exact(io_stream*, byte_buffer&, size, size)
 */
BYTEIO_EXPORT size try_read_exact(io_stream* stream, byte_buffer& buf, size offset, size length);

/**
 * @brief Read exactly @p length bytes into a new buffer
 * @throws argument_error if @p stream is null or @p length is negative
 * @throws end_of_stream_error if the stream ends first
 */
BYTEIO_EXPORT byte_buffer read_bytes(io_stream* stream, size length);

/**
 * @brief Read everything left in the stream
 *
 * Starts with BYTEIO_READ_ALL_INITIAL_CAPACITY bytes and doubles the
 * buffer every time it fills. The result is trimmed to the bytes read.
 */
BYTEIO_EXPORT byte_buffer read_all_bytes(io_stream* stream);

/**
 * @brief Read a single byte
 * @throws end_of_stream_error if no data is left
 */
BYTEIO_EXPORT uint8 read_u8(io_stream* stream);

/**
 * @brief Write a single byte
 * @throws io_error if the stream does not accept it
 */
BYTEIO_EXPORT void write_u8(io_stream* stream, uint8 value);

/**
 * @brief Write a run of bytes
 * @return @p length
 * @throws io_error on a short write
 */
BYTEIO_EXPORT size write_bytes(io_stream* stream, const void* ptr, size length);

BYTEIO_EXPORT size write_bytes(io_stream* stream, const byte_buffer& data);

/**
 * @brief Advance the read position by @p byte_count bytes
 *
 * Seekable streams are repositioned directly. Other streams are drained:
 * byte by byte for up to BYTEIO_SKIP_BYTEWISE_LIMIT bytes, otherwise in
 * BYTEIO_SKIP_BLOCK_SIZE blocks.
 *
 * @throws argument_error if @p byte_count is negative or @p stream is null
 * @throws io_error if a seekable stream rejects the seek
 * @throws end_of_stream_error if a drained stream ends first
 */
BYTEIO_EXPORT void skip(io_stream* stream, int64 byte_count);

/** @} */

} // namespace byteio

#endif // BYTEIO_BYTE_IO_HH
