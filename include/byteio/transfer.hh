/**
 * @file transfer.hh
 * @brief Whole-stream copy and chunked processing
 * @ingroup byteio_transfer
 */

#ifndef BYTEIO_TRANSFER_HH
#define BYTEIO_TRANSFER_HH

#include <byteio/io_stream.hh>
#include <byteio/export_byteio.h>
#include <functional>

namespace byteio {

/**
 * @brief Callback invoked by process_stream() for every non-empty chunk
 *
 * Receives the chunk and its length; returns false to stop processing.
 * The data pointer refers to a buffer that is reused for the next chunk
 * and must not be retained after the call returns.
 */
using chunk_handler = std::function<bool(const uint8* data, size length)>;

/**
 * @brief Copy everything left in @p source into @p dest
 *
 * Reads up to @p buffer_size bytes at a time and writes each chunk in
 * full until a read returns 0.
 *
 * @param source Stream to read from
 * @param dest Stream to write to
 * @param dispose_after Close both streams when the copy finishes or fails.
 *        A stream passed as both source and dest is closed once.
 * @param rewind_source Seek @p source to position 0 before copying
 * @param buffer_size Chunk size; 0 selects BYTEIO_DEFAULT_COPY_BUFFER_SIZE
 * @return Number of bytes copied
 *
 * @throws argument_error if @p source or @p dest is null or @p buffer_size is
 *         negative when converted from a signed value (nothing is closed)
 * @throws io_error if the rewind fails or @p dest accepts fewer bytes than given
 *
 * @code
 * // Append a cached blob to an open socket and release both afterwards
 * auto copied = copy_stream(cache.get(), socket.get(), true);
 * @endcode
 */
BYTEIO_EXPORT uint64 copy_stream(io_stream* source, io_stream* dest,
                                 bool dispose_after = false,
                                 bool rewind_source = false,
                                 size buffer_size = 0);

/**
 * @brief Feed a stream to @p handler in chunks of at most @p chunk_size bytes
 *
 * Stops when a read returns 0 or the handler returns false.
 *
 * @return Total number of bytes passed to the handler
 * @throws argument_error if @p stream is null, @p handler is empty or
 *         @p chunk_size is 0 or negative
 */
BYTEIO_EXPORT uint64 process_stream(io_stream* stream, const chunk_handler& handler, size chunk_size);

} // namespace byteio

#endif // BYTEIO_TRANSFER_HH
