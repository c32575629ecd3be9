#include <byteio/transfer.hh>
#include <byteio/byte_io.hh>
#include <byteio/error.hh>
#include <byteio/byteio_config.h>

#include <failsafe/failsafe.hh>

#include "checks.hh"
#include "stream_guard.hh"

namespace byteio {
    static_assert(BYTEIO_DEFAULT_COPY_BUFFER_SIZE > 0, "copy_stream needs a non-zero default buffer");

    uint64 copy_stream(io_stream* source, io_stream* dest, bool dispose_after, bool rewind_source, size buffer_size) {
        if (!source || !dest) {
            throw argument_error("copy_stream: source and destination streams are required");
        }
        detail::require_count(buffer_size, "buffer size", "copy_stream");
        if (buffer_size == 0) {
            buffer_size = BYTEIO_DEFAULT_COPY_BUFFER_SIZE;
        }

        // From here on both streams are released however we leave
        stream_guard guard(source, dest, dispose_after);

        if (rewind_source && source->seek(0, seek_origin::set) != 0) {
            LOG_ERROR("byteio", "copy_stream: could not rewind source stream");
            throw io_error("copy_stream: could not rewind source stream");
        }

        byte_buffer chunk(buffer_size);
        uint64 total = 0;
        while (true) {
            const size read = detail::read_some(source, chunk.data(), chunk.size());
            if (read == 0) {
                break;
            }
            write_bytes(dest, chunk.data(), read);
            total += read;
        }

        LOG_DEBUG("byteio", "copy_stream: copied ", total, " bytes");
        return total;
    }

    uint64 process_stream(io_stream* stream, const chunk_handler& handler, size chunk_size) {
        detail::require_stream(stream, "process_stream");
        if (!handler) {
            throw argument_error("process_stream: chunk handler is empty");
        }
        if (chunk_size == 0) {
            throw argument_error("process_stream: chunk size must be positive");
        }
        detail::require_count(chunk_size, "chunk size", "process_stream");

        byte_buffer chunk(chunk_size);
        uint64 total = 0;
        while (true) {
            const size read = detail::read_some(stream, chunk.data(), chunk.size());
            if (read == 0) {
                break;
            }
            total += read;
            if (!handler(chunk.data(), read)) {
                break;
            }
        }
        return total;
    }
}
