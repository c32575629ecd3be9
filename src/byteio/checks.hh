#ifndef BYTEIO_CHECKS_HH
#define BYTEIO_CHECKS_HH

#include <byteio/io_stream.hh>

namespace byteio::detail {
    // One io_stream::read() call. Throws io_error if the stream reports
    // more bytes than were requested.
    size read_some(io_stream* stream, uint8* dst, size length);

    void require_stream(const io_stream* stream, const char* fn);

    // Rejects counts that are negative when seen as signed, such as a
    // caller's -1 converted to size.
    void require_count(size count, const char* what, const char* fn);
}

#endif
