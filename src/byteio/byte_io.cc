// This is copyrighted software. More information is at the end of this file.
#include <byteio/byte_io.hh>
#include <byteio/error.hh>
#include <byteio/byteio_config.h>

#include <failsafe/failsafe.hh>

#include "checks.hh"

#include <algorithm>
#include <limits>
#include <string>

namespace byteio {
    static_assert(BYTEIO_READ_ALL_INITIAL_CAPACITY > 0, "read_all_bytes needs a non-zero starting capacity");
    static_assert(BYTEIO_SKIP_BLOCK_SIZE > 0, "skip needs a non-zero block size");

    namespace detail {
        size read_some(io_stream* stream, uint8* dst, size length) {
            const size got = stream->read(dst, length);
            if (got > length) {
                LOG_ERROR("byteio", "io_stream::read returned ", got, " bytes for a request of ", length);
                throw io_error("io_stream::read returned " + std::to_string(got)
                               + " bytes for a request of " + std::to_string(length));
            }
            return got;
        }

        void require_stream(const io_stream* stream, const char* fn) {
            if (!stream) {
                throw argument_error(std::string(fn) + ": stream is null");
            }
        }

        void require_count(size count, const char* what, const char* fn) {
            if (count > static_cast<size>(std::numeric_limits<ptrdiff>::max())) {
                throw argument_error(std::string(fn) + ": " + what + " cannot be negative");
            }
        }
    }

    namespace {
        using detail::read_some;
        using detail::require_stream;
        using detail::require_count;

        void require_range(const byte_buffer& buf, size offset, size length, const char* fn) {
            if (offset > buf.size() || length > buf.size() - offset) {
                throw argument_error(std::string(fn) + ": range [" + std::to_string(offset) + ", +"
                                     + std::to_string(length) + ") exceeds buffer of "
                                     + std::to_string(buf.size()) + " bytes");
            }
        }

        // Stops short only at end of stream
        size fill(io_stream* stream, uint8* dst, size length) {
            size total = 0;
            while (total < length) {
                const size got = read_some(stream, dst + total, length - total);
                if (got == 0) {
                    break;
                }
                total += got;
            }
            return total;
        }

        size fill_exact(io_stream* stream, uint8* dst, size length) {
            const size got = fill(stream, dst, length);
            if (got != length) {
                throw end_of_stream_error(length, got);
            }
            return got;
        }

        // Next byte value, or -1 at end of stream
        int next_byte(io_stream* stream) {
            uint8 value = 0;
            return read_some(stream, &value, 1) == 1 ? static_cast<int>(value) : -1;
        }
    }

    size read_exact(io_stream* stream, void* ptr, size length) {
        require_stream(stream, "read_exact");
        require_count(length, "length", "read_exact");
        if (!ptr && length > 0) {
            throw argument_error("read_exact: destination is null");
        }
        return fill_exact(stream, static_cast<uint8*>(ptr), length);
    }

    size read_exact(io_stream* stream, byte_buffer& buf, size offset, size length) {
        require_stream(stream, "read_exact");
        require_range(buf, offset, length, "read_exact");
        return fill_exact(stream, buf.data() + offset, length);
    }

    size try_read_exact(io_stream* stream, void* ptr, size length) {
        require_stream(stream, "try_read_exact");
        require_count(length, "length", "try_read_exact");
        if (!ptr && length > 0) {
            throw argument_error("try_read_exact: destination is null");
        }
        return fill(stream, static_cast<uint8*>(ptr), length);
    }

    size try_read_exact(io_stream* stream, byte_buffer& buf, size offset, size length) {
        require_stream(stream, "try_read_exact");
        require_range(buf, offset, length, "try_read_exact");
        return fill(stream, buf.data() + offset, length);
    }

    byte_buffer read_bytes(io_stream* stream, size length) {
        require_stream(stream, "read_bytes");
        require_count(length, "length", "read_bytes");
        byte_buffer buf(length);
        fill_exact(stream, buf.data(), length);
        return buf;
    }

    byte_buffer read_all_bytes(io_stream* stream) {
        require_stream(stream, "read_all_bytes");

        byte_buffer buf(BYTEIO_READ_ALL_INITIAL_CAPACITY);
        size used = 0;
        while (true) {
            if (used == buf.size()) {
                buf.resize(buf.size() * 2);
            }
            const size got = read_some(stream, buf.data() + used, buf.size() - used);
            if (got == 0) {
                break;
            }
            used += got;
        }

        if (used != buf.size()) {
            buf.resize(used);
        }
        return buf;
    }

    uint8 read_u8(io_stream* stream) {
        require_stream(stream, "read_u8");
        const int value = next_byte(stream);
        if (value < 0) {
            throw end_of_stream_error(1, 0);
        }
        return static_cast<uint8>(value);
    }

    void write_u8(io_stream* stream, uint8 value) {
        require_stream(stream, "write_u8");
        if (stream->write(&value, 1) != 1) {
            LOG_WARN("byteio", "write_u8: stream rejected the byte");
            throw io_error("write_u8: stream rejected the byte");
        }
    }

    size write_bytes(io_stream* stream, const void* ptr, size length) {
        require_stream(stream, "write_bytes");
        require_count(length, "length", "write_bytes");
        if (!ptr && length > 0) {
            throw argument_error("write_bytes: source is null");
        }
        if (length == 0) {
            return 0;
        }
        const size written = stream->write(ptr, length);
        if (written != length) {
            LOG_WARN("byteio", "write_bytes: short write, ", written, " of ", length, " bytes");
            throw io_error("write_bytes: short write, " + std::to_string(written) + " of "
                           + std::to_string(length) + " bytes");
        }
        return length;
    }

    size write_bytes(io_stream* stream, const byte_buffer& data) {
        return write_bytes(stream, data.data(), data.size());
    }

    void skip(io_stream* stream, int64 byte_count) {
        require_stream(stream, "skip");
        if (byte_count < 0) {
            throw argument_error("skip: byte count cannot be negative");
        }
        if (byte_count == 0) {
            return;
        }

        if (stream->can_seek()) {
            if (stream->seek(byte_count, seek_origin::cur) < 0) {
                LOG_ERROR("byteio", "skip: seek forward by ", byte_count, " bytes failed");
                throw io_error("skip: seek forward by " + std::to_string(byte_count) + " bytes failed");
            }
            return;
        }

        if (byte_count <= BYTEIO_SKIP_BYTEWISE_LIMIT) {
            for (int64 i = 0; i < byte_count; ++i) {
                if (next_byte(stream) < 0) {
                    throw end_of_stream_error(static_cast<size>(byte_count), static_cast<size>(i));
                }
            }
            return;
        }

        byte_buffer scratch(BYTEIO_SKIP_BLOCK_SIZE);
        int64 remaining = byte_count;
        while (remaining > 0) {
            const auto want = static_cast<size>(std::min<int64>(remaining, static_cast<int64>(scratch.size())));
            const size got = read_some(stream, scratch.data(), want);
            if (got == 0) {
                throw end_of_stream_error(static_cast<size>(byte_count),
                                          static_cast<size>(byte_count - remaining));
            }
            remaining -= static_cast<int64>(got);
        }
    }
}

/*
 * Copyright (C) 2025
 *
 * This file is part of byteio.
 *
 * byteio is free software: you can redistribute it and/or modify it under the
 * terms of the GNU Lesser General Public License as published by the Free
 * Software Foundation, either version 3 of the License, or (at your option) any
 * later version.
 *
 * byteio is distributed in the hope that it will be useful, but WITHOUT ANY
 * WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR
 * A PARTICULAR PURPOSE.  See the GNU Lesser General Public License for more
 * details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with byteio.  If not, see <http://www.gnu.org/licenses/>.
 */
