// This is copyrighted software. More information is at the end of this file.
#pragma once

#include <byteio/export_byteio.h>
#include <cstddef>
#include <stdexcept>
#include <string>

namespace byteio {

/**
 * @brief Base exception class for all byteio errors
 *
 * All byteio-specific exceptions derive from this class, making it easy
 * to catch all byteio errors with a single catch block.
 */
class BYTEIO_EXPORT byteio_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Invalid argument passed to a byteio function
 *
 * Thrown before any I/O is attempted, such as:
 * - Null stream, buffer or handler
 * - Negative byte count
 * - Offset and length outside the destination buffer
 * - Zero chunk size
 */
class BYTEIO_EXPORT argument_error : public byteio_error {
public:
    using byteio_error::byteio_error;
};

/**
 * @brief I/O stream related errors
 *
 * Thrown when the stream refuses an operation, such as:
 * - Short write
 * - Seek failure
 */
class BYTEIO_EXPORT io_error : public byteio_error {
public:
    using byteio_error::byteio_error;
};

/**
 * @brief The stream ended before the requested bytes were available
 *
 * The bytes that were available have already been consumed when this
 * is thrown; the stream is left partially advanced.
 */
class BYTEIO_EXPORT end_of_stream_error : public io_error {
public:
    end_of_stream_error()
        : io_error("unexpected end of stream") {}

    end_of_stream_error(std::size_t requested, std::size_t available)
        : io_error("unexpected end of stream: requested " + std::to_string(requested)
                   + " bytes, got " + std::to_string(available))
        , m_requested(requested)
        , m_available(available) {}

    std::size_t requested() const { return m_requested; }
    std::size_t available() const { return m_available; }

private:
    std::size_t m_requested = 0;
    std::size_t m_available = 0;
};

} // namespace byteio

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
