// This is copyrighted software. More information is at the end of this file.
#ifndef BYTEIO_STREAM_GUARD_HH
#define BYTEIO_STREAM_GUARD_HH

#include <byteio/io_stream.hh>

namespace byteio {

    // RAII guard closing up to two streams when it goes out of scope.
    // A stream given twice is closed once.
    class stream_guard {
    public:
        stream_guard(io_stream* first, io_stream* second, bool armed)
            : m_first(armed ? first : nullptr)
            , m_second(armed && second != first ? second : nullptr) {
        }

        ~stream_guard() {
            close();
        }

        stream_guard(const stream_guard&) = delete;
        stream_guard& operator=(const stream_guard&) = delete;
        stream_guard(stream_guard&&) = delete;
        stream_guard& operator=(stream_guard&&) = delete;

        // Called automatically in destructor
        void close() {
            if (m_first) {
                m_first->close();
                m_first = nullptr;
            }
            if (m_second) {
                m_second->close();
                m_second = nullptr;
            }
        }

    private:
        io_stream* m_first;
        io_stream* m_second;
    };
}

#endif

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
