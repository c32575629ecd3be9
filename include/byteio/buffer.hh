/**
 * @file buffer.hh
 * @brief Owning contiguous buffer for stream data
 * @ingroup byteio
 */

#pragma once

#include <byteio/types.hh>

#include <algorithm>
#include <cstring>
#include <memory>
#include <type_traits>
#include <stdexcept>
#include <utility>

namespace byteio {
    /**
     * @class buffer
     * @brief RAII heap buffer with explicit size
     * @tparam T Element type (must be trivially copyable)
     * @ingroup byteio
     *
     * Returned by the allocating reads (read_bytes(), read_all_bytes())
     * and used as scratch space inside copy_stream(), process_stream()
     * and skip(). The buffer is exclusively owned: it can be moved out
     * of a function but never copied.
     *
     * - Size equals capacity; growing or trimming goes through resize()
     * - New elements are zero-initialized
     *
     * @code
     * byte_buffer header = read_bytes(stream, 12);
     * if (header[0] != 'R') {
     *     // ...
     * }
     * @endcode
     */
    template<typename T>
    class buffer final {
        static_assert(std::is_trivially_copyable_v<T>, "buffer<T> requires trivially copyable T");
    public:
        /**
         * @brief Construct buffer with specified size
         * @param size Number of elements
         *
         * Allocates memory and zero-initializes all elements.
         */
        explicit buffer(std::size_t size = 0)
            : m_data(std::make_unique<T[]>(size)), m_size(size) {
        }

        /**
         * @brief Construct buffer holding a copy of existing data
         * @param src Source elements
         * @param count Number of elements to copy
         */
        buffer(const T* src, std::size_t count)
            : m_data(std::make_unique<T[]>(count)), m_size(count) {
            if (count > 0) {
                std::memcpy(m_data.get(), src, sizeof(T) * count);
            }
        }

        buffer(buffer&& other) noexcept
            : m_data(std::move(other.m_data)), m_size(other.m_size) {
            other.m_size = 0;
        }

        buffer& operator=(buffer&& other) noexcept {
            if (this != &other) {
                m_data = std::move(other.m_data);
                m_size = other.m_size;
                other.m_size = 0;
            }
            return *this;
        }

        buffer(const buffer&) = delete;
        buffer& operator=(const buffer&) = delete;

        [[nodiscard]] std::size_t size() const noexcept {
            return m_size;
        }

        [[nodiscard]] bool empty() const noexcept {
            return m_size == 0;
        }

        T* data() noexcept { return m_data.get(); }
        const T* data() const noexcept { return m_data.get(); }

        /**
         * @brief Bounds-checked element access
         * @throws std::out_of_range if pos >= size()
         */
        T& at(std::size_t pos) {
            if (pos >= m_size) throw std::out_of_range("buffer index out of range");
            return m_data[pos];
        }

        const T& at(std::size_t pos) const {
            if (pos >= m_size) throw std::out_of_range("buffer index out of range");
            return m_data[pos];
        }

        /**
         * @brief Resize buffer preserving data
         * @param new_size New number of elements
         *
         * Preserves existing elements up to min(old_size, new_size).
         * New elements are zero-initialized. Always reallocates, so a
         * shrink releases the tail.
         */
        void resize(std::size_t new_size) {
            auto new_data = std::make_unique<T[]>(new_size);
            const std::size_t keep = std::min(new_size, m_size);
            if (keep > 0) {
                std::memcpy(new_data.get(), m_data.get(), sizeof(T) * keep);
            }
            m_data.swap(new_data);
            m_size = new_size;
        }

        void swap(buffer& other) noexcept {
            m_data.swap(other.m_data);
            std::swap(m_size, other.m_size);
        }

        // Unchecked access
        T& operator[](std::size_t pos) noexcept { return m_data[pos]; }
        const T& operator[](std::size_t pos) const noexcept { return m_data[pos]; }

        T* begin() noexcept { return data(); }
        T* end() noexcept { return data() + size(); }
        const T* begin() const noexcept { return data(); }
        const T* end() const noexcept { return data() + size(); }

    private:
        std::unique_ptr<T[]> m_data;  ///< Buffer data
        std::size_t m_size;            ///< Number of elements
    };

    /// Byte buffer produced by the reading functions
    using byte_buffer = buffer<uint8>;
}
