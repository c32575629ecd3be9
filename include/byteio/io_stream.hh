/**
 * @file io_stream.hh
 * @brief Binary I/O stream abstraction
 * @ingroup byteio_stream
 */

#ifndef BYTEIO_IO_STREAM_HH
#define BYTEIO_IO_STREAM_HH

#include <byteio/types.hh>

namespace byteio {

/**
 * @enum seek_origin
 * @brief Seek origin for stream positioning
 * @ingroup byteio_stream
 */
enum class seek_origin : int {
    set = 0,  ///< Seek from beginning of stream (SEEK_SET)
    cur = 1,  ///< Seek from current position (SEEK_CUR)
    end = 2   ///< Seek from end of stream (SEEK_END)
};

/**
 * @class io_stream
 * @brief Abstract sequential byte source/sink
 * @ingroup byteio_stream
 *
 * Every byteio operation works against this interface. byteio ships no
 * concrete stream: files, sockets and memory blocks are wrapped by the
 * caller. The caller owns the stream; byteio never deletes it and only
 * closes it when asked to (see copy_stream()).
 *
 * ## Implementing a stream
 *
 * @code
 * class file_stream : public io_stream {
 *     FILE* m_file;
 * public:
 *     size read(void* ptr, size size_bytes) override {
 *         return fread(ptr, 1, size_bytes, m_file);
 *     }
 *     bool can_seek() const override { return true; }
 *     // ... other methods
 * };
 * @endcode
 *
 * Streams that cannot position themselves (pipes, sockets) return false
 * from can_seek() and -1 from seek()/tell().
 *
 * @note byteio holds no locks. Access to a single stream must be
 *       serialized by the caller.
 */
class io_stream {
public:
    /**
     * @brief Virtual destructor
     */
    virtual ~io_stream() = default;

    /**
     * @brief Read binary data from stream
     *
     * @param ptr Buffer to read into
     * @param size_bytes Maximum number of bytes to read
     * @return Actual number of bytes read (may be less than requested)
     *
     * @note Returns 0 only at end of data. Returning more than
     *       size_bytes is a contract violation.
     */
    virtual size read(void* ptr, size size_bytes) = 0;

    /**
     * @brief Write binary data to stream
     *
     * @param ptr Data to write
     * @param size_bytes Number of bytes to write
     * @return Actual number of bytes written; anything below size_bytes
     *         is treated as a failed write
     */
    virtual size write(const void* ptr, size size_bytes) = 0;

    /**
     * @brief Seek to a position in the stream
     *
     * @param offset Byte offset from origin
     * @param whence Origin for seek operation
     * @return New position from start, or -1 on error
     */
    virtual int64 seek(int64 offset, seek_origin whence) = 0;

    /**
     * @brief Get current position in stream
     * @return Current byte position from start, or -1 on error
     */
    virtual int64 tell() = 0;

    /**
     * @brief Get total size of stream
     * @return Total size in bytes, or -1 if unknown/unlimited
     */
    virtual int64 get_size() = 0;

    /**
     * @brief Whether seek() and tell() position the stream
     */
    [[nodiscard]] virtual bool can_seek() const = 0;

    /**
     * @brief Release the stream
     * @note Must not throw and must tolerate repeated calls
     */
    virtual void close() = 0;

    /**
     * @brief Check if stream is open and usable
     * @return true if stream is open
     */
    [[nodiscard]] virtual bool is_open() const = 0;
};

} // namespace byteio

#endif // BYTEIO_IO_STREAM_HH
