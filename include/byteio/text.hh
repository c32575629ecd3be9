/**
 * @file text.hh
 * @brief Fixed-length text runs under a character encoding
 * @ingroup byteio_text
 */

#ifndef BYTEIO_TEXT_HH
#define BYTEIO_TEXT_HH

#include <byteio/io_stream.hh>
#include <byteio/export_byteio.h>
#include <string>
#include <string_view>
#include <vector>

namespace byteio {

/**
 * @class text_encoding
 * @brief Bidirectional byte <-> text codec
 * @ingroup byteio_text
 *
 * In-memory text is always UTF-8 in a std::string. An encoding converts
 * that text to its own byte representation and back. Characters the
 * encoding cannot represent are replaced according to its own rule;
 * encodings never throw on bad input.
 *
 * utf8_encoding() and ascii_encoding() are built in. Any other subclass
 * can be handed to read_string()/write_string().
 */
class BYTEIO_EXPORT text_encoding {
public:
    virtual ~text_encoding() = default;

    [[nodiscard]] virtual const char* name() const = 0;

    /**
     * @brief Convert encoded bytes to UTF-8 text
     */
    [[nodiscard]] virtual std::string decode(const uint8* data, size length) const = 0;

    /**
     * @brief Convert UTF-8 text to encoded bytes
     */
    [[nodiscard]] virtual std::vector<uint8> encode(std::string_view text) const = 0;
};

/**
 * @brief UTF-8; malformed sequences become U+FFFD in both directions
 *
 * Replacement works per announced sequence, not per byte:
 * - an invalid lead byte or a stray continuation byte gives one U+FFFD
 * - a sequence cut short by a non-continuation byte or the end of input
 *   gives one U+FFFD for the bytes taken so far, and decoding resumes at
 *   the byte that broke it
 * - a complete sequence that is overlong, a surrogate or above U+10FFFF
 *   gives one U+FFFD for the whole sequence
 *
 * So `E0 80 80` decodes to a single U+FFFD, and `E2 82 41` to U+FFFD "A".
 */
BYTEIO_EXPORT const text_encoding& utf8_encoding();

/**
 * @brief 7-bit ASCII; anything outside 0x00-0x7F becomes '?'
 *
 * Encoding "héllo" yields the 5 bytes "h?llo".
 */
BYTEIO_EXPORT const text_encoding& ascii_encoding();

/**
 * @brief Read exactly @p length bytes and decode them
 * @throws end_of_stream_error if fewer than @p length bytes are left
 */
BYTEIO_EXPORT std::string read_string(io_stream* stream, size length,
                                      const text_encoding& encoding = utf8_encoding());

BYTEIO_EXPORT std::string read_ascii(io_stream* stream, size length);

/**
 * @brief Encode @p text and write all resulting bytes
 *
 * No length prefix or terminator is written.
 *
 * @return Number of bytes written
 * @throws io_error on a short write
 */
BYTEIO_EXPORT size write_string(io_stream* stream, std::string_view text,
                                const text_encoding& encoding = utf8_encoding());

BYTEIO_EXPORT size write_ascii(io_stream* stream, std::string_view text);

} // namespace byteio

#endif // BYTEIO_TEXT_HH
