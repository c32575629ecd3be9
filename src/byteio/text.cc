#include <byteio/text.hh>
#include <byteio/byte_io.hh>

namespace byteio {
    namespace {
        constexpr char32_t replacement_char = 0xFFFD;

        // Decodes the code point at p and advances p. A malformed sequence
        // yields U+FFFD and p stops at the first byte that broke it.
        char32_t next_code_point(const uint8*& p, const uint8* end) {
            const uint8 lead = *p++;
            if (lead < 0x80) {
                return lead;
            }

            int trailing;
            char32_t cp;
            char32_t min_value;
            if ((lead & 0xE0) == 0xC0) {
                trailing = 1;
                cp = lead & 0x1F;
                min_value = 0x80;
            } else if ((lead & 0xF0) == 0xE0) {
                trailing = 2;
                cp = lead & 0x0F;
                min_value = 0x800;
            } else if ((lead & 0xF8) == 0xF0) {
                trailing = 3;
                cp = lead & 0x07;
                min_value = 0x10000;
            } else {
                return replacement_char;
            }

            for (int i = 0; i < trailing; ++i) {
                if (p == end || (*p & 0xC0) != 0x80) {
                    return replacement_char;
                }
                cp = (cp << 6) | (*p++ & 0x3F);
            }

            // overlong forms, surrogates and values past the Unicode range
            if (cp < min_value || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
                return replacement_char;
            }
            return cp;
        }

        template<typename Out>
        void append_utf8(Out& out, char32_t cp) {
            using value_type = typename Out::value_type;
            if (cp < 0x80) {
                out.push_back(static_cast<value_type>(cp));
            } else if (cp < 0x800) {
                out.push_back(static_cast<value_type>(0xC0 | (cp >> 6)));
                out.push_back(static_cast<value_type>(0x80 | (cp & 0x3F)));
            } else if (cp < 0x10000) {
                out.push_back(static_cast<value_type>(0xE0 | (cp >> 12)));
                out.push_back(static_cast<value_type>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<value_type>(0x80 | (cp & 0x3F)));
            } else {
                out.push_back(static_cast<value_type>(0xF0 | (cp >> 18)));
                out.push_back(static_cast<value_type>(0x80 | ((cp >> 12) & 0x3F)));
                out.push_back(static_cast<value_type>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<value_type>(0x80 | (cp & 0x3F)));
            }
        }

        const uint8* as_bytes(std::string_view text) {
            return reinterpret_cast<const uint8*>(text.data());
        }

        class utf8_text_encoding final : public text_encoding {
        public:
            const char* name() const override {
                return "utf-8";
            }

            std::string decode(const uint8* data, size length) const override {
                std::string out;
                out.reserve(length);
                const uint8* end = data + length;
                while (data != end) {
                    append_utf8(out, next_code_point(data, end));
                }
                return out;
            }

            std::vector<uint8> encode(std::string_view text) const override {
                std::vector<uint8> out;
                out.reserve(text.size());
                const uint8* p = as_bytes(text);
                const uint8* end = p + text.size();
                while (p != end) {
                    append_utf8(out, next_code_point(p, end));
                }
                return out;
            }
        };

        class ascii_text_encoding final : public text_encoding {
        public:
            const char* name() const override {
                return "us-ascii";
            }

            std::string decode(const uint8* data, size length) const override {
                std::string out;
                out.reserve(length);
                for (size i = 0; i < length; ++i) {
                    out.push_back(data[i] < 0x80 ? static_cast<char>(data[i]) : '?');
                }
                return out;
            }

            std::vector<uint8> encode(std::string_view text) const override {
                std::vector<uint8> out;
                out.reserve(text.size());
                const uint8* p = as_bytes(text);
                const uint8* end = p + text.size();
                while (p != end) {
                    const char32_t cp = next_code_point(p, end);
                    out.push_back(cp < 0x80 ? static_cast<uint8>(cp) : static_cast<uint8>('?'));
                }
                return out;
            }
        };
    }

    const text_encoding& utf8_encoding() {
        static const utf8_text_encoding instance{};
        return instance;
    }

    const text_encoding& ascii_encoding() {
        static const ascii_text_encoding instance{};
        return instance;
    }

    std::string read_string(io_stream* stream, size length, const text_encoding& encoding) {
        const byte_buffer bytes = read_bytes(stream, length);
        return encoding.decode(bytes.data(), bytes.size());
    }

    std::string read_ascii(io_stream* stream, size length) {
        return read_string(stream, length, ascii_encoding());
    }

    size write_string(io_stream* stream, std::string_view text, const text_encoding& encoding) {
        const std::vector<uint8> bytes = encoding.encode(text);
        return write_bytes(stream, bytes.data(), bytes.size());
    }

    size write_ascii(io_stream* stream, std::string_view text) {
        return write_string(stream, text, ascii_encoding());
    }
}
