#pragma once

#include "escpos/types/Bytes.hpp"
#include <iconv.h>
#include <string>

namespace escpos::text {

    /**
     * @brief Converts UTF-8 text into the character set the printer expects.
     *
     * Wraps one iconv conversion descriptor. Bytes below 0x80 are preserved,
     * so ASCII control sequences survive the conversion unchanged.
     */
    class TextEncoder {
    public:
        static constexpr const char *DEFAULT_CHARSET = "GB18030";

        explicit TextEncoder(const std::string &charset = DEFAULT_CHARSET);

        ~TextEncoder();

        TextEncoder(const TextEncoder &) = delete;

        TextEncoder &operator=(const TextEncoder &) = delete;

        /**
         * @brief Encodes a UTF-8 string.
         * @throws types::EncodingException on malformed or unconvertible input.
         */
        types::Bytes encode(const std::string &utf8);

        const std::string &charset() const;

        /**
         * @brief Decodes the XML character entities that show up in escaped
         * receipt text (tab, linefeed, quotes, angle brackets, ampersand).
         */
        static std::string replaceEntities(const std::string &text);

    private:
        std::string charset_;
        iconv_t descriptor_;
    };

} // namespace escpos::text
