#include "escpos/text/TextEncoder.hpp"
#include "escpos/types/Error.hpp"
#include <cerrno>
#include <cstring>
#include <utility>
#include <vector>

namespace escpos::text {

    namespace {
        const iconv_t INVALID_DESCRIPTOR = reinterpret_cast<iconv_t>(-1);

        // &amp; must stay last, otherwise "&amp;lt;" would decode twice
        const std::vector<std::pair<std::string, std::string>> ENTITIES = {
                {"&#9;",   "\x09"},
                {"&#x9;",  "\x09"},
                {"&#10;",  "\n"},
                {"&#xA;",  "\n"},
                {"&apos;", "'"},
                {"&quot;", "\""},
                {"&gt;",   ">"},
                {"&lt;",   "<"},
                {"&amp;",  "&"}
        };
    }

    TextEncoder::TextEncoder(const std::string &charset)
            : charset_(charset), descriptor_(iconv_open(charset.c_str(), "UTF-8")) {
        if (descriptor_ == INVALID_DESCRIPTOR) {
            throw types::EncodingException("Unsupported printer charset: " + charset + " (" +
                                           std::strerror(errno) + ")");
        }
    }

    TextEncoder::~TextEncoder() {
        if (descriptor_ != INVALID_DESCRIPTOR) {
            iconv_close(descriptor_);
        }
    }

    const std::string &TextEncoder::charset() const {
        return charset_;
    }

    types::Bytes TextEncoder::encode(const std::string &utf8) {
        types::Bytes output;
        if (utf8.empty()) {
            return output;
        }

        // Back to the initial shift state, a previous failure may have left it dirty
        iconv(descriptor_, nullptr, nullptr, nullptr, nullptr);

        std::vector<char> input(utf8.begin(), utf8.end());
        char *inBuf = input.data();
        size_t inLeft = input.size();

        // GB18030 needs at most 4 bytes per code point
        std::vector<char> buffer(utf8.size() * 4 + 8);

        while (inLeft > 0) {
            char *outBuf = buffer.data();
            size_t outLeft = buffer.size();

            size_t rc = iconv(descriptor_, &inBuf, &inLeft, &outBuf, &outLeft);
            output.insert(output.end(), buffer.data(), outBuf);

            if (rc == static_cast<size_t>(-1)) {
                if (errno == E2BIG) {
                    continue;
                }
                std::size_t offset = input.size() - inLeft;
                if (errno == EILSEQ) {
                    throw types::EncodingException("Invalid or unconvertible sequence at byte " +
                                                   std::to_string(offset) + " for " + charset_);
                }
                if (errno == EINVAL) {
                    throw types::EncodingException("Truncated UTF-8 sequence at byte " + std::to_string(offset));
                }
                throw types::EncodingException(std::string("iconv failed: ") + std::strerror(errno));
            }
        }

        char *outBuf = buffer.data();
        size_t outLeft = buffer.size();
        if (iconv(descriptor_, nullptr, nullptr, &outBuf, &outLeft) == static_cast<size_t>(-1)) {
            throw types::EncodingException(std::string("iconv flush failed: ") + std::strerror(errno));
        }
        output.insert(output.end(), buffer.data(), outBuf);

        return output;
    }

    std::string TextEncoder::replaceEntities(const std::string &text) {
        std::string result = text;
        for (const auto &[entity, replacement]: ENTITIES) {
            std::size_t pos = 0;
            while ((pos = result.find(entity, pos)) != std::string::npos) {
                result.replace(pos, entity.length(), replacement);
                pos += replacement.length();
            }
        }
        return result;
    }

} // namespace escpos::text
