#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace escpos::utils {
    constexpr std::size_t MAX_HEX_DUMP = 64;

    /**
        * @brief Formatta un buffer come "1B 40 0A", troncato a MAX_HEX_DUMP byte
        */
    inline std::string toHex(const uint8_t *data, std::size_t size) {
        static const char digits[] = "0123456789ABCDEF";
        std::string result;
        std::size_t shown = size < MAX_HEX_DUMP ? size : MAX_HEX_DUMP;
        result.reserve(shown * 3 + 16);

        for (std::size_t i = 0; i < shown; ++i) {
            if (i > 0) result += ' ';
            result += digits[data[i] >> 4];
            result += digits[data[i] & 0x0F];
        }
        if (shown < size) {
            result += " ... (" + std::to_string(size) + " bytes)";
        }
        return result;
    }

    /**
     * @brief Overload per vector
     */
    inline std::string toHex(const std::vector<uint8_t> &data) {
        return toHex(data.data(), data.size());
    }
} // namespace escpos::utils
