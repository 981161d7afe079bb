#pragma once

#include "escpos/types/Bytes.hpp"
#include <cstdint>
#include <cstddef>

namespace escpos {

    constexpr uint8_t NUL = 0x00;
    constexpr uint8_t EOT = 0x04;
    constexpr uint8_t LF = 0x0A;
    constexpr uint8_t DLE = 0x10;
    constexpr uint8_t ESC = 0x1B;
    constexpr uint8_t FS = 0x1C;
    constexpr uint8_t GS = 0x1D;

/**
 * @brief Builds the byte sequences of the ESC/POS commands.
 *
 * Pure formatting: nothing here touches a transport or the style state.
 */
    class CommandBuilder {
    public:
        static types::Bytes initialize();

        static types::Bytes endOfTransmission();

        static types::Bytes cut();

        static types::Bytes cutPartial();

        static types::Bytes drawerPulse();

        static types::Bytes cashPulse();

        static types::Bytes shortPulse();

        static types::Bytes formfeed(uint8_t lines);

        static types::Bytes selectFont(uint8_t index);

        /**
         * @brief GS ! with width in the high nibble and height in the low one.
         */
        static types::Bytes fontSize(uint8_t width, uint8_t height);

        static types::Bytes fontStyle(uint8_t style);

        static types::Bytes letterSpace(uint8_t n);

        static types::Bytes fontColor(uint8_t color);

        static types::Bytes underline(uint8_t v);

        static types::Bytes emphasize(uint8_t v);

        static types::Bytes upsideDown(uint8_t v);

        static types::Bytes rotate(uint8_t v);

        static types::Bytes reverse(uint8_t v);

        static types::Bytes smooth(uint8_t v);

        static types::Bytes moveX(uint16_t x);

        static types::Bytes moveY(uint16_t y);

        static types::Bytes marginLeft(uint16_t size);

        static types::Bytes align(uint8_t index);

        static types::Bytes lang(uint8_t index);

        static types::Bytes chineseOn();

        /**
         * @brief GS k followed by the type code; empty code yields a bare GS k.
         */
        static types::Bytes barcodePrefix(const types::Bytes &typeCode);

        /**
         * @brief Header of an ESC ( L graphics frame, data excluded.
         * @param dataLength Length of the data that follows the header.
         */
        static types::Bytes graphicsHeader(uint8_t m, uint8_t fn, std::size_t dataLength);

        static types::Bytes graphicsPrefix();

        static types::Bytes statusRequest(uint8_t n);

    private:
        static types::Bytes lowHigh(uint8_t first, uint8_t second, uint16_t value);
    };

}
