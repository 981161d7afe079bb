#pragma once

#include "escpos/command/CommandCategoryInterface.hpp"
#include "escpos/types/Bytes.hpp"
#include "escpos/types/Result.hpp"
#include <cstddef>
#include <cstdint>

namespace escpos::command::graphics {

    constexpr uint8_t GRAPHICS_MODE = 0x30;
    constexpr uint8_t FN_PRINT_STORED = 0x32;
    constexpr uint8_t FN_STORE_RASTER = 0x70;

    // pL/pH cover the data plus m and fn
    constexpr std::size_t MAX_GRAPHICS_DATA = 0xFFFF - 2;

/**
 * @brief Graphics sub-protocol, ESC ( L pL pH m fn [data].
 */
    class GraphicsCommands : public CommandCategoryInterface {
    public:
        explicit GraphicsCommands(PrinterSession *session);

        /**
         * @brief Sends one length-prefixed graphics frame.
         *
         * The length written in the header is data.size() + 2, little endian.
         * Data that would not fit the 16 bit length is ignored.
         */
        types::Result gSend(uint8_t m, uint8_t fn, const types::Bytes &data);

        /**
         * @brief Stores an already rasterized 1 bit per pixel image in the
         * print buffer.
         * @param widthDots Image width in dots.
         * @param heightDots Image height in dots.
         * @param data Rows of ceil(widthDots / 8) bytes, MSB is the leftmost dot.
         */
        types::Result storeRasterImage(uint16_t widthDots, uint16_t heightDots, const types::Bytes &data);

        types::Result printStoredGraphics();
    };

} // namespace escpos::command::graphics
