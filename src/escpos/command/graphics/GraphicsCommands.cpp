#include "escpos/command/graphics/GraphicsCommands.hpp"
#include "escpos/CommandBuilder.hpp"
#include "escpos/PrinterSession.hpp"
#include "logger/Logger.hpp"

namespace escpos::command::graphics {

    GraphicsCommands::GraphicsCommands(PrinterSession *session)
            : CommandCategoryInterface(session) {}

    types::Result GraphicsCommands::gSend(uint8_t m, uint8_t fn, const types::Bytes &data) {
        if (data.size() > MAX_GRAPHICS_DATA) {
            Logger::logWarning("[GraphicsCommands] Graphics payload of " + std::to_string(data.size()) +
                               " bytes does not fit a 16 bit length, ignored");
            return types::Result::ignored("Graphics payload too large");
        }

        types::Result result = sendCommand(CommandBuilder::graphicsPrefix());
        if (result.isFailure()) {
            return result;
        }

        result.merge(sendCommand(CommandBuilder::graphicsHeader(m, fn, data.size())));
        if (result.isFailure()) {
            return result;
        }

        return result.merge(sendCommand(data));
    }

    types::Result
    GraphicsCommands::storeRasterImage(uint16_t widthDots, uint16_t heightDots, const types::Bytes &data) {
        std::size_t expected = static_cast<std::size_t>((widthDots + 7) / 8) * heightDots;
        if (widthDots == 0 || heightDots == 0 || data.size() != expected) {
            Logger::logWarning("[GraphicsCommands] Raster " + std::to_string(widthDots) + "x" +
                               std::to_string(heightDots) + " needs " + std::to_string(expected) +
                               " bytes, got " + std::to_string(data.size()) + ", ignored");
            return types::Result::ignored("Raster size mismatch");
        }

        // a=0x30 monochrome, bx=by=1 no scaling, c=0x31 first color
        types::Bytes payload = {
                0x30, 0x01, 0x01, 0x31,
                static_cast<uint8_t>(widthDots % 256), static_cast<uint8_t>(widthDots / 256),
                static_cast<uint8_t>(heightDots % 256), static_cast<uint8_t>(heightDots / 256)
        };
        payload.insert(payload.end(), data.begin(), data.end());

        return gSend(GRAPHICS_MODE, FN_STORE_RASTER, payload);
    }

    types::Result GraphicsCommands::printStoredGraphics() {
        return gSend(GRAPHICS_MODE, FN_PRINT_STORED, {});
    }

} // namespace escpos::command::graphics
