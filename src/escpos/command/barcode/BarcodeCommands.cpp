#include "escpos/command/barcode/BarcodeCommands.hpp"
#include "escpos/CommandBuilder.hpp"
#include "escpos/PrinterSession.hpp"
#include "logger/Logger.hpp"

namespace escpos::command::barcode {

    BarcodeCommands::BarcodeCommands(PrinterSession *session)
            : CommandCategoryInterface(session) {}

    types::Bytes BarcodeCommands::typeCode(int format) {
        switch (format) {
            case 0:
            case 1:
            case 2:
            case 3:
            case 4:
                return {static_cast<uint8_t>(format)};
            case 73:
                return {0x49};
            default:
                return {};
        }
    }

    types::Result BarcodeCommands::barcode(const std::string &value, BarcodeFormat format) {
        return barcode(value, static_cast<int>(format));
    }

    types::Result BarcodeCommands::barcode(const std::string &value, int format) {
        types::Bytes code = typeCode(format);
        if (code.empty()) {
            Logger::logWarning("[BarcodeCommands] Unknown barcode format " + std::to_string(format) +
                               ", sending GS k without type code");
        }

        session_->reset();

        types::Result result = sendCommand(CommandBuilder::align(static_cast<uint8_t>(Align::Center)));
        if (result.isFailure()) {
            return result;
        }

        types::Bytes prefix = CommandBuilder::barcodePrefix(code);
        if (format > FRAMING_THRESHOLD) {
            result.merge(session_->writeFramed(prefix, std::to_string(value.size()) + value, {}));
        } else if (format < FRAMING_THRESHOLD) {
            result.merge(session_->writeFramed(prefix, value, {NUL}));
        }
        if (result.isFailure()) {
            return result;
        }

        // value is repeated after the frame
        return result.merge(sendText(value));
    }

} // namespace escpos::command::barcode
