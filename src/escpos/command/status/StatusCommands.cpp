#include "escpos/command/status/StatusCommands.hpp"
#include "escpos/CommandBuilder.hpp"
#include "escpos/PrinterSession.hpp"
#include "escpos/types/Error.hpp"
#include "logger/Logger.hpp"

namespace escpos::command::status {

    StatusCommands::StatusCommands(PrinterSession *session)
            : CommandCategoryInterface(session) {}

    uint8_t StatusCommands::readStatus(uint8_t n) {
        types::Result sent = sendCommand(CommandBuilder::statusRequest(n));
        if (sent.isFailure()) {
            throw types::TransportException("Status request not sent: " + sent.message);
        }

        uint8_t data = 0;
        if (session_->readRaw(&data, 1) != 1) {
            throw types::TransportException("No status byte received for DLE EOT " + std::to_string(n));
        }
        return data;
    }

    uint8_t StatusCommands::readStatus(StatusType type) {
        return readStatus(static_cast<uint8_t>(type));
    }

    PaperStatus StatusCommands::readPaperStatus() {
        uint8_t value = readStatus(StatusType::PaperSensor);

        PaperStatus paper;
        paper.nearEnd = (value & PAPER_NEAR_END_BITS) != 0;
        paper.paperOut = (value & PAPER_OUT_BITS) != 0;
        if (paper.paperOut) {
            Logger::logWarning("[StatusCommands] Paper out");
        } else if (paper.nearEnd) {
            Logger::logInfo("[StatusCommands] Paper near end");
        }
        return paper;
    }

    bool StatusCommands::readDrawerOpen() {
        return (readStatus(StatusType::Printer) & DRAWER_OPEN_BIT) != 0;
    }

} // namespace escpos::command::status
