#include "escpos/command/CommandCategoryInterface.hpp"
#include "escpos/PrinterSession.hpp"

namespace escpos::command {

    CommandCategoryInterface::CommandCategoryInterface(PrinterSession *session)
            : session_(session) {}

    types::Result CommandCategoryInterface::sendCommand(const types::Bytes &command) const {
        return session_->writeRaw(command);
    }

    types::Result CommandCategoryInterface::sendText(const std::string &text) const {
        return session_->write(text);
    }

    StyleState &CommandCategoryInterface::state() const {
        return session_->state_;
    }

} // namespace escpos::command
