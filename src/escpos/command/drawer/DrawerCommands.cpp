#include "escpos/command/drawer/DrawerCommands.hpp"
#include "escpos/CommandBuilder.hpp"
#include "escpos/PrinterSession.hpp"

namespace escpos::command::drawer {

    DrawerCommands::DrawerCommands(PrinterSession *session)
            : CommandCategoryInterface(session) {}

    types::Result DrawerCommands::openDrawer() {
        return sendCommand(CommandBuilder::drawerPulse());
    }

    types::Result DrawerCommands::cash() {
        return sendCommand(CommandBuilder::cashPulse());
    }

    types::Result DrawerCommands::pulse() {
        return sendCommand(CommandBuilder::shortPulse());
    }

} // namespace escpos::command::drawer
