#pragma once

#include "escpos/command/CommandCategoryInterface.hpp"
#include "escpos/types/Result.hpp"

namespace escpos::command::drawer {

/**
 * @brief Cash drawer kick commands (ESC p pulse generator).
 */
    class DrawerCommands : public CommandCategoryInterface {
    public:
        explicit DrawerCommands(PrinterSession *session);

        types::Result openDrawer();

        types::Result cash();

        types::Result pulse();
    };

} // namespace escpos::command::drawer
