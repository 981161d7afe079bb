#pragma once

#include "escpos/StyleState.hpp"
#include "escpos/types/Bytes.hpp"
#include "escpos/types/Result.hpp"
#include <string>

namespace escpos {

    class PrinterSession; // Forward declaration

    namespace command {

/**
 * @brief Base for every command category of a PrinterSession.
 */
        class CommandCategoryInterface {
        public:
            virtual ~CommandCategoryInterface() = default;

        protected:
            explicit CommandCategoryInterface(PrinterSession *session);

            /**
             * @brief Sends a binary command, bypassing text transcoding.
             */
            types::Result sendCommand(const types::Bytes &command) const;

            /**
             * @brief Sends a string through the transcoding text path.
             */
            types::Result sendText(const std::string &text) const;

            StyleState &state() const;

            PrinterSession *session_;
        };

    } // namespace command
} // namespace escpos
