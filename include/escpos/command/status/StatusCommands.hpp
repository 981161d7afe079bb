#pragma once

#include "escpos/command/CommandCategoryInterface.hpp"
#include <cstdint>

namespace escpos::command::status {

    /**
     * @brief Argument n of DLE EOT n.
     */
    enum class StatusType : uint8_t {
        Printer = 1,
        Offline = 2,
        Error = 3,
        PaperSensor = 4
    };

    constexpr uint8_t DRAWER_OPEN_BIT = 0x04;
    constexpr uint8_t PAPER_NEAR_END_BITS = 0x0C;
    constexpr uint8_t PAPER_OUT_BITS = 0x60;

    struct PaperStatus {
        bool nearEnd = false;
        bool paperOut = false;
    };

/**
 * @brief Real-time status queries. The only commands that read from the printer.
 */
    class StatusCommands : public CommandCategoryInterface {
    public:
        explicit StatusCommands(PrinterSession *session);

        /**
         * @brief Sends DLE EOT n and returns the single byte the printer answers.
         * @throws types::TransportException if the request cannot be sent, the
         * read fails or returns no data.
         */
        uint8_t readStatus(uint8_t n);

        uint8_t readStatus(StatusType type);

        PaperStatus readPaperStatus();

        bool readDrawerOpen();
    };

} // namespace escpos::command::status
