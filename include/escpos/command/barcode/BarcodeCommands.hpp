#pragma once

#include "escpos/command/CommandCategoryInterface.hpp"
#include "escpos/StyleState.hpp"
#include "escpos/types/Bytes.hpp"
#include "escpos/types/Result.hpp"
#include <string>

namespace escpos::command::barcode {

    /**
     * @brief Formats above this value use the length-prefixed GS k form, formats
     * below it the NUL-terminated form. The value itself selects neither.
     */
    constexpr int FRAMING_THRESHOLD = 69;

/**
 * @brief One-dimensional barcode printing (GS k).
 */
    class BarcodeCommands : public CommandCategoryInterface {
    public:
        explicit BarcodeCommands(PrinterSession *session);

        types::Result barcode(const std::string &value, BarcodeFormat format);

        /**
         * @brief Prints a barcode from a raw GS k format number.
         *
         * Resets the in-memory style (without retransmitting it), centers the
         * output, sends the frame and then the value once more as plain text.
         * Numbers missing from the type table produce a GS k without type code.
         */
        types::Result barcode(const std::string &value, int format);

        /**
         * @brief GS k type code for a format number, empty if unknown.
         */
        static types::Bytes typeCode(int format);
    };

} // namespace escpos::command::barcode
