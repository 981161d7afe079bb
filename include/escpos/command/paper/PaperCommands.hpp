#pragma once

#include "escpos/command/CommandCategoryInterface.hpp"
#include "escpos/StyleState.hpp"
#include "escpos/types/Result.hpp"
#include <string>
#include <unordered_map>

namespace escpos::command::paper {

/**
 * @brief Paper feed, cutter and print-position commands.
 */
    class PaperCommands : public CommandCategoryInterface {
    public:
        explicit PaperCommands(PrinterSession *session);

        /**
         * @brief Full cut, GS V A 0, sent through the text path.
         */
        types::Result cut();

        types::Result cutPartial();

        types::Result linefeed();

        types::Result formfeed();

        /**
         * @brief ESC d n. Only the low byte of lines is sent.
         */
        types::Result formfeedN(int lines);

        types::Result feedAndCut(FeedOption option);

        /**
         * @brief feedAndCut driven by a parameter map; {"type": "feed"} feeds first.
         */
        types::Result feedAndCut(const std::unordered_map<std::string, std::string> &params);

        types::Result moveX(uint16_t x);

        types::Result moveY(uint16_t y);
    };

} // namespace escpos::command::paper
