#include "escpos/command/paper/PaperCommands.hpp"
#include "escpos/CommandBuilder.hpp"
#include "escpos/PrinterSession.hpp"

namespace escpos::command::paper {

    PaperCommands::PaperCommands(PrinterSession *session)
            : CommandCategoryInterface(session) {}

    types::Result PaperCommands::cut() {
        types::Bytes command = CommandBuilder::cut();
        return sendText(std::string(command.begin(), command.end()));
    }

    types::Result PaperCommands::cutPartial() {
        return sendCommand(CommandBuilder::cutPartial());
    }

    types::Result PaperCommands::linefeed() {
        return sendText("\n");
    }

    types::Result PaperCommands::formfeed() {
        return formfeedN(1);
    }

    types::Result PaperCommands::formfeedN(int lines) {
        return sendCommand(CommandBuilder::formfeed(static_cast<uint8_t>(lines)));
    }

    types::Result PaperCommands::feedAndCut(FeedOption option) {
        types::Result result = types::Result::success(0);
        if (option == FeedOption::Feed) {
            result = formfeed();
            if (result.isFailure()) {
                return result;
            }
        }
        return result.merge(cut());
    }

    types::Result PaperCommands::feedAndCut(const std::unordered_map<std::string, std::string> &params) {
        return feedAndCut(feedOptionFromParams(params));
    }

    types::Result PaperCommands::moveX(uint16_t x) {
        return sendCommand(CommandBuilder::moveX(x));
    }

    types::Result PaperCommands::moveY(uint16_t y) {
        return sendCommand(CommandBuilder::moveY(y));
    }

} // namespace escpos::command::paper
