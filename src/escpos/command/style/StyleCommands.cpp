#include "escpos/command/style/StyleCommands.hpp"
#include "escpos/CommandBuilder.hpp"
#include "escpos/PrinterSession.hpp"
#include "logger/Logger.hpp"

namespace escpos::command::style {

    StyleCommands::StyleCommands(PrinterSession *session)
            : CommandCategoryInterface(session) {}

    types::Result StyleCommands::setFontSize(uint8_t width, uint8_t height) {
        if (width > MAX_FONT_SCALE || height > MAX_FONT_SCALE) {
            Logger::logWarning("[StyleCommands] Font size " + std::to_string(width) + "x" +
                               std::to_string(height) + " out of range, ignored");
            return types::Result::ignored("Font size out of range");
        }

        state().fontWidth = width;
        state().fontHeight = height;
        return sendFontSize();
    }

    types::Result StyleCommands::setFontStyle(uint8_t style) {
        return sendCommand(CommandBuilder::fontStyle(style));
    }

    types::Result StyleCommands::setUnderline(uint8_t v) {
        state().underline = v;
        return sendUnderline();
    }

    types::Result StyleCommands::setEmphasize(uint8_t v) {
        state().emphasize = v;
        return sendEmphasize();
    }

    types::Result StyleCommands::setUpsidedown(uint8_t v) {
        state().upsideDown = v;
        return sendUpsidedown();
    }

    types::Result StyleCommands::setRotate(uint8_t v) {
        state().rotate = v;
        return sendRotate();
    }

    types::Result StyleCommands::setReverse(uint8_t v) {
        state().reverse = v;
        return sendReverse();
    }

    types::Result StyleCommands::setSmooth(uint8_t v) {
        state().smooth = v;
        return sendSmooth();
    }

    types::Result StyleCommands::setFont(Font font) {
        return sendCommand(CommandBuilder::selectFont(static_cast<uint8_t>(font)));
    }

    types::Result StyleCommands::setFont(const std::string &name) {
        return setFont(fontFromString(name));
    }

    types::Result StyleCommands::setAlign(Align align) {
        return sendCommand(CommandBuilder::align(static_cast<uint8_t>(align)));
    }

    types::Result StyleCommands::setAlign(const std::string &name) {
        return setAlign(alignFromString(name));
    }

    types::Result StyleCommands::setLang(Lang lang) {
        return sendCommand(CommandBuilder::lang(static_cast<uint8_t>(lang)));
    }

    types::Result StyleCommands::setLang(const std::string &code) {
        return setLang(langFromString(code));
    }

    types::Result StyleCommands::setLetterSpace(uint8_t n) {
        return sendCommand(CommandBuilder::letterSpace(n));
    }

    types::Result StyleCommands::setMarginLeft(uint16_t size) {
        if (size > MAX_MARGIN_LEFT) {
            Logger::logWarning("[StyleCommands] Left margin " + std::to_string(size) + " exceeds " +
                               std::to_string(MAX_MARGIN_LEFT) + ", ignored");
            return types::Result::ignored("Left margin out of range");
        }
        return sendCommand(CommandBuilder::marginLeft(size));
    }

    types::Result StyleCommands::setFontColor(uint8_t color) {
        return sendCommand(CommandBuilder::fontColor(color));
    }

    types::Result StyleCommands::setChineseOn() {
        return sendCommand(CommandBuilder::chineseOn());
    }

    types::Result StyleCommands::sendFontSize() {
        return sendCommand(CommandBuilder::fontSize(state().fontWidth, state().fontHeight));
    }

    types::Result StyleCommands::sendUnderline() {
        return sendCommand(CommandBuilder::underline(state().underline));
    }

    types::Result StyleCommands::sendEmphasize() {
        return sendCommand(CommandBuilder::emphasize(state().emphasize));
    }

    types::Result StyleCommands::sendUpsidedown() {
        return sendCommand(CommandBuilder::upsideDown(state().upsideDown));
    }

    types::Result StyleCommands::sendRotate() {
        return sendCommand(CommandBuilder::rotate(state().rotate));
    }

    types::Result StyleCommands::sendReverse() {
        return sendCommand(CommandBuilder::reverse(state().reverse));
    }

    types::Result StyleCommands::sendSmooth() {
        return sendCommand(CommandBuilder::smooth(state().smooth));
    }

} // namespace escpos::command::style
