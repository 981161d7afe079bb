#pragma once

#include "escpos/command/CommandCategoryInterface.hpp"
#include "escpos/StyleState.hpp"
#include "escpos/types/Result.hpp"
#include <cstdint>
#include <string>

namespace escpos::command::style {

/**
 * @brief Character style, alignment and character-set commands.
 *
 * Setters store the new value in the session state and transmit it right
 * away. Out-of-range font sizes and margins are ignored: nothing is sent and
 * the state is left untouched (Result code Ignored).
 */
    class StyleCommands : public CommandCategoryInterface {
    public:
        explicit StyleCommands(PrinterSession *session);

        /**
         * @param width Horizontal scale, 0-7.
         * @param height Vertical scale, 0-7.
         */
        types::Result setFontSize(uint8_t width, uint8_t height);

        /**
         * @brief ESC ! print mode byte. Does not touch the tracked font scale.
         */
        types::Result setFontStyle(uint8_t style);

        types::Result setUnderline(uint8_t v);

        types::Result setEmphasize(uint8_t v);

        types::Result setUpsidedown(uint8_t v);

        types::Result setRotate(uint8_t v);

        types::Result setReverse(uint8_t v);

        types::Result setSmooth(uint8_t v);

        types::Result setFont(Font font);

        types::Result setFont(const std::string &name);

        types::Result setAlign(Align align);

        types::Result setAlign(const std::string &name);

        types::Result setLang(Lang lang);

        types::Result setLang(const std::string &code);

        types::Result setLetterSpace(uint8_t n);

        /**
         * @param size Left margin in dots, at most 47.
         */
        types::Result setMarginLeft(uint16_t size);

        types::Result setFontColor(uint8_t color);

        types::Result setChineseOn();

        // Re-transmit the tracked value without changing it
        types::Result sendFontSize();

        types::Result sendUnderline();

        types::Result sendEmphasize();

        types::Result sendUpsidedown();

        types::Result sendRotate();

        types::Result sendReverse();

        types::Result sendSmooth();
    };

} // namespace escpos::command::style
