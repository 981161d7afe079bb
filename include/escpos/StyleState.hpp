#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>

namespace escpos {

    /**
     * @brief Mirror of the style toggles currently active on the printer.
     *
     * Toggle fields carry the byte sent to the printer verbatim; only the
     * font scale is range checked (0-7 per axis).
     */
    struct StyleState {
        uint8_t fontWidth = 1;
        uint8_t fontHeight = 1;

        // ESC toggles
        uint8_t underline = 0;
        uint8_t emphasize = 0;
        uint8_t upsideDown = 0;
        uint8_t rotate = 0;

        // GS toggles
        uint8_t reverse = 0;
        uint8_t smooth = 0;

        /**
         * @brief Restores the ESC/POS power-on defaults.
         */
        void reset() {
            *this = StyleState{};
        }

        bool operator==(const StyleState &other) const {
            return fontWidth == other.fontWidth && fontHeight == other.fontHeight &&
                   underline == other.underline && emphasize == other.emphasize &&
                   upsideDown == other.upsideDown && rotate == other.rotate &&
                   reverse == other.reverse && smooth == other.smooth;
        }

        bool operator!=(const StyleState &other) const {
            return !(*this == other);
        }
    };

    constexpr uint8_t MAX_FONT_SCALE = 7;
    constexpr uint16_t MAX_MARGIN_LEFT = 47;

    enum class Font : uint8_t {
        A = 0,
        B = 1,
        C = 2
    };

    enum class Align : uint8_t {
        Left = 0,
        Center = 1,
        Right = 2
    };

    enum class Lang : uint8_t {
        En = 0,
        Fr = 1,
        De = 2,
        Uk = 3,
        Da = 4,
        Sv = 5,
        It = 6,
        Es = 7,
        Ja = 8,
        No = 9
    };

    /**
     * @brief Barcode symbologies with their GS k type code.
     */
    enum class BarcodeFormat : int {
        UpcA = 0,
        UpcE = 1,
        Ean13 = 2,
        Ean8 = 3,
        Code39 = 4,
        Code128 = 73
    };

    enum class FeedOption {
        NoFeed,
        Feed
    };

    // Lookups for values arriving as strings (config files, command line).
    // Unknown input falls back to the first entry of each enum.
    Font fontFromString(const std::string &name);

    Align alignFromString(const std::string &name);

    Lang langFromString(const std::string &code);

    FeedOption feedOptionFromParams(const std::unordered_map<std::string, std::string> &params);

    std::string styleStateToString(const StyleState &state);

} // namespace escpos
