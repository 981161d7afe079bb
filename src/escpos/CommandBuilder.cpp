#include "escpos/CommandBuilder.hpp"

namespace escpos {

    types::Bytes CommandBuilder::initialize() {
        return {ESC, '@'};
    }

    types::Bytes CommandBuilder::endOfTransmission() {
        return {0xFA};
    }

    types::Bytes CommandBuilder::cut() {
        return {GS, 'V', 'A', '0'};
    }

    types::Bytes CommandBuilder::cutPartial() {
        return {GS, 0x56, 0x01};
    }

    types::Bytes CommandBuilder::drawerPulse() {
        return {ESC, 'p', 0x00, 0x0A, 0x0A};
    }

    types::Bytes CommandBuilder::cashPulse() {
        return {ESC, 'p', 0x00, 0x0A, 0xFF};
    }

    types::Bytes CommandBuilder::shortPulse() {
        // t=2, i.e. 2*2ms
        return {ESC, 'p', 0x02};
    }

    types::Bytes CommandBuilder::formfeed(uint8_t lines) {
        return {ESC, 'd', lines};
    }

    types::Bytes CommandBuilder::selectFont(uint8_t index) {
        return {ESC, 'M', index};
    }

    types::Bytes CommandBuilder::fontSize(uint8_t width, uint8_t height) {
        return {GS, '!', static_cast<uint8_t>((width << 4) | height)};
    }

    types::Bytes CommandBuilder::fontStyle(uint8_t style) {
        return {ESC, 0x21, style};
    }

    types::Bytes CommandBuilder::letterSpace(uint8_t n) {
        return {ESC, 0x20, n};
    }

    types::Bytes CommandBuilder::fontColor(uint8_t color) {
        return {ESC, 0x72, color};
    }

    types::Bytes CommandBuilder::underline(uint8_t v) {
        return {ESC, '-', v};
    }

    types::Bytes CommandBuilder::emphasize(uint8_t v) {
        return {ESC, 'G', v};
    }

    types::Bytes CommandBuilder::upsideDown(uint8_t v) {
        return {ESC, '{', v};
    }

    types::Bytes CommandBuilder::rotate(uint8_t v) {
        return {ESC, 'R', v};
    }

    types::Bytes CommandBuilder::reverse(uint8_t v) {
        return {GS, 'B', v};
    }

    types::Bytes CommandBuilder::smooth(uint8_t v) {
        return {GS, 'b', v};
    }

    types::Bytes CommandBuilder::moveX(uint16_t x) {
        return lowHigh(ESC, 0x24, x);
    }

    types::Bytes CommandBuilder::moveY(uint16_t y) {
        return lowHigh(GS, 0x24, y);
    }

    types::Bytes CommandBuilder::marginLeft(uint16_t size) {
        return lowHigh(GS, 0x4C, size);
    }

    types::Bytes CommandBuilder::align(uint8_t index) {
        return {ESC, 'a', index};
    }

    types::Bytes CommandBuilder::lang(uint8_t index) {
        return {ESC, 'R', index};
    }

    types::Bytes CommandBuilder::chineseOn() {
        return {FS, '&'};
    }

    types::Bytes CommandBuilder::barcodePrefix(const types::Bytes &typeCode) {
        types::Bytes prefix = {GS, 'k'};
        prefix.insert(prefix.end(), typeCode.begin(), typeCode.end());
        return prefix;
    }

    types::Bytes CommandBuilder::graphicsPrefix() {
        return {ESC, '(', 'L'};
    }

    types::Bytes CommandBuilder::graphicsHeader(uint8_t m, uint8_t fn, std::size_t dataLength) {
        std::size_t l = dataLength + 2;
        return {static_cast<uint8_t>(l % 256), static_cast<uint8_t>(l / 256), m, fn};
    }

    types::Bytes CommandBuilder::statusRequest(uint8_t n) {
        return {DLE, EOT, n};
    }

    types::Bytes CommandBuilder::lowHigh(uint8_t first, uint8_t second, uint16_t value) {
        return {first, second, static_cast<uint8_t>(value % 256), static_cast<uint8_t>(value / 256)};
    }

} // namespace escpos
