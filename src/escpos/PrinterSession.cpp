#include "escpos/PrinterSession.hpp"
#include "escpos/CommandBuilder.hpp"
#include "escpos/command/style/StyleCommands.hpp"
#include "escpos/command/paper/PaperCommands.hpp"
#include "escpos/command/drawer/DrawerCommands.hpp"
#include "escpos/command/barcode/BarcodeCommands.hpp"
#include "escpos/command/graphics/GraphicsCommands.hpp"
#include "escpos/command/status/StatusCommands.hpp"
#include "escpos/types/Error.hpp"
#include "escpos/utils/HexFormatter.hpp"
#include "logger/Logger.hpp"

namespace escpos {

    PrinterSession::PrinterSession(Transport &transport, const std::string &charset)
            : transport_(transport),
              encoder_(std::make_unique<text::TextEncoder>(charset)),
              style_(std::make_shared<command::style::StyleCommands>(this)),
              paper_(std::make_shared<command::paper::PaperCommands>(this)),
              drawer_(std::make_shared<command::drawer::DrawerCommands>(this)),
              barcode_(std::make_shared<command::barcode::BarcodeCommands>(this)),
              graphics_(std::make_shared<command::graphics::GraphicsCommands>(this)),
              status_(std::make_shared<command::status::StatusCommands>(this)) {
        reset();
    }

    PrinterSession::~PrinterSession() = default;

    std::shared_ptr<command::style::StyleCommands> PrinterSession::style() const {
        return style_;
    }

    std::shared_ptr<command::paper::PaperCommands> PrinterSession::paper() const {
        return paper_;
    }

    std::shared_ptr<command::drawer::DrawerCommands> PrinterSession::drawer() const {
        return drawer_;
    }

    std::shared_ptr<command::barcode::BarcodeCommands> PrinterSession::barcode() const {
        return barcode_;
    }

    std::shared_ptr<command::graphics::GraphicsCommands> PrinterSession::graphics() const {
        return graphics_;
    }

    std::shared_ptr<command::status::StatusCommands> PrinterSession::status() const {
        return status_;
    }

    void PrinterSession::reset() {
        state_.reset();
    }

    types::Result PrinterSession::init() {
        reset();
        return writeRaw(CommandBuilder::initialize());
    }

    types::Result PrinterSession::end() {
        return writeRaw(CommandBuilder::endOfTransmission());
    }

    types::Result PrinterSession::writeRaw(const types::Bytes &data) {
        if (data.empty()) {
            return types::Result::success(0);
        }

        try {
            std::size_t written = transport_.write(data.data(), data.size());
            if (written != data.size()) {
                Logger::logWarning("[PrinterSession] Short write: " + std::to_string(written) + "/" +
                                   std::to_string(data.size()) + " bytes");
                return types::Result::transportError("Short write", written);
            }

            if (Logger::getLevel() <= Logger::Level::Debug) {
                Logger::logDebug("[TX] " + utils::toHex(data));
            }
            return types::Result::success(written);
        } catch (const types::TransportException &e) {
            Logger::logError("[PrinterSession] Write failed: " + std::string(e.what()));
            return types::Result::transportError(e.what());
        }
    }

    types::Result PrinterSession::write(const std::string &text) {
        types::Bytes encoded;
        types::Result result = transcode(text, encoded);
        if (result.isFailure()) {
            return result;
        }
        return writeRaw(encoded);
    }

    types::Result PrinterSession::writeText(const std::string &text) {
        return write(text::TextEncoder::replaceEntities(text));
    }

    types::Result
    PrinterSession::writeFramed(const types::Bytes &prefix, const std::string &text, const types::Bytes &suffix) {
        types::Bytes encoded;
        types::Result result = transcode(text, encoded);
        if (result.isFailure()) {
            return result;
        }

        types::Bytes frame;
        frame.reserve(prefix.size() + encoded.size() + suffix.size());
        frame.insert(frame.end(), prefix.begin(), prefix.end());
        frame.insert(frame.end(), encoded.begin(), encoded.end());
        frame.insert(frame.end(), suffix.begin(), suffix.end());
        return writeRaw(frame);
    }

    std::size_t PrinterSession::readRaw(uint8_t *buffer, std::size_t size) {
        std::size_t received = transport_.read(buffer, size);
        if (Logger::getLevel() <= Logger::Level::Debug) {
            Logger::logDebug("[RX] " + utils::toHex(buffer, received));
        }
        return received;
    }

    const StyleState &PrinterSession::state() const {
        return state_;
    }

    const std::string &PrinterSession::charset() const {
        return encoder_->charset();
    }

    types::Result PrinterSession::transcode(const std::string &text, types::Bytes &out) {
        try {
            out = encoder_->encode(text);
            return types::Result::success(0);
        } catch (const types::EncodingException &e) {
            Logger::logError("[PrinterSession] Cannot encode text to " + encoder_->charset() + ": " + e.what());
            return types::Result::encodingError(e.what());
        }
    }

} // namespace escpos
