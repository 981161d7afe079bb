#pragma once

#include "escpos/StyleState.hpp"
#include "escpos/Transport.hpp"
#include "escpos/text/TextEncoder.hpp"
#include "escpos/types/Bytes.hpp"
#include "escpos/types/Result.hpp"
#include <memory>
#include <string>

namespace escpos {

    namespace command {
        class CommandCategoryInterface;

        namespace style { class StyleCommands; }
        namespace paper { class PaperCommands; }
        namespace drawer { class DrawerCommands; }
        namespace barcode { class BarcodeCommands; }
        namespace graphics { class GraphicsCommands; }
        namespace status { class StatusCommands; }
    }

    /**
     * @brief Stateful ESC/POS encoder bound to one transport.
     *
     * Every operation performs its writes synchronously and returns once the
     * transport accepted them. Style setters update the in-memory StyleState
     * and transmit the matching command in the same call, so the mirror only
     * diverges from the printer when a Result reports a failure.
     *
     * A session is not thread-safe: state mutation and transmission are two
     * separate steps. Use one session per transport and serialize calls.
     * Calls after end() are not rejected; not issuing them is up to the caller.
     */
    class PrinterSession {
    public:
        /**
         * @param transport Byte channel used by the session; must outlive it.
         * @param charset Target character set of the text path.
         */
        explicit PrinterSession(Transport &transport,
                                const std::string &charset = text::TextEncoder::DEFAULT_CHARSET);

        ~PrinterSession();

        PrinterSession(const PrinterSession &) = delete;

        PrinterSession &operator=(const PrinterSession &) = delete;

        std::shared_ptr<command::style::StyleCommands> style() const;

        std::shared_ptr<command::paper::PaperCommands> paper() const;

        std::shared_ptr<command::drawer::DrawerCommands> drawer() const;

        std::shared_ptr<command::barcode::BarcodeCommands> barcode() const;

        std::shared_ptr<command::graphics::GraphicsCommands> graphics() const;

        std::shared_ptr<command::status::StatusCommands> status() const;

        /**
         * @brief Restores the power-on style defaults in memory. Sends nothing.
         */
        void reset();

        /**
         * @brief reset() followed by ESC @.
         */
        types::Result init();

        /**
         * @brief Sends the end-of-transmission marker.
         */
        types::Result end();

        /**
         * @brief Forwards bytes to the transport untouched. Empty input sends nothing.
         */
        types::Result writeRaw(const types::Bytes &data);

        /**
         * @brief Transcodes UTF-8 text to the printer charset and sends it.
         * On an encoding failure nothing is sent.
         */
        types::Result write(const std::string &text);

        /**
         * @brief write() after decoding XML character entities.
         */
        types::Result writeText(const std::string &text);

        /**
         * @brief Sends prefix, transcoded text and suffix as a single write.
         */
        types::Result writeFramed(const types::Bytes &prefix, const std::string &text, const types::Bytes &suffix);

        /**
         * @throws types::TransportException when the transport read fails.
         */
        std::size_t readRaw(uint8_t *buffer, std::size_t size);

        const StyleState &state() const;

        const std::string &charset() const;

    private:
        friend class command::CommandCategoryInterface;

        Transport &transport_;
        std::unique_ptr<text::TextEncoder> encoder_;
        StyleState state_;

        std::shared_ptr<command::style::StyleCommands> style_;
        std::shared_ptr<command::paper::PaperCommands> paper_;
        std::shared_ptr<command::drawer::DrawerCommands> drawer_;
        std::shared_ptr<command::barcode::BarcodeCommands> barcode_;
        std::shared_ptr<command::graphics::GraphicsCommands> graphics_;
        std::shared_ptr<command::status::StatusCommands> status_;

        types::Result transcode(const std::string &text, types::Bytes &out);
    };

} // namespace escpos
