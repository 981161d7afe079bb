#pragma once

#include "escpos/Transport.hpp"
#include <boost/asio.hpp>
#include <string>
#include <memory>

namespace escpos::transport {

/**
 * @brief Transport over a serial device using Boost.Asio
 */
    class SerialTransport : public Transport {
    public:
        /**
         * @throws types::TransportException if the device cannot be opened.
         */
        SerialTransport(const std::string &device, uint32_t baudrate);

        ~SerialTransport() override;

        std::size_t write(const uint8_t *data, std::size_t size) override;

        std::size_t read(uint8_t *buffer, std::size_t size) override;

        bool isOpen() const override;

    private:
        boost::asio::io_context io_context_;
        std::unique_ptr<boost::asio::serial_port> serial_port_;
        std::string device_;

        void configurePort(uint32_t baudrate);
    };

} // namespace escpos::transport
