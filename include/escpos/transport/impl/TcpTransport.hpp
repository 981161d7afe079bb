#pragma once

#include "escpos/Transport.hpp"
#include <boost/asio.hpp>
#include <string>

namespace escpos::transport {

    constexpr uint16_t DEFAULT_RAW_PORT = 9100;

/**
 * @brief Transport over a raw TCP printing port.
 *
 * Connects once in the constructor; a dropped connection surfaces as a
 * TransportException on the next write or read.
 */
    class TcpTransport : public Transport {
    public:
        TcpTransport(const std::string &host, uint16_t port = DEFAULT_RAW_PORT);

        ~TcpTransport() override;

        std::size_t write(const uint8_t *data, std::size_t size) override;

        std::size_t read(uint8_t *buffer, std::size_t size) override;

        bool isOpen() const override;

    private:
        boost::asio::io_context io_context_;
        boost::asio::ip::tcp::socket socket_;
        std::string endpoint_;
    };

} // namespace escpos::transport
