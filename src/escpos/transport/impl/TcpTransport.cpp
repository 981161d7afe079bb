#include "escpos/transport/impl/TcpTransport.hpp"
#include "escpos/types/Error.hpp"
#include "logger/Logger.hpp"
#include <boost/system/error_code.hpp>

namespace escpos::transport {
    TcpTransport::TcpTransport(const std::string &host, uint16_t port)
            : io_context_(), socket_(io_context_), endpoint_(host + ":" + std::to_string(port)) {
        boost::system::error_code ec;
        boost::asio::ip::tcp::resolver resolver(io_context_);
        auto endpoints = resolver.resolve(host, std::to_string(port), ec);
        if (ec) {
            Logger::logError("[TcpTransport] Cannot resolve " + endpoint_ + ": " + ec.message());
            throw types::TransportException("Cannot resolve " + endpoint_ + ": " + ec.message());
        }

        boost::asio::connect(socket_, endpoints, ec);
        if (ec) {
            Logger::logError("[TcpTransport] Cannot connect to " + endpoint_ + ": " + ec.message());
            throw types::TransportException("Cannot connect to " + endpoint_ + ": " + ec.message());
        }

        socket_.set_option(boost::asio::ip::tcp::no_delay(true), ec);
        if (ec) {
            Logger::logWarning("[TcpTransport] Failed to disable Nagle: " + ec.message());
        }

        Logger::logInfo("[TcpTransport] Connected to " + endpoint_);
    }

    TcpTransport::~TcpTransport() {
        if (socket_.is_open()) {
            boost::system::error_code ec;
            socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
            socket_.close(ec);
            if (ec) {
                Logger::logError("[TcpTransport] Error closing socket: " + ec.message());
            }
        }
    }

    std::size_t TcpTransport::write(const uint8_t *data, std::size_t size) {
        if (!isOpen()) {
            throw types::TransportException("Socket to " + endpoint_ + " not open");
        }

        boost::system::error_code ec;
        std::size_t written = boost::asio::write(socket_, boost::asio::buffer(data, size), ec);
        if (ec) {
            throw types::TransportException("Socket write error to " + endpoint_ + ": " + ec.message());
        }
        return written;
    }

    std::size_t TcpTransport::read(uint8_t *buffer, std::size_t size) {
        if (!isOpen()) {
            throw types::TransportException("Socket to " + endpoint_ + " not open");
        }

        boost::system::error_code ec;
        std::size_t received = socket_.read_some(boost::asio::buffer(buffer, size), ec);
        if (ec) {
            throw types::TransportException("Socket read error from " + endpoint_ + ": " + ec.message());
        }
        return received;
    }

    bool TcpTransport::isOpen() const {
        return socket_.is_open();
    }
} // namespace escpos::transport
