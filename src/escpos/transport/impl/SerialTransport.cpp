#include "escpos/transport/impl/SerialTransport.hpp"
#include "escpos/types/Error.hpp"
#include "logger/Logger.hpp"
#include <boost/system/error_code.hpp>

namespace escpos::transport {
    SerialTransport::SerialTransport(const std::string &device, uint32_t baudrate)
            : io_context_(), serial_port_(nullptr), device_(device) {
        try {
            serial_port_ = std::make_unique<boost::asio::serial_port>(io_context_, device);
        } catch (const boost::system::system_error &e) {
            Logger::logError("[SerialTransport] Failed to open " + device + ": " + e.what());
            throw types::TransportException("Cannot open serial device " + device + ": " + e.what());
        }

        configurePort(baudrate);
        Logger::logInfo("[SerialTransport] Opened " + device + " @ " + std::to_string(baudrate) + " baud");
    }

    SerialTransport::~SerialTransport() {
        if (serial_port_ && serial_port_->is_open()) {
            boost::system::error_code ec;
            serial_port_->close(ec);
            if (ec) {
                Logger::logError("[SerialTransport] Error closing port: " + ec.message());
            }
        }
    }

    void SerialTransport::configurePort(uint32_t baudrate) {
        boost::system::error_code ec;

        serial_port_->set_option(boost::asio::serial_port_base::baud_rate(baudrate), ec);
        if (ec) {
            Logger::logWarning("[SerialTransport] Failed to set baud rate: " + ec.message());
        }

        serial_port_->set_option(boost::asio::serial_port_base::character_size(8), ec);
        if (ec) {
            Logger::logWarning("[SerialTransport] Failed to set character size: " + ec.message());
        }

        serial_port_->set_option(boost::asio::serial_port_base::parity(
                boost::asio::serial_port_base::parity::none), ec);
        if (ec) {
            Logger::logWarning("[SerialTransport] Failed to set parity: " + ec.message());
        }

        serial_port_->set_option(boost::asio::serial_port_base::stop_bits(
                boost::asio::serial_port_base::stop_bits::one), ec);
        if (ec) {
            Logger::logWarning("[SerialTransport] Failed to set stop bits: " + ec.message());
        }

        serial_port_->set_option(boost::asio::serial_port_base::flow_control(
                boost::asio::serial_port_base::flow_control::none), ec);
        if (ec) {
            Logger::logWarning("[SerialTransport] Failed to set flow control: " + ec.message());
        }
    }

    std::size_t SerialTransport::write(const uint8_t *data, std::size_t size) {
        if (!isOpen()) {
            throw types::TransportException("Serial port " + device_ + " not open");
        }

        boost::system::error_code ec;
        std::size_t written = boost::asio::write(*serial_port_, boost::asio::buffer(data, size), ec);
        if (ec) {
            throw types::TransportException("Serial write error on " + device_ + ": " + ec.message());
        }
        return written;
    }

    std::size_t SerialTransport::read(uint8_t *buffer, std::size_t size) {
        if (!isOpen()) {
            throw types::TransportException("Serial port " + device_ + " not open");
        }

        boost::system::error_code ec;
        std::size_t received = serial_port_->read_some(boost::asio::buffer(buffer, size), ec);
        if (ec) {
            throw types::TransportException("Serial read error on " + device_ + ": " + ec.message());
        }
        return received;
    }

    bool SerialTransport::isOpen() const {
        return serial_port_ && serial_port_->is_open();
    }
} // namespace escpos::transport
