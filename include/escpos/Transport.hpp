#pragma once

#include <cstddef>
#include <cstdint>

namespace escpos {

/**
 * @brief Bidirectional byte channel to the printer (serial, socket, device file).
 *
 * Implementations report failures by throwing types::TransportException.
 * The encoder never opens or closes a transport: its lifetime belongs to the caller.
 */
    class Transport {
    public:
        virtual ~Transport() = default;

        /**
         * @brief Writes bytes to the printer.
         * @return Number of bytes actually written.
         */
        virtual std::size_t write(const uint8_t *data, std::size_t size) = 0;

        /**
         * @brief Reads up to size bytes from the printer.
         * @return Number of bytes read.
         */
        virtual std::size_t read(uint8_t *buffer, std::size_t size) = 0;

        virtual bool isOpen() const = 0;
    };

} // namespace escpos
