#pragma once

#include "escpos/Transport.hpp"
#include <fstream>
#include <string>

namespace escpos::transport {

/**
 * @brief Transport over a file or character device such as /dev/usb/lp0.
 *
 * Regular files are truncated (and created when missing) so a capture holds
 * only the current job. Character devices are opened without truncation.
 * With readable=false read() throws.
 */
    class FileTransport : public Transport {
    public:
        FileTransport(const std::string &path, bool readable);

        std::size_t write(const uint8_t *data, std::size_t size) override;

        std::size_t read(uint8_t *buffer, std::size_t size) override;

        bool isOpen() const override;

    private:
        std::fstream stream_;
        std::string path_;
        bool readable_;
    };

} // namespace escpos::transport
