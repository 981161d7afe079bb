#include "escpos/transport/impl/FileTransport.hpp"
#include "escpos/types/Error.hpp"
#include "logger/Logger.hpp"

#include <filesystem>

namespace escpos::transport {
    FileTransport::FileTransport(const std::string &path, bool readable)
            : path_(path), readable_(readable) {
        std::ios::openmode mode = std::ios::binary | std::ios::out;
        if (readable) {
            mode |= std::ios::in;
        }

        // Capture files start empty; devices must not be truncated.
        std::error_code ec;
        auto status = std::filesystem::status(path, ec);
        if (!readable || status.type() == std::filesystem::file_type::not_found ||
            std::filesystem::is_regular_file(status)) {
            mode |= std::ios::trunc;
        }

        stream_.open(path, mode);
        if (!stream_.is_open()) {
            Logger::logError("[FileTransport] Failed to open " + path);
            throw types::TransportException("Cannot open " + path);
        }

        Logger::logInfo("[FileTransport] Opened " + path + (readable ? " (read/write)" : " (write only)"));
    }

    std::size_t FileTransport::write(const uint8_t *data, std::size_t size) {
        if (!isOpen()) {
            throw types::TransportException(path_ + " not open");
        }

        stream_.write(reinterpret_cast<const char *>(data), static_cast<std::streamsize>(size));
        stream_.flush();
        if (!stream_) {
            stream_.clear();
            throw types::TransportException("Write error on " + path_);
        }
        return size;
    }

    std::size_t FileTransport::read(uint8_t *buffer, std::size_t size) {
        if (!readable_) {
            throw types::TransportException(path_ + " was opened write only");
        }
        if (!isOpen()) {
            throw types::TransportException(path_ + " not open");
        }

        stream_.read(reinterpret_cast<char *>(buffer), static_cast<std::streamsize>(size));
        std::streamsize received = stream_.gcount();
        if (stream_.bad()) {
            stream_.clear();
            throw types::TransportException("Read error on " + path_);
        }
        stream_.clear();
        return static_cast<std::size_t>(received);
    }

    bool FileTransport::isOpen() const {
        return stream_.is_open();
    }
} // namespace escpos::transport
