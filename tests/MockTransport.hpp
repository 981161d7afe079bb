#pragma once

#include "escpos/Transport.hpp"
#include "escpos/types/Bytes.hpp"
#include "escpos/types/Error.hpp"
#include <deque>
#include <initializer_list>
#include <string>
#include <vector>

/**
 * @brief In-memory transport: records every write, replays queued read bytes.
 */
class MockTransport : public escpos::Transport {
public:
    std::vector<escpos::types::Bytes> writes;
    std::deque<uint8_t> responses;
    bool failWrites = false;
    bool failReads = false;
    bool shortWrites = false;

    std::size_t write(const uint8_t *data, std::size_t size) override {
        if (failWrites) {
            throw escpos::types::TransportException("mock write failure");
        }
        std::size_t accepted = (shortWrites && size > 0) ? size - 1 : size;
        writes.emplace_back(data, data + accepted);
        return accepted;
    }

    std::size_t read(uint8_t *buffer, std::size_t size) override {
        if (failReads) {
            throw escpos::types::TransportException("mock read failure");
        }
        std::size_t n = 0;
        while (n < size && !responses.empty()) {
            buffer[n++] = responses.front();
            responses.pop_front();
        }
        return n;
    }

    bool isOpen() const override {
        return true;
    }

    /**
     * @brief All written bytes, concatenated in order.
     */
    escpos::types::Bytes written() const {
        escpos::types::Bytes all;
        for (const auto &chunk: writes) {
            all.insert(all.end(), chunk.begin(), chunk.end());
        }
        return all;
    }

    void clear() {
        writes.clear();
    }
};

inline escpos::types::Bytes bytesOf(const std::string &text) {
    return escpos::types::Bytes(text.begin(), text.end());
}

inline escpos::types::Bytes concat(std::initializer_list<escpos::types::Bytes> parts) {
    escpos::types::Bytes all;
    for (const auto &part: parts) {
        all.insert(all.end(), part.begin(), part.end());
    }
    return all;
}
