#pragma once

#include <string>
#include <cstddef>

namespace escpos::types {

    enum class ResultCode {
        Success,
        Ignored,
        TransportError,
        EncodingError
    };

    struct Result {
        ResultCode code;
        std::string message;
        std::size_t bytesWritten = 0;

        inline bool isSuccess() const {
            return code == ResultCode::Success;
        }

        inline bool isIgnored() const {
            return code == ResultCode::Ignored;
        }

        inline bool isTransportError() const {
            return code == ResultCode::TransportError;
        }

        inline bool isEncodingError() const {
            return code == ResultCode::EncodingError;
        }

        /**
         * @brief True when the printer and the in-memory state can have diverged.
         */
        inline bool isFailure() const {
            return isTransportError() || isEncodingError();
        }

        static inline Result success(std::size_t written = 0, const std::string &msg = "Success") {
            return {ResultCode::Success, msg, written};
        }

        static inline Result ignored(const std::string &msg = "Ignored") {
            return {ResultCode::Ignored, msg, 0};
        }

        static inline Result transportError(const std::string &msg, std::size_t written = 0) {
            return {ResultCode::TransportError, msg, written};
        }

        static inline Result encodingError(const std::string &msg) {
            return {ResultCode::EncodingError, msg, 0};
        }

        /**
         * @brief Chains the next write of a multi-write command.
         * Failures are sticky: once a step failed, later steps are not merged.
         */
        inline Result &merge(const Result &next) {
            if (isFailure()) {
                return *this;
            }
            std::size_t total = bytesWritten + next.bytesWritten;
            code = next.code;
            message = next.message;
            bytesWritten = total;
            return *this;
        }
    };

}
