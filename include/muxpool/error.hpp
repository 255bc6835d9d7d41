#pragma once
#include <string>

namespace muxpool {
    /**
     * @brief Represents an error raised while acquiring a connection or
     * performing an exchange.
     */
    struct Error {
        /** @brief Enumeration of error codes. */
        enum class Code {
            InvalidUrl,           /**< The request target is malformed. */
            InvalidConfiguration, /**< Inconsistent client settings. */
            CapacityExceeded,  /**< Pending acquire queue is full, no retry. */
            AcquisitionTimeout, /**< Queued too long, caller may retry. */
            PoolClosed,        /**< Acquire attempted after close began. */
            Cancelled,         /**< The caller cancelled the operation. */
            TransportFailure,  /**< Opaque failure reported by a Transport. */
            ShutdownTimeout,   /**< Graceful close missed its deadline. */
            ConnectionFailed,  /**< Failed to establish a TCP connection. */
            TlsHandshakeFailed,/**< Failed to perform TLS handshake. */
            Timeout,           /**< A read, write or connect timed out. */
            SendFailed,        /**< Failed to send the request. */
            ReceiveFailed,     /**< Failed to receive the response. */
            Unknown,           /**< An unknown error occurred. */
        };

        /** @brief The error code. */
        Code code;
        /** @brief A descriptive error message. */
        std::string message;
    };

    /// @brief Convert an Error::Code to string for logging or diagnostics
    inline const char* to_string(Error::Code code) {
        switch (code) {
            case Error::Code::InvalidUrl:
                return "InvalidUrl";
            case Error::Code::InvalidConfiguration:
                return "InvalidConfiguration";
            case Error::Code::CapacityExceeded:
                return "CapacityExceeded";
            case Error::Code::AcquisitionTimeout:
                return "AcquisitionTimeout";
            case Error::Code::PoolClosed:
                return "PoolClosed";
            case Error::Code::Cancelled:
                return "Cancelled";
            case Error::Code::TransportFailure:
                return "TransportFailure";
            case Error::Code::ShutdownTimeout:
                return "ShutdownTimeout";
            case Error::Code::ConnectionFailed:
                return "ConnectionFailed";
            case Error::Code::TlsHandshakeFailed:
                return "TlsHandshakeFailed";
            case Error::Code::Timeout:
                return "Timeout";
            case Error::Code::SendFailed:
                return "SendFailed";
            case Error::Code::ReceiveFailed:
                return "ReceiveFailed";
            case Error::Code::Unknown:
                return "Unknown";
        }
        return "Unknown";
    }

    /// @brief True for errors produced by the transport layer rather than
    /// by pool bookkeeping.
    inline bool is_transport_error(Error::Code code) noexcept {
        switch (code) {
            case Error::Code::TransportFailure:
            case Error::Code::ConnectionFailed:
            case Error::Code::TlsHandshakeFailed:
            case Error::Code::Timeout:
            case Error::Code::SendFailed:
            case Error::Code::ReceiveFailed:
                return true;
            default:
                return false;
        }
    }
}  // namespace muxpool
