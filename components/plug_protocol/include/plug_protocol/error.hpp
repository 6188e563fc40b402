#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace plug_protocol {

/**
 * @brief Base exception class for all protocol codec errors
 */
class ProtocolError : public std::exception {
public:
    explicit ProtocolError(const std::string& message) : message_(message) {}
    const char* what() const noexcept override { return message_.c_str(); }

protected:
    std::string message_;
};

/**
 * @brief Exception thrown when hex text cannot be decoded to bytes
 */
class HexDecodeError : public ProtocolError {
public:
    explicit HexDecodeError(const std::string& message) : ProtocolError("Hex decode error: " + message) {}
};

/**
 * @brief Exception thrown when a packet field fails validation
 */
class ValidationError : public ProtocolError {
public:
    explicit ValidationError(const std::string& message) : ProtocolError("Validation error: " + message) {}
};

/**
 * @brief Device name is shorter than 2 or longer than 32 UTF-8 bytes
 */
class InvalidNameLengthError : public ValidationError {
public:
    explicit InvalidNameLengthError(std::size_t length)
        : ValidationError("Device name length must be between 2 and 32 bytes, got " + std::to_string(length))
        , length_(length) {}

    std::size_t length() const { return length_; }

private:
    std::size_t length_;
};

/**
 * @brief Device identifier is not exactly 6 hex characters
 */
class InvalidDeviceIdError : public ValidationError {
public:
    explicit InvalidDeviceIdError(const std::string& deviceId)
        : ValidationError("Device ID must be 6 hex characters, got '" + deviceId + "'") {}
};

} // namespace plug_protocol
