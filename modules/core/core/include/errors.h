#pragma once

#include <stdexcept>
#include <string>

namespace ferry {

enum class ErrorCategory {
    Configuration,
    Connection,
    Protocol,
    IO,
    Integrity,
    PathSafety,
    Cancellation,
};

const char* category_name(ErrorCategory category);

// Root of every error the core throws to its callers.
class FerryError : public std::runtime_error {
public:
    FerryError(ErrorCategory category, const std::string& message)
        : std::runtime_error(message), m_category(category) {}

    ErrorCategory category() const noexcept { return m_category; }

private:
    ErrorCategory m_category;
};

class ConfigurationError : public FerryError {
public:
    explicit ConfigurationError(const std::string& message)
        : FerryError(ErrorCategory::Configuration, message) {}
};

// Empty passphrase.
class InvalidKeyError : public ConfigurationError {
public:
    explicit InvalidKeyError(const std::string& message = "passphrase must not be empty")
        : ConfigurationError(message) {}
};

// Handshake timeout. Unreachable server and wrong key are reported identically.
class ConnectionError : public FerryError {
public:
    explicit ConnectionError(const std::string& message)
        : FerryError(ErrorCategory::Connection, message) {}
};

class ProtocolError : public FerryError {
public:
    ProtocolError(int status, const std::string& message)
        : FerryError(ErrorCategory::Protocol, message), m_status(status) {}

    int status() const noexcept { return m_status; }

private:
    int m_status;
};

class IOError : public FerryError {
public:
    explicit IOError(const std::string& message)
        : FerryError(ErrorCategory::IO, message) {}
};

class IntegrityError : public FerryError {
public:
    IntegrityError(const std::string& expected, const std::string& actual)
        : FerryError(ErrorCategory::Integrity,
                     "checksum mismatch: expected " + expected + ", got " + actual) {}
};

class PathSafetyError : public FerryError {
public:
    explicit PathSafetyError(const std::string& path)
        : FerryError(ErrorCategory::PathSafety, "path escapes root: " + path) {}
};

class CancellationError : public FerryError {
public:
    explicit CancellationError(const std::string& message = "operation canceled")
        : FerryError(ErrorCategory::Cancellation, message) {}
};

// Maps a non-success server status to the matching error and throws it.
[[noreturn]] void throw_for_status(int status, const std::string& body);

} // namespace ferry
