#ifndef DOCREP_COMMON_ERRORS_HPP
#define DOCREP_COMMON_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace docrep {

enum class TransferErrorCode {
    NONE = 0,
    USAGE,
    PROTOCOL,
    SELECTION,
    CONNECTION,
    IO,
    SIGNAL,
    PARTIAL,
    TIMEOUT,
    SPAWN_FAILED,
    CREDENTIAL,
    UNKNOWN
};

inline const char* transfer_error_to_string(TransferErrorCode code) {
    switch (code) {
        case TransferErrorCode::NONE: return "None";
        case TransferErrorCode::USAGE: return "Usage error";
        case TransferErrorCode::PROTOCOL: return "Protocol error";
        case TransferErrorCode::SELECTION: return "File selection error";
        case TransferErrorCode::CONNECTION: return "Connection error";
        case TransferErrorCode::IO: return "File I/O error";
        case TransferErrorCode::SIGNAL: return "Interrupted by signal";
        case TransferErrorCode::PARTIAL: return "Partial transfer";
        case TransferErrorCode::TIMEOUT: return "Timeout";
        case TransferErrorCode::SPAWN_FAILED: return "Failed to start transfer process";
        case TransferErrorCode::CREDENTIAL: return "Credential error";
        case TransferErrorCode::UNKNOWN: return "Unknown error";
        default: return "Undefined error";
    }
}

// Maps an rsync exit status onto a transfer error code
inline TransferErrorCode transfer_error_from_exit_code(int exit_code) {
    switch (exit_code) {
        case 0: return TransferErrorCode::NONE;
        case 1: return TransferErrorCode::USAGE;
        case 2:
        case 12: return TransferErrorCode::PROTOCOL;
        case 3: return TransferErrorCode::SELECTION;
        case 5:
        case 10:
        case 35: return TransferErrorCode::CONNECTION;
        case 11: return TransferErrorCode::IO;
        case 20: return TransferErrorCode::SIGNAL;
        case 23:
        case 24: return TransferErrorCode::PARTIAL;
        case 30: return TransferErrorCode::TIMEOUT;
        case 127: return TransferErrorCode::SPAWN_FAILED;
        default: return TransferErrorCode::UNKNOWN;
    }
}

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message)
        : std::runtime_error(message) {}
};

// Missing or inconsistent configuration, fatal at startup
class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& message)
        : Error("Configuration error: " + message) {}
};

// Bad input, rejected before any I/O happens
class ValidationError : public Error {
public:
    explicit ValidationError(const std::string& message)
        : Error("Validation error: " + message) {}
};

class TransferError : public Error {
public:
    TransferError(TransferErrorCode code, const std::string& message,
                  const std::string& stderr_excerpt = "", int exit_code = -1)
        : Error(std::string("Transfer error (") + transfer_error_to_string(code) + "): " + message)
        , code_(code)
        , stderr_excerpt_(stderr_excerpt)
        , exit_code_(exit_code) {}

    TransferErrorCode code() const { return code_; }
    const std::string& stderr_excerpt() const { return stderr_excerpt_; }
    int exit_code() const { return exit_code_; }

private:
    TransferErrorCode code_;
    std::string stderr_excerpt_;
    int exit_code_;
};

// Zero-byte or checksum-mismatched artifact
class IntegrityError : public Error {
public:
    explicit IntegrityError(const std::string& message)
        : Error("Integrity error: " + message) {}
};

class LockTimeoutError : public Error {
public:
    explicit LockTimeoutError(const std::string& message)
        : Error("Lock timeout: " + message) {}
};

class NotFoundError : public Error {
public:
    explicit NotFoundError(const std::string& message)
        : Error("Not found: " + message) {}
};

class ServiceUnavailableError : public Error {
public:
    explicit ServiceUnavailableError(const std::string& message)
        : Error("Service unavailable: " + message) {}
};

// Local disk failures in the upload root or cache directory
class StoreError : public Error {
public:
    explicit StoreError(const std::string& message)
        : Error(message) {}
};

} // namespace docrep

#endif // DOCREP_COMMON_ERRORS_HPP
