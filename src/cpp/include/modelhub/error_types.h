#pragma once

#include <stdexcept>
#include <string>

namespace modelhub {

// Failure categories surfaced by the acquisition pipeline
enum class ErrorKind {
    Network,      // connection, timeout or non-success HTTP status
    Format,       // unparseable response body or URL
    Filesystem,   // permission, space or path errors
    Cancelled,    // user-initiated, not a true failure
    Unsupported,  // manual-only source used with the automatic path
    Conversion    // post-download transform failure
};

const char* error_kind_name(ErrorKind kind);

class AcquisitionError : public std::runtime_error {
public:
    AcquisitionError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

class NetworkError : public AcquisitionError {
public:
    explicit NetworkError(const std::string& message)
        : AcquisitionError(ErrorKind::Network, message) {}
};

class FormatError : public AcquisitionError {
public:
    explicit FormatError(const std::string& message)
        : AcquisitionError(ErrorKind::Format, message) {}
};

class FilesystemError : public AcquisitionError {
public:
    explicit FilesystemError(const std::string& message)
        : AcquisitionError(ErrorKind::Filesystem, message) {}
};

class CancelledError : public AcquisitionError {
public:
    CancelledError() : AcquisitionError(ErrorKind::Cancelled, "Download cancelled") {}
};

class UnsupportedSourceError : public AcquisitionError {
public:
    explicit UnsupportedSourceError(const std::string& message)
        : AcquisitionError(ErrorKind::Unsupported, message) {}
};

class ConversionError : public AcquisitionError {
public:
    explicit ConversionError(const std::string& message)
        : AcquisitionError(ErrorKind::Conversion, message) {}
};

} // namespace modelhub
