#pragma once

#include <stdexcept>
#include <string>

namespace asn2ip {

enum class ErrorCode {
    ConnectionError,
    ProtocolError,
    NotFound,
    StorageNotFound,
    StorageError
};

const char* error_code_name(ErrorCode code);

// Base for every failure the core reports to its caller.
class Error : public std::runtime_error {
public:
    Error(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

// Dial, write or read failure on the whois connection (including deadlines)
class ConnectionError : public Error {
public:
    explicit ConnectionError(const std::string& message)
        : Error(ErrorCode::ConnectionError, message) {}
};

// Malformed reply header or an unparsable network token
class ProtocolError : public Error {
public:
    explicit ProtocolError(const std::string& message)
        : Error(ErrorCode::ProtocolError, message) {}
};

class NotFoundError : public Error {
public:
    explicit NotFoundError(const std::string& asn)
        : Error(ErrorCode::NotFound, "as " + asn + " not found"), asn_(asn) {}

    const std::string& asn() const { return asn_; }

private:
    std::string asn_;
};

class StorageNotFoundError : public Error {
public:
    explicit StorageNotFoundError(const std::string& name)
        : Error(ErrorCode::StorageNotFound, "storage type not found: '" + name + "'"),
          name_(name) {}

    const std::string& name() const { return name_; }

private:
    std::string name_;
};

class StorageError : public Error {
public:
    explicit StorageError(const std::string& message)
        : Error(ErrorCode::StorageError, message) {}
};

} // namespace asn2ip
