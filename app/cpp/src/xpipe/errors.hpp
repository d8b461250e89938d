#pragma once

#include <magic_enum.hpp>
#include <stdexcept>
#include <string>

namespace xpipe {

// Failure classes of the transfer engine
enum class ErrorKind {
    INVALID_REFERENCE,
    CONNECTION_NOT_FOUND,
    SESSION_ERROR,
    PROBE_FAILED,
    TRANSFER_IO_ERROR
};

class TransferError : public std::runtime_error {
   public:
    TransferError(ErrorKind kind, const std::string& message)
        : std::runtime_error(std::string(magic_enum::enum_name(kind)) + ": " + message),
          _kind(kind) {
    }
    ErrorKind kind() const {
        return _kind;
    }

   private:
    ErrorKind _kind;
};

// HTTP status >= 300 returned by the daemon
class ApiError : public std::runtime_error {
   public:
    ApiError(unsigned status, const std::string& message)
        : std::runtime_error("HTTP error: " + std::to_string(status) + (message.empty() ? "" : " (" + message + ")")),
          _status(status) {
    }
    unsigned status() const {
        return _status;
    }

   private:
    unsigned _status;
};

// Bad command line, reported with the usage text
class UsageError : public std::invalid_argument {
   public:
    explicit UsageError(const std::string& message)
        : std::invalid_argument(message) {
    }
};

// Run function, re-throwing any non-TransferError failure as the given kind
template <typename Function>
auto with_error_kind(ErrorKind kind, const std::string& what, Function&& function) -> decltype(function()) {
    try {
        return function();
    } catch (const TransferError&) {
        throw;
    } catch (const std::exception& e) {
        throw TransferError(kind, what + ": " + e.what());
    }
}
}  // namespace xpipe
