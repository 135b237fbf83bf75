/**
 * @file errors.hpp
 * @brief Exception hierarchy shared by every PhishLedger component
 */

#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace PhishLedger {

enum class ErrorKind {
    Validation,
    NotFound,
    Conflict,
    Storage,
    Config
};

const char* error_kind_name(ErrorKind kind);

/**
 * @brief Base of all PhishLedger errors
 *
 * Every error carries its kind so callers can decide between fixing the
 * input (Validation), re-looking up (Conflict) or retrying later (Storage).
 */
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

    bool retriable() const { return kind_ == ErrorKind::Storage; }

private:
    ErrorKind kind_;
};

class ValidationError : public Error {
public:
    explicit ValidationError(const std::string& message)
        : Error(ErrorKind::Validation, message) {}
};

class NotFoundError : public Error {
public:
    explicit NotFoundError(const std::string& message)
        : Error(ErrorKind::NotFound, message) {}
};

class ConflictError : public Error {
public:
    explicit ConflictError(const std::string& message)
        : Error(ErrorKind::Conflict, message) {}
};

/**
 * @brief Store unavailable or failed in a way the caller may retry
 */
class StorageError : public Error {
public:
    StorageError(const std::string& message, std::string sqlstate = {})
        : Error(ErrorKind::Storage, message), sqlstate_(std::move(sqlstate)) {}

    const std::string& sqlstate() const { return sqlstate_; }

private:
    std::string sqlstate_;
};

class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& message)
        : Error(ErrorKind::Config, message) {}
};

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Validation: return "ValidationError";
        case ErrorKind::NotFound:   return "NotFound";
        case ErrorKind::Conflict:   return "ConflictError";
        case ErrorKind::Storage:    return "StorageError";
        case ErrorKind::Config:     return "ConfigError";
    }
    return "Error";
}

} // namespace PhishLedger
