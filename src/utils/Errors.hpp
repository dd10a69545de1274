#pragma once
#include <stdexcept>
#include <string>

/*
  Error taxonomy shared by the scheduling core.

  Services raise these internally and convert them to tagged outcomes
  (ErrorKind + message) at their public boundary.
*/

enum class ErrorKind {
    NONE = 0,
    VALIDATION,
    NOT_FOUND,
    PERSISTENCE,
    NOTIFICATION,
    CONFIGURATION,
    INVALID_STATE
};

const char* errorKindName(ErrorKind kind);

class ValidationError : public std::runtime_error {
public:
    ValidationError(const std::string& msg, const std::string& field = "")
        : std::runtime_error(msg), field(field) {}

    std::string field;
};

class NotFoundError : public std::runtime_error {
public:
    explicit NotFoundError(const std::string& msg) : std::runtime_error(msg) {}
};

class PersistenceError : public std::runtime_error {
public:
    explicit PersistenceError(const std::string& msg) : std::runtime_error(msg) {}
};

class NotificationError : public std::runtime_error {
public:
    explicit NotificationError(const std::string& msg) : std::runtime_error(msg) {}
};

class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& msg) : std::runtime_error(msg) {}
};

class InvalidStateError : public std::runtime_error {
public:
    explicit InvalidStateError(const std::string& msg) : std::runtime_error(msg) {}
};
