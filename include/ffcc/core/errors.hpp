#pragma once

#include <stdexcept>
#include <string>

namespace ffcc {

class FfccError : public std::runtime_error {
public:
    explicit FfccError(const std::string& message)
        : std::runtime_error(message) {}
};

// Caller handed values outside the domain of an operation (e.g. negative RGB).
class InvalidInputError : public FfccError {
public:
    explicit InvalidInputError(const std::string& message)
        : FfccError("Invalid input: " + message) {}
};

class ShapeMismatchError : public FfccError {
public:
    explicit ShapeMismatchError(const std::string& message)
        : FfccError("Shape mismatch: " + message) {}
};

// A documented precondition on values (not shapes) does not hold.
class InvariantViolationError : public FfccError {
public:
    explicit InvariantViolationError(const std::string& message)
        : FfccError("Invariant violation: " + message) {}
};

class ConfigError : public FfccError {
public:
    explicit ConfigError(const std::string& message)
        : FfccError("Config error: " + message) {}
};

class ValidationError : public FfccError {
public:
    explicit ValidationError(const std::string& message)
        : FfccError("Validation error: " + message) {}
};

class IOError : public FfccError {
public:
    explicit IOError(const std::string& message)
        : FfccError("I/O error: " + message) {}
};

} // namespace ffcc
