#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace capbox {

class CapboxError : public std::runtime_error {
public:
    explicit CapboxError(const std::string& message) : std::runtime_error(message) {}
};

// Vector or matrix length disagrees with the fixed feature layout.
class DimensionMismatch : public CapboxError {
public:
    explicit DimensionMismatch(const std::string& message)
        : CapboxError("Dimension mismatch: " + message) {}
};

// Raised by cholesky(); invert_symmetric() recovers from it.
class NotPositiveDefinite : public CapboxError {
public:
    explicit NotPositiveDefinite(size_t row)
        : CapboxError("Matrix not positive definite at diagonal " + std::to_string(row)),
          row_(row) {}

    size_t row() const { return row_; }

private:
    size_t row_;
};

class PersistenceError : public CapboxError {
public:
    explicit PersistenceError(const std::string& message)
        : CapboxError("Persistence error: " + message) {}
};

class ConfigError : public CapboxError {
public:
    explicit ConfigError(const std::string& message)
        : CapboxError("Config error: " + message) {}
};

class FormatError : public CapboxError {
public:
    explicit FormatError(const std::string& message)
        : CapboxError("Format error: " + message) {}
};

}  // namespace capbox
