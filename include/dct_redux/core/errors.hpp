#pragma once

#include <stdexcept>
#include <string>

namespace dct_redux {

class DctReduxError : public std::runtime_error {
public:
    explicit DctReduxError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public DctReduxError {
public:
    explicit ConfigError(const std::string& message)
        : DctReduxError("Config error: " + message) {}
};

class ValidationError : public DctReduxError {
public:
    explicit ValidationError(const std::string& message)
        : DctReduxError("Validation error: " + message) {}
};

class IOError : public DctReduxError {
public:
    explicit IOError(const std::string& message)
        : DctReduxError("I/O error: " + message) {}
};

class FitsError : public IOError {
public:
    explicit FitsError(const std::string& message)
        : IOError("FITS error: " + message) {}
};

class FileNotFoundError : public FitsError {
public:
    explicit FileNotFoundError(const std::string& path)
        : FitsError("File not found: " + path) {}
};

class UnsupportedFormatError : public FitsError {
public:
    explicit UnsupportedFormatError(const std::string& message)
        : FitsError("Unsupported format: " + message) {}
};

// Missing or mistyped header card
class HeaderError : public DctReduxError {
public:
    explicit HeaderError(const std::string& message)
        : DctReduxError("Header error: " + message) {}
};

// Invalid prescan/active/postscan partition
class GeometryError : public DctReduxError {
public:
    explicit GeometryError(const std::string& message)
        : DctReduxError("Geometry error: " + message) {}
};

class EmptyRegionError : public DctReduxError {
public:
    explicit EmptyRegionError(const std::string& message)
        : DctReduxError("Empty region: " + message) {}
};

class ShapeMismatchError : public DctReduxError {
public:
    explicit ShapeMismatchError(const std::string& message)
        : DctReduxError("Shape mismatch: " + message) {}
};

class DivisionByZeroError : public DctReduxError {
public:
    explicit DivisionByZeroError(const std::string& message)
        : DctReduxError("Division by zero: " + message) {}
};

class EmptyInputError : public DctReduxError {
public:
    explicit EmptyInputError(const std::string& message)
        : DctReduxError("Empty input: " + message) {}
};

class NoHeaderError : public DctReduxError {
public:
    NoHeaderError() : DctReduxError("No header records found") {}
};

} // namespace dct_redux
