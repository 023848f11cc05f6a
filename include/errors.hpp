#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

// Base of every error raised by the impedance pipeline. All of them are fatal.
struct ToroidError : public std::runtime_error {
    explicit ToroidError(const std::string& what) : std::runtime_error(what) {}
};

// Input table is missing, unreadable or malformed
struct DataFormatError : public ToroidError {
    explicit DataFormatError(const std::string& what) : ToroidError(what) {}
};

// Header row does not carry the frequency, mu' and mu'' columns
struct MissingColumnError : public ToroidError {
    explicit MissingColumnError(const std::string& what) : ToroidError(what) {}
};

// Division by zero, degenerate geometry or an invalid configuration value
struct NumericDomainError : public ToroidError {
    explicit NumericDomainError(const std::string& what) : ToroidError(what) {}
};

#endif // ERRORS_HPP
