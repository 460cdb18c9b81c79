//
// errors.hpp - Exception kinds raised by the evaluation utilities
//

#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

// Sequence or table dimensions that do not line up (row names vs rows,
// metric rows vs column names, visualization inputs of unequal length)
class ShapeMismatchError : public std::runtime_error {
public:
    explicit ShapeMismatchError(const std::string& message)
        : std::runtime_error(message) {}
};

// Unknown storage folder mode
class InvalidModeError : public std::runtime_error {
public:
    explicit InvalidModeError(const std::string& message)
        : std::runtime_error(message) {}
};

#endif //ERRORS_HPP
