#pragma once

#include <stdexcept>
#include <string>

namespace rnnsearch {

// Invalid or inconsistent model configuration. Raised while parsing or constructing, never recovered.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& msg) : std::runtime_error(msg) {}
};

// Paired tensors (sequence/mask, representation/mask, ...) disagree in rank, length or batch size.
class ShapeMismatchError : public std::runtime_error {
public:
    explicit ShapeMismatchError(const std::string& msg) : std::runtime_error(msg) {}
};

// A batch item with an entirely masked-out source sequence reached attention.
class DegenerateInputError : public std::runtime_error {
public:
    explicit DegenerateInputError(const std::string& msg) : std::runtime_error(msg) {}
};

}  // namespace rnnsearch
