#pragma once

#include <stdexcept>
#include <string>

namespace Tsnbench {

/**
 * Raised when a statistics computation receives no samples.
 */
class InsufficientData : public std::runtime_error {
public:
    explicit InsufficientData(const std::string& what)
        : std::runtime_error(what) {}
};

/**
 * Raised when two series that must be compared index by index differ in length.
 */
class LengthMismatch : public std::invalid_argument {
public:
    LengthMismatch(size_t first_size, size_t second_size)
        : std::invalid_argument("Length mismatch: " + std::to_string(first_size) +
                                " vs " + std::to_string(second_size)),
          first_size_(first_size), second_size_(second_size) {}

    size_t first_size() const { return first_size_; }
    size_t second_size() const { return second_size_; }

private:
    size_t first_size_;
    size_t second_size_;
};

} // namespace Tsnbench
