#ifndef ROOTVISION_ERRORS_HPP
#define ROOTVISION_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace RootVision {

// Raised when a mask does not have the expected region layout
// (e.g. a plate mask without any true pixel).
class ShapeError : public std::runtime_error {
public:
    explicit ShapeError(const std::string& what) : std::runtime_error(what) {}
};

// Raised for invalid parameters or mismatched inputs.
class ValueError : public std::invalid_argument {
public:
    explicit ValueError(const std::string& what) : std::invalid_argument(what) {}
};

} // namespace RootVision

#endif // ROOTVISION_ERRORS_HPP
