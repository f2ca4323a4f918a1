#ifndef VOXPOSE_ERRORS_HPP
#define VOXPOSE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace voxpose {

// Non-finite or near-zero-norm quaternion.
class InvalidQuaternionError : public std::invalid_argument {
public:
    explicit InvalidQuaternionError(const std::string& what) : std::invalid_argument(what) {}
};

// Matrix that is not a rigid transform (rotation block not orthonormal,
// reflection, or bottom row other than 0 0 0 1).
class InvalidTransformError : public std::invalid_argument {
public:
    explicit InvalidTransformError(const std::string& what) : std::invalid_argument(what) {}
};

// No occupied voxel for an instance, so there is no centroid to anchor on.
class EmptyOccupancyError : public std::runtime_error {
public:
    explicit EmptyOccupancyError(const std::string& what) : std::runtime_error(what) {}
};

class UnsupportedLossModeError : public std::invalid_argument {
public:
    explicit UnsupportedLossModeError(const std::string& what) : std::invalid_argument(what) {}
};

} // namespace voxpose

#endif // VOXPOSE_ERRORS_HPP
