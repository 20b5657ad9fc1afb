#ifndef CONE_MAPPING_ERRORS_HPP
#define CONE_MAPPING_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace cone_mapping {

// Common base so callers can catch every validation failure of the library at once
class ConeMappingError {
public:
    virtual ~ConeMappingError() = default;
    virtual const char *what() const noexcept = 0;
};

// Position is not a finite 2D coordinate
class InvalidPositionError : public std::invalid_argument, public ConeMappingError {
public:
    explicit InvalidPositionError(const std::string &message) : std::invalid_argument(message) {}
    const char *what() const noexcept override { return std::invalid_argument::what(); }
};

// Cone type outside the closed ConeType enumeration
class InvalidCategoryError : public std::invalid_argument, public ConeMappingError {
public:
    explicit InvalidCategoryError(const std::string &message) : std::invalid_argument(message) {}
    const char *what() const noexcept override { return std::invalid_argument::what(); }
};

// Something that is not a cone was offered to a ConeArray
class InvalidElementError : public std::invalid_argument, public ConeMappingError {
public:
    explicit InvalidElementError(const std::string &message) : std::invalid_argument(message) {}
    const char *what() const noexcept override { return std::invalid_argument::what(); }
};

// Camera field of view that cannot be built (angle outside (0, pi), length not positive)
class InvalidCameraError : public std::invalid_argument, public ConeMappingError {
public:
    explicit InvalidCameraError(const std::string &message) : std::invalid_argument(message) {}
    const char *what() const noexcept override { return std::invalid_argument::what(); }
};

class ConeIndexError : public std::out_of_range, public ConeMappingError {
public:
    explicit ConeIndexError(const std::string &message) : std::out_of_range(message) {}
    const char *what() const noexcept override { return std::out_of_range::what(); }
};

}  // namespace cone_mapping

#endif  // CONE_MAPPING_ERRORS_HPP
