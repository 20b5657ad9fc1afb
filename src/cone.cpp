#include "cone_mapping/cone.hpp"
#include "cone_mapping/errors.hpp"

#include <sstream>

namespace cone_mapping {

Cone::Cone(const Eigen::Vector2d &position, ConeType type) : position_(position), type_(type) {
    validatePosition(position_);
    validateType(type_);
}

Cone::Cone(double x, double y, ConeType type) : Cone(Eigen::Vector2d(x, y), type) {}

void Cone::setPosition(const Eigen::Vector2d &position) {
    validatePosition(position);
    position_ = position;
}

void Cone::setType(ConeType type) {
    validateType(type);
    type_ = type;
}

void Cone::plot(DrawingSurface &surface, const PlotOptions &options) const {
    plot(surface, defaultConeStyle(type_), options);
}

void Cone::plot(DrawingSurface &surface, const ConeStyle &style, const PlotOptions &options) const {
    // Resolve every layer before the first draw call so a bad override leaves the surface untouched
    const auto layers = coneLayers(applyOverrides(style, options), options.detail);
    for (const auto &layer : layers) {
        surface.drawMarker(position_.x(), position_.y(), layer);
    }
}

bool Cone::operator==(const Cone &other) const {
    return position_ == other.position_ && type_ == other.type_;
}

bool Cone::operator!=(const Cone &other) const {
    return !(*this == other);
}

void Cone::validatePosition(const Eigen::Vector2d &position) {
    if (!position.allFinite()) {
        std::ostringstream message;
        message << "cone position (" << position.x() << ", " << position.y() << ") is not finite";
        throw InvalidPositionError(message.str());
    }
}

void Cone::validateType(ConeType type) {
    if (!isValidConeType(type)) {
        throw InvalidCategoryError("cone type value " + std::to_string(static_cast<int>(type)) +
                                   " is not a valid cone type");
    }
}

std::ostream &operator<<(std::ostream &os, const Cone &cone) {
    return os << "Cone(" << cone.x() << ", " << cone.y() << ", " << cone.type() << ")";
}

}  // namespace cone_mapping

std::size_t std::hash<cone_mapping::Cone>::operator()(const cone_mapping::Cone &cone) const noexcept {
    // + 0.0 folds -0.0 into 0.0, the two compare equal
    std::size_t seed = std::hash<double>()(cone.x() + 0.0);
    const auto combine = [&seed](std::size_t value) {
        seed ^= value + 0x9e3779b9 + (seed << 6) + (seed >> 2);
    };
    combine(std::hash<double>()(cone.y() + 0.0));
    combine(std::hash<int>()(static_cast<int>(cone.type())));
    return seed;
}
