#ifndef CONE_MAPPING_CONE_HPP
#define CONE_MAPPING_CONE_HPP

#include <cstddef>
#include <functional>
#include <ostream>

#include <Eigen/Dense>  // For the 2D position

#include "cone_mapping/cone_type.hpp"
#include "cone_mapping/drawing_surface.hpp"
#include "cone_mapping/plot_style.hpp"

namespace cone_mapping {

/**
 * A detected track-boundary cone: a 2D position and the cone type.
 *
 * Both are validated on construction and by the setters, a Cone never holds a
 * non-finite position or a type outside ConeType.
 */
class Cone {
public:
    // Throws InvalidPositionError or InvalidCategoryError
    Cone(const Eigen::Vector2d &position, ConeType type);
    Cone(double x, double y, ConeType type);

    const Eigen::Vector2d &position() const { return position_; }
    double x() const { return position_.x(); }
    double y() const { return position_.y(); }
    ConeType type() const { return type_; }

    // Both leave the cone unchanged when they throw
    void setPosition(const Eigen::Vector2d &position);
    void setType(ConeType type);

    // Draws the cone with the default style of its type
    void plot(DrawingSurface &surface, const PlotOptions &options = PlotOptions()) const;
    void plot(DrawingSurface &surface, const ConeStyle &style, const PlotOptions &options = PlotOptions()) const;

    bool operator==(const Cone &other) const;
    bool operator!=(const Cone &other) const;

private:
    static void validatePosition(const Eigen::Vector2d &position);
    static void validateType(ConeType type);

    Eigen::Vector2d position_;
    ConeType type_;
};

std::ostream &operator<<(std::ostream &os, const Cone &cone);

}  // namespace cone_mapping

namespace std {

// Consistent with operator==, so cones can key unordered sets and maps
template <>
struct hash<cone_mapping::Cone> {
    std::size_t operator()(const cone_mapping::Cone &cone) const noexcept;
};

}  // namespace std

#endif  // CONE_MAPPING_CONE_HPP
