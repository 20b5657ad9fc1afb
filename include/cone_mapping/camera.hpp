#ifndef CONE_MAPPING_CAMERA_HPP
#define CONE_MAPPING_CAMERA_HPP

#include <array>
#include <ostream>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "cone_mapping/cone.hpp"
#include "cone_mapping/cone_array.hpp"
#include "cone_mapping/drawing_surface.hpp"

namespace cone_mapping {

struct Triangle {
    Eigen::Vector2d a;
    Eigen::Vector2d b;
    Eigen::Vector2d c;

    // Points on an edge or a vertex count as inside
    bool contains(const Eigen::Vector2d &point) const;
};

/**
 * Onboard camera seen from above.
 *
 * The field of view is the triangle (position, left boundary, right boundary)
 * plus the triangle closing it at focal_length straight ahead, with
 *
 *   left boundary  = position + focal_length * (cos(orientation - focal_angle / 2), sin(...))
 *   right boundary = position + focal_length * (cos(orientation + focal_angle / 2), sin(...))
 *
 * Angles are in radians. The area is rebuilt by every setter.
 */
class Camera {
public:
    // Throws InvalidPositionError for a non finite position, InvalidCameraError
    // for a non finite orientation, focal_angle outside (0, pi) or focal_length <= 0
    Camera(const Eigen::Vector2d &position, double orientation, double focal_angle, double focal_length);

    const Eigen::Vector2d &position() const { return position_; }
    double orientation() const { return orientation_; }
    double focalAngle() const { return focal_angle_; }
    double focalLength() const { return focal_length_; }

    // Same checks as the constructor, the camera is unchanged when they throw
    void setPosition(const Eigen::Vector2d &position);
    void setOrientation(double orientation);
    void setFocalAngle(double focal_angle);
    void setFocalLength(double focal_length);

    const std::array<Triangle, 2> &detectionArea() const { return detection_area_; }

    bool contains(const Cone &cone) const;

    // One array per input array with the cones in view, relative order kept.
    // The result is also kept until the next call, see detected().
    const std::vector<ConeArray> &detect(const std::vector<ConeArray> &cone_arrays);
    const std::vector<ConeArray> &detected() const { return detected_; }

    // Outlines of both triangles and a marker at the camera position
    void plot(DrawingSurface &surface, const std::string &color = "#000000") const;

private:
    void rebuildArea();

    Eigen::Vector2d position_;
    double orientation_;
    double focal_angle_;
    double focal_length_;

    std::array<Triangle, 2> detection_area_;
    std::vector<ConeArray> detected_;
};

std::ostream &operator<<(std::ostream &os, const Camera &camera);

}  // namespace cone_mapping

#endif  // CONE_MAPPING_CAMERA_HPP
