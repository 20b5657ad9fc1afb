#include "cone_mapping/camera.hpp"
#include "cone_mapping/errors.hpp"

#include <cmath>
#include <sstream>
#include <string>
#include <utility>

#include "rclcpp/rclcpp.hpp"

namespace cone_mapping {

namespace {

// Cross product tolerance for points lying on a triangle edge
const double EDGE_TOLERANCE = 1e-9;

const double CAMERA_MARKER_SIZE = 4.0;

double cross(const Eigen::Vector2d &u, const Eigen::Vector2d &v) {
    return u.x() * v.y() - u.y() * v.x();
}

void validatePosition(const Eigen::Vector2d &position) {
    if (!position.allFinite()) {
        std::ostringstream message;
        message << "camera position (" << position.x() << ", " << position.y() << ") is not finite";
        throw InvalidPositionError(message.str());
    }
}

void validateOrientation(double orientation) {
    if (!std::isfinite(orientation)) {
        throw InvalidCameraError("camera orientation must be finite");
    }
}

void validateFocalAngle(double focal_angle) {
    // At pi or more the two triangles no longer cover the field of view
    if (!(focal_angle > 0.0 && focal_angle < M_PI)) {
        throw InvalidCameraError("camera focal angle must be in (0, pi), got " + std::to_string(focal_angle));
    }
}

void validateFocalLength(double focal_length) {
    if (!(focal_length > 0.0 && std::isfinite(focal_length))) {
        throw InvalidCameraError("camera focal length must be positive, got " + std::to_string(focal_length));
    }
}

Eigen::Vector2d direction(double angle) {
    return Eigen::Vector2d(std::cos(angle), std::sin(angle));
}

}  // namespace

bool Triangle::contains(const Eigen::Vector2d &point) const {
    const double d1 = cross(b - a, point - a);
    const double d2 = cross(c - b, point - b);
    const double d3 = cross(a - c, point - c);

    const bool has_negative = d1 < -EDGE_TOLERANCE || d2 < -EDGE_TOLERANCE || d3 < -EDGE_TOLERANCE;
    const bool has_positive = d1 > EDGE_TOLERANCE || d2 > EDGE_TOLERANCE || d3 > EDGE_TOLERANCE;

    return !(has_negative && has_positive);
}

Camera::Camera(const Eigen::Vector2d &position, double orientation, double focal_angle, double focal_length)
    : position_(position), orientation_(orientation), focal_angle_(focal_angle), focal_length_(focal_length) {
    validatePosition(position_);
    validateOrientation(orientation_);
    validateFocalAngle(focal_angle_);
    validateFocalLength(focal_length_);
    rebuildArea();
}

void Camera::setPosition(const Eigen::Vector2d &position) {
    validatePosition(position);
    position_ = position;
    rebuildArea();
}

void Camera::setOrientation(double orientation) {
    validateOrientation(orientation);
    orientation_ = orientation;
    rebuildArea();
}

void Camera::setFocalAngle(double focal_angle) {
    validateFocalAngle(focal_angle);
    focal_angle_ = focal_angle;
    rebuildArea();
}

void Camera::setFocalLength(double focal_length) {
    validateFocalLength(focal_length);
    focal_length_ = focal_length;
    rebuildArea();
}

bool Camera::contains(const Cone &cone) const {
    return detection_area_[0].contains(cone.position()) || detection_area_[1].contains(cone.position());
}

const std::vector<ConeArray> &Camera::detect(const std::vector<ConeArray> &cone_arrays) {
    std::vector<ConeArray> detected;
    detected.reserve(cone_arrays.size());

    size_t total = 0;
    for (const auto &array : cone_arrays) {
        ConeArray in_view;
        for (const auto &cone : array) {
            if (contains(cone)) in_view.append(cone);
        }
        total += in_view.size();
        detected.push_back(std::move(in_view));
    }

    detected_ = std::move(detected);
    RCLCPP_DEBUG(rclcpp::get_logger("Camera"), "Detected %zu cones in %zu arrays", total, detected_.size());
    return detected_;
}

void Camera::plot(DrawingSurface &surface, const std::string &color) const {
    for (const auto &triangle : detection_area_) {
        surface.drawOutline({triangle.a.x(), triangle.b.x(), triangle.c.x()},
                            {triangle.a.y(), triangle.b.y(), triangle.c.y()}, color);
    }
    surface.drawMarker(position_.x(), position_.y(), MarkerStyle{color, "o", CAMERA_MARKER_SIZE});
}

void Camera::rebuildArea() {
    const Eigen::Vector2d tip = position_ + focal_length_ * direction(orientation_);
    const Eigen::Vector2d left = position_ + focal_length_ * direction(orientation_ - focal_angle_ / 2);
    const Eigen::Vector2d right = position_ + focal_length_ * direction(orientation_ + focal_angle_ / 2);

    detection_area_ = {Triangle{position_, left, right}, Triangle{left, right, tip}};
}

std::ostream &operator<<(std::ostream &os, const Camera &camera) {
    return os << "Camera(x: " << camera.position().x() << ", y: " << camera.position().y()
              << ", orientation: " << camera.orientation() << ", focal_angle: " << camera.focalAngle()
              << ", focal_length: " << camera.focalLength() << ")";
}

}  // namespace cone_mapping
