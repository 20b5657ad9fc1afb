#ifndef CONE_MAPPING_CONE_YAML_HPP
#define CONE_MAPPING_CONE_YAML_HPP

#include <yaml-cpp/yaml.h>

#include "cone_mapping/camera.hpp"
#include "cone_mapping/cone.hpp"
#include "cone_mapping/cone_array.hpp"

namespace cone_mapping {

// Reads a map of the form {x: 1.0, y: 2.0, type: blue}.
// Throws InvalidElementError if the node is not such a map, InvalidPositionError
// for non numeric or non finite coordinates and InvalidCategoryError for an unknown type.
Cone coneFromYaml(const YAML::Node &node);

// Reads a sequence of cone maps, a null node reads as an empty array
ConeArray coneArrayFromYaml(const YAML::Node &node);

// Validates every element of the sequence first, the array is left untouched on failure
void extendFromYaml(ConeArray &array, const YAML::Node &node);

// Reads {x, y, orientation, focal_angle, focal_length}, angles in radians.
// Throws InvalidCameraError for a missing or non numeric field and for a field of
// view the camera rejects, InvalidPositionError for a bad position.
Camera cameraFromYaml(const YAML::Node &node);

}  // namespace cone_mapping

#endif  // CONE_MAPPING_CONE_YAML_HPP
