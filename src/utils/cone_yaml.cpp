#include "cone_mapping/cone_yaml.hpp"
#include "cone_mapping/errors.hpp"

#include <string>
#include <vector>

namespace cone_mapping {

namespace {

std::string describeNode(const YAML::Node &node) {
    switch (node.Type()) {
        case YAML::NodeType::Scalar:
            return "scalar \"" + node.Scalar() + "\"";
        case YAML::NodeType::Sequence:
            return "sequence";
        case YAML::NodeType::Map:
            return "map";
        case YAML::NodeType::Null:
            return "null";
        default:
            return "undefined node";
    }
}

double readCoordinate(const YAML::Node &node, const std::string &key) {
    try {
        return node[key].as<double>();
    } catch (const YAML::Exception &) {
        throw InvalidPositionError("cone coordinate '" + key + "' is not a number: " + describeNode(node[key]));
    }
}

double readCameraParameter(const YAML::Node &node, const std::string &key) {
    if (!node[key]) {
        throw InvalidCameraError("camera entry is missing the '" + key + "' key");
    }
    try {
        return node[key].as<double>();
    } catch (const YAML::Exception &) {
        throw InvalidCameraError("camera parameter '" + key + "' is not a number: " + describeNode(node[key]));
    }
}

std::vector<Cone> readCones(const YAML::Node &node) {
    std::vector<Cone> cones;
    if (!node || node.IsNull()) return cones;

    if (!node.IsSequence()) {
        throw InvalidElementError("cones must be given as a sequence, got a " + describeNode(node));
    }

    cones.reserve(node.size());
    for (const auto &element : node) {
        cones.push_back(coneFromYaml(element));
    }
    return cones;
}

}  // namespace

Cone coneFromYaml(const YAML::Node &node) {
    if (!node.IsMap()) {
        throw InvalidElementError("all elements must be cones, got a " + describeNode(node));
    }
    for (const std::string key : {"x", "y", "type"}) {
        if (!node[key]) {
            throw InvalidElementError("cone entry is missing the '" + key + "' key");
        }
    }

    const double x = readCoordinate(node, "x");
    const double y = readCoordinate(node, "y");

    if (!node["type"].IsScalar()) {
        throw InvalidCategoryError("cone type must be a name, got a " + describeNode(node["type"]));
    }
    return Cone(x, y, coneTypeFromName(node["type"].as<std::string>()));
}

ConeArray coneArrayFromYaml(const YAML::Node &node) {
    return ConeArray(readCones(node));
}

void extendFromYaml(ConeArray &array, const YAML::Node &node) {
    array.extend(readCones(node));
}

Camera cameraFromYaml(const YAML::Node &node) {
    if (!node.IsMap()) {
        throw InvalidCameraError("camera must be given as a map, got a " + describeNode(node));
    }
    for (const std::string key : {"x", "y"}) {
        if (!node[key]) {
            throw InvalidCameraError("camera entry is missing the '" + key + "' key");
        }
    }

    const Eigen::Vector2d position(readCoordinate(node, "x"), readCoordinate(node, "y"));
    return Camera(position, readCameraParameter(node, "orientation"), readCameraParameter(node, "focal_angle"),
                  readCameraParameter(node, "focal_length"));
}

}  // namespace cone_mapping
