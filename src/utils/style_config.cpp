#include "cone_mapping/style_config.hpp"
#include "cone_mapping/cone_type.hpp"

#include <cmath>
#include <stdexcept>

#include "rclcpp/rclcpp.hpp"

namespace cone_mapping {

bool StyleConfig::loadConfig(const std::string &config_file) {
    YAML::Node config;
    try {
        config = YAML::LoadFile(config_file);
    } catch (const std::exception &e) {
        RCLCPP_ERROR(rclcpp::get_logger("StyleConfig"), "Failed to read %s: %s", config_file.c_str(), e.what());
        return false;
    }

    if (!loadConfig(config)) {
        RCLCPP_ERROR(rclcpp::get_logger("StyleConfig"), "Keeping previous styles, %s was rejected", config_file.c_str());
        return false;
    }
    RCLCPP_INFO(rclcpp::get_logger("StyleConfig"), "Loaded %zu cone styles from %s", styles.size(), config_file.c_str());
    return true;
}

bool StyleConfig::loadConfig(const YAML::Node &config) {
    try {
        if (!config.IsMap()) {
            throw std::runtime_error("Invalid config, expected a map at the top level.");
        }

        PlotOptions new_options;
        loadParameter(config, "marker_size", new_options.marker_size);
        loadParameter(config, "color", new_options.color);
        loadParameter(config, "marker", new_options.marker);
        loadParameter(config, "detail", new_options.detail);
        loadParameter(config, "annotate", new_options.annotate);
        loadParameter(config, "legend", new_options.legend);

        if (new_options.marker_size && !(*new_options.marker_size > 0.0 && std::isfinite(*new_options.marker_size))) {
            throw std::runtime_error("'marker_size' must be a positive number.");
        }

        StyleMap new_styles;
        if (config["styles"]) {
            if (!config["styles"].IsMap()) {
                throw std::runtime_error("'styles' must map cone types to styles.");
            }
            for (const auto &entry : config["styles"]) {
                const ConeType type = coneTypeFromName(entry.first.as<std::string>());
                new_styles[type] = parseStyle(entry.second, type);
            }
        }

        options = new_options;
        styles = new_styles;
        return true;
    } catch (const std::exception &e) {
        RCLCPP_ERROR(rclcpp::get_logger("StyleConfig"), "Failed to load config: %s", e.what());
        return false;
    }
}

ConeStyle StyleConfig::parseStyle(const YAML::Node &node, ConeType type) {
    if (!node.IsMap()) {
        throw std::runtime_error("Style of '" + coneTypeName(type) + "' must be a map.");
    }

    ConeStyle style = defaultConeStyle(type);
    loadParameter(node, "marker", style.marker);
    loadParameter(node, "base_color", style.base_color);
    loadParameter(node, "stripe_color", style.stripe_color);
    loadParameter(node, "top_color", style.top_color);
    loadParameter(node, "marker_size", style.marker_size);

    if (!(style.marker_size > 0.0 && std::isfinite(style.marker_size))) {
        throw std::runtime_error("'marker_size' of '" + coneTypeName(type) + "' must be a positive number.");
    }
    return style;
}

}  // namespace cone_mapping
