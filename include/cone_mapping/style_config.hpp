#ifndef CONE_MAPPING_STYLE_CONFIG_HPP
#define CONE_MAPPING_STYLE_CONFIG_HPP

#include <yaml-cpp/yaml.h>
#include <optional>
#include <string>

#include "cone_mapping/plot_style.hpp"

namespace cone_mapping {

/**
 * Plot options and per-category style overrides read from YAML:
 *
 *   marker_size: 8.0        # optional, overrides every category
 *   detail: true
 *   legend: true
 *   styles:
 *     blue:
 *       base_color: "#1f4bd8"
 *       marker_size: 7.0    # missing fields fall back to the category default
 *
 * The top level keys (marker_size, color, marker) apply to every category and
 * win over the per-category entries: with `color: black` a blue base_color
 * given under styles is not drawn. Leave them out to keep per-category colours.
 *
 * A failed load is logged, returns false and keeps the previous configuration.
 */
class StyleConfig {
public:
    PlotOptions options;
    StyleMap styles;

    StyleConfig() = default;
    explicit StyleConfig(const std::string &config_file) {
        loadConfig(config_file);
    }

    bool loadConfig(const std::string &config_file);
    bool loadConfig(const YAML::Node &config);

private:
    static ConeStyle parseStyle(const YAML::Node &node, ConeType type);

    template <typename T>
    static void loadParameter(const YAML::Node &config, const std::string &key, T &parameter) {
        if (config[key]) {
            parameter = config[key].as<T>();
        }
    }

    template <typename T>
    static void loadParameter(const YAML::Node &config, const std::string &key, std::optional<T> &parameter) {
        if (config[key]) {
            parameter = config[key].as<T>();
        }
    }
};

}  // namespace cone_mapping

#endif  // CONE_MAPPING_STYLE_CONFIG_HPP
