/*
plot_cone_map <config.yaml> <output.png>

Draws the cones listed under "cones" in the config with the styles of the same file.
With a "camera" entry the field of view is drawn too and the cones in it are counted.
*/
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "cone_mapping/camera.hpp"
#include "cone_mapping/cone_array.hpp"
#include "cone_mapping/cone_yaml.hpp"
#include "cone_mapping/errors.hpp"
#include "cone_mapping/plot/matplotlib_surface.hpp"
#include "cone_mapping/style_config.hpp"

const std::size_t FIGURE_WIDTH = 1200;
const std::size_t FIGURE_HEIGHT = 900;

int main(int argc, char *argv[]) {
    if (argc != 3) {
        std::cerr << "Usage: " << argv[0] << " <config.yaml> <output.png>" << std::endl;
        return 1;
    }
    const std::string config_path = argv[1];
    const std::string output_path = argv[2];

    cone_mapping::StyleConfig style_config;
    if (!style_config.loadConfig(config_path)) {
        std::cerr << "Failed to load styles from " << config_path << std::endl;
        return 1;
    }

    cone_mapping::ConeArray cones;
    std::unique_ptr<cone_mapping::Camera> camera;
    try {
        const YAML::Node config = YAML::LoadFile(config_path);
        cones = cone_mapping::coneArrayFromYaml(config["cones"]);
        if (config["camera"]) {
            camera.reset(new cone_mapping::Camera(cone_mapping::cameraFromYaml(config["camera"])));
        }
    } catch (const YAML::Exception &e) {
        std::cerr << "Failed to read " << config_path << ": " << e.what() << std::endl;
        return 1;
    } catch (const std::invalid_argument &e) {
        std::cerr << "Invalid entry in " << config_path << ": " << e.what() << std::endl;
        return 1;
    }

    if (cones.empty()) {
        std::cerr << "No cones to plot." << std::endl;
        return 1;
    }

    std::cout << "Cones read: " << cones.size() << std::endl;
    for (const auto &type : cones.categories()) {
        std::cout << "  " << type << ": " << cones.count(type) << std::endl;
    }

    if (camera) {
        const auto &in_view = camera->detect({cones}).front();
        std::cout << *camera << " sees " << in_view.size() << " cones" << std::endl;
    }

    // The surface lives until the image is written
    try {
        cone_mapping::MatplotlibSurface surface(FIGURE_WIDTH, FIGURE_HEIGHT, "Cone map");
        cones.plot(surface, style_config.styles, style_config.options);
        if (camera) camera->plot(surface);
        surface.save(output_path);
    } catch (const std::exception &e) {
        std::cerr << "Failed to plot " << output_path << ": " << e.what() << std::endl;
        return 1;
    }

    std::cout << "Saved " << output_path << std::endl;
    return 0;
}
