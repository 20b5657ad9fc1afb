#include "cone_mapping/plot/matplotlib_surface.hpp"

#include <map>
#include <stdexcept>

#include <matplotlibcpp.h>

#include "rclcpp/rclcpp.hpp"

namespace plt = matplotlibcpp;

namespace cone_mapping {

namespace {

std::map<std::string, std::string> markerKeywords(const MarkerStyle &style) {
    return {
        {"color", style.color},
        {"marker", style.marker},
        {"markersize", std::to_string(style.size)},
        {"linestyle", "None"}  // single points, never joined
    };
}

}  // namespace

MatplotlibSurface::MatplotlibSurface(std::size_t width_px, std::size_t height_px, const std::string &title) {
    plt::figure_size(width_px, height_px);
    if (!title.empty()) {
        plt::title(title);
    }
}

MatplotlibSurface::~MatplotlibSurface() {
    // plt::close() throws when the interpreter is already in a bad state
    try {
        plt::close();
    } catch (const std::exception &e) {
        RCLCPP_WARN(rclcpp::get_logger("MatplotlibSurface"), "Failed to close the figure: %s", e.what());
    }
}

void MatplotlibSurface::drawMarker(double x, double y, const MarkerStyle &style) {
    if (!plt::plot(std::vector<double>{x}, std::vector<double>{y}, markerKeywords(style))) {
        throw std::runtime_error("matplotlib failed to draw a marker");
    }
}

void MatplotlibSurface::drawText(double x, double y, const std::string &text) {
    plt::text(x, y, text);
}

void MatplotlibSurface::drawLegend(const std::vector<LegendEntry> &entries) {
    // Empty labelled lines only carry the handles of the legend
    for (const auto &entry : entries) {
        auto keywords = markerKeywords(entry.style);
        keywords["label"] = entry.label;
        plt::plot(std::vector<double>{}, std::vector<double>{}, keywords);
    }
    plt::legend();
}

void MatplotlibSurface::drawOutline(const std::vector<double> &xs, const std::vector<double> &ys,
                                    const std::string &color) {
    if (xs.empty() || xs.size() != ys.size()) {
        throw std::invalid_argument("outline needs as many x as y coordinates");
    }
    std::vector<double> closed_xs = xs;
    std::vector<double> closed_ys = ys;
    closed_xs.push_back(xs.front());
    closed_ys.push_back(ys.front());

    const std::map<std::string, std::string> keywords = {{"color", color}, {"linestyle", "-"}};
    if (!plt::plot(closed_xs, closed_ys, keywords)) {
        throw std::runtime_error("matplotlib failed to draw an outline");
    }
}

void MatplotlibSurface::save(const std::string &file_name) {
    finishFigure();
    plt::save(file_name);
}

void MatplotlibSurface::show() {
    finishFigure();
    plt::show();
}

void MatplotlibSurface::finishFigure() {
    plt::axis("equal");
    plt::grid(true);
}

}  // namespace cone_mapping
