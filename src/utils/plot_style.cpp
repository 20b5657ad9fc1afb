#include "cone_mapping/plot_style.hpp"
#include "cone_mapping/errors.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace cone_mapping {

// Fraction of the base marker size used by each detail layer
const double STRIPE_LOW_FRACTION = 0.8;
const double MID_FRACTION = 0.6;
const double STRIPE_HIGH_FRACTION = 0.4;
const double TOP_FRACTION = 0.25;

ConeStyle defaultConeStyle(ConeType type) {
    switch (type) {
        case ConeType::BIG_ORANGE:
            return ConeStyle{"o", "#ff8c00", "#ffffff", "#ff8c00", BIG_CONE_MARKER_SIZE};
        case ConeType::BLUE:
            return ConeStyle{"o", "#0000ff", "#ffffff", "#0000ff", SMALL_CONE_MARKER_SIZE};  // white stripe
        case ConeType::YELLOW:
            return ConeStyle{"o", "#ffff00", "#000000", "#ffff00", SMALL_CONE_MARKER_SIZE};  // black stripe
        case ConeType::ORANGE:
            return ConeStyle{"o", "#ff8c00", "#ffffff", "#ff8c00", SMALL_CONE_MARKER_SIZE};
        case ConeType::UNKNOWN:
            return ConeStyle{"x", "#808080", "#808080", "#808080", SMALL_CONE_MARKER_SIZE};  // grey
    }
    throw InvalidCategoryError("no default style for cone type " + std::to_string(static_cast<int>(type)));
}

namespace {

void validateMarkerSize(double size) {
    if (!std::isfinite(size) || size <= 0.0) {
        throw std::invalid_argument("marker size must be a positive finite number, got " + std::to_string(size));
    }
}

}  // namespace

ConeStyle applyOverrides(const ConeStyle &style, const PlotOptions &options) {
    ConeStyle result = style;
    if (options.marker_size) {
        result.marker_size = *options.marker_size;
    }
    if (options.color) {
        result.base_color = *options.color;
        result.top_color = *options.color;
    }
    if (options.marker) {
        result.marker = *options.marker;
    }
    // Checked on the final size, styles built in code skip StyleConfig
    validateMarkerSize(result.marker_size);
    return result;
}

std::vector<MarkerStyle> coneLayers(const ConeStyle &style, bool detail) {
    std::vector<MarkerStyle> layers;
    layers.push_back({style.base_color, style.marker, style.marker_size});

    if (detail) {
        const double top_size = style.marker_size * TOP_FRACTION;
        layers.push_back({style.stripe_color, style.marker, style.marker_size * STRIPE_LOW_FRACTION});
        layers.push_back({style.base_color, style.marker, style.marker_size * MID_FRACTION});
        layers.push_back({style.stripe_color, style.marker, style.marker_size * STRIPE_HIGH_FRACTION});
        layers.push_back({style.top_color, style.marker, top_size});
        layers.push_back({TIP_COLOR, style.marker, top_size / 2});
    }
    return layers;
}

}  // namespace cone_mapping
