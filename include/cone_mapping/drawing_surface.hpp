#ifndef CONE_MAPPING_DRAWING_SURFACE_HPP
#define CONE_MAPPING_DRAWING_SURFACE_HPP

#include <string>
#include <vector>

namespace cone_mapping {

struct MarkerStyle {
    std::string color;   // Matplotlib colour, e.g. "#0000ff"
    std::string marker;  // Matplotlib marker, e.g. "o"
    double size;         // Marker size in points
};

struct LegendEntry {
    std::string label;
    MarkerStyle style;
};

/**
 * 2D target the cones are drawn on. The caller owns it: it is created before
 * plotting and saved or released once every plot call is done.
 */
class DrawingSurface {
public:
    virtual ~DrawingSurface() = default;

    virtual void drawMarker(double x, double y, const MarkerStyle &style) = 0;
    virtual void drawText(double x, double y, const std::string &text) = 0;
    virtual void drawLegend(const std::vector<LegendEntry> &entries) = 0;
    // Closed outline through the given vertices, the last one is joined back to the first
    virtual void drawOutline(const std::vector<double> &xs, const std::vector<double> &ys,
                             const std::string &color) = 0;
};

}  // namespace cone_mapping

#endif  // CONE_MAPPING_DRAWING_SURFACE_HPP
