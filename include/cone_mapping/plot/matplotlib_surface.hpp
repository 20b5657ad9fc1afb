#ifndef CONE_MAPPING_PLOT_MATPLOTLIB_SURFACE_HPP
#define CONE_MAPPING_PLOT_MATPLOTLIB_SURFACE_HPP

#include <cstddef>
#include <string>
#include <vector>

#include "cone_mapping/drawing_surface.hpp"

namespace cone_mapping {

/**
 * DrawingSurface backed by a matplotlib figure (through matplotlib-cpp).
 *
 * The figure is opened on construction and closed on destruction, save() or
 * show() have to be called in between by the owner. Drawing and saving throw
 * std::runtime_error when the Python side fails.
 */
class MatplotlibSurface : public DrawingSurface {
public:
    MatplotlibSurface(std::size_t width_px, std::size_t height_px, const std::string &title = "");
    ~MatplotlibSurface() override;

    MatplotlibSurface(const MatplotlibSurface &) = delete;
    MatplotlibSurface &operator=(const MatplotlibSurface &) = delete;

    void drawMarker(double x, double y, const MarkerStyle &style) override;
    void drawText(double x, double y, const std::string &text) override;
    void drawLegend(const std::vector<LegendEntry> &entries) override;
    void drawOutline(const std::vector<double> &xs, const std::vector<double> &ys,
                     const std::string &color) override;

    void save(const std::string &file_name);
    void show();

private:
    // Equal axes and grid, applied before the figure leaves the surface
    void finishFigure();
};

}  // namespace cone_mapping

#endif  // CONE_MAPPING_PLOT_MATPLOTLIB_SURFACE_HPP
