#ifndef CONE_MAPPING_PLOT_STYLE_HPP
#define CONE_MAPPING_PLOT_STYLE_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "cone_mapping/cone_type.hpp"
#include "cone_mapping/drawing_surface.hpp"

namespace cone_mapping {

  // Marker size (points) of a small cone, big cones are scaled by their base radius
  const double SMALL_CONE_MARKER_SIZE = 6.0;
  const double BIG_CONE_MARKER_SIZE = SMALL_CONE_MARKER_SIZE * BIG_CONE_BASE_RADIUS / SMALL_CONE_BASE_RADIUS;

  const std::string TIP_COLOR = "#ffffff";

  struct ConeStyle {
    std::string marker;
    std::string base_color;
    std::string stripe_color;
    std::string top_color;
    double marker_size;
  };

  using StyleMap = std::map<ConeType, ConeStyle>;

  // Overrides applied on top of whichever style a cone is drawn with, per-category
  // styles included: a global colour or size wins over the StyleMap entry
  struct PlotOptions {
    std::optional<double> marker_size;
    std::optional<std::string> color;   // replaces base and top colours, stripes are kept
    std::optional<std::string> marker;
    bool detail = false;                // draw the stripes and the tip, not just the base
    bool annotate = false;              // ConeArray only: write the insertion index next to each cone
    bool legend = false;                // ConeArray only: one legend entry per category present
  };

  ConeStyle defaultConeStyle(ConeType type);

  // Applies the overrides of the options to the style. Throws std::invalid_argument when the
  // resulting marker size is not positive and finite, whether it came from the style or the options.
  ConeStyle applyOverrides(const ConeStyle &style, const PlotOptions &options);

  // Markers to draw for one cone, bottom layer first
  std::vector<MarkerStyle> coneLayers(const ConeStyle &style, bool detail);
}

#endif  // CONE_MAPPING_PLOT_STYLE_HPP
