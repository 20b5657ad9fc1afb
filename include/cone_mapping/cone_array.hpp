#ifndef CONE_MAPPING_CONE_ARRAY_HPP
#define CONE_MAPPING_CONE_ARRAY_HPP

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <ostream>
#include <set>
#include <vector>

#include "cone_mapping/cone.hpp"
#include "cone_mapping/cone_type.hpp"
#include "cone_mapping/drawing_surface.hpp"
#include "cone_mapping/plot_style.hpp"

namespace cone_mapping {

/**
 * Ordered group of cones, in the order they were mapped.
 *
 * Elements are owned by value and only exposed read-only; sub-collections are
 * returned as new arrays. Duplicates are kept, they stand for re-detections.
 * Untyped input (YAML) is validated by cone_yaml.hpp before it gets here.
 */
class ConeArray {
public:
    using const_iterator = std::vector<Cone>::const_iterator;

    ConeArray() = default;
    explicit ConeArray(std::vector<Cone> cones);
    ConeArray(std::initializer_list<Cone> cones);

    void append(const Cone &cone);
    // Either every cone is added or, if the storage cannot grow, none is
    void extend(std::vector<Cone> cones);
    void extend(const ConeArray &other);
    void clear();

    std::size_t size() const { return cones_.size(); }
    bool empty() const { return cones_.empty(); }

    // Both throw ConeIndexError when index >= size()
    const Cone &at(std::size_t index) const;
    const Cone &operator[](std::size_t index) const;

    const_iterator begin() const { return cones_.begin(); }
    const_iterator end() const { return cones_.end(); }
    const std::vector<Cone> &cones() const { return cones_; }

    ConeArray filterByCategory(ConeType type) const;
    std::set<ConeType> categories() const;
    std::size_t count(ConeType type) const;
    bool contains(const Cone &cone) const;

    // The type shared by every cone, empty if the array is empty or mixed
    std::optional<ConeType> uniformType() const;

    // Draws the cones in insertion order, so later cones end up on top.
    // A style found in the map replaces the default style of that category.
    void plot(DrawingSurface &surface, const StyleMap &styles = StyleMap(),
              const PlotOptions &options = PlotOptions()) const;

    bool operator==(const ConeArray &other) const;
    bool operator!=(const ConeArray &other) const;

private:
    std::vector<Cone> cones_;
};

std::ostream &operator<<(std::ostream &os, const ConeArray &array);

}  // namespace cone_mapping

#endif  // CONE_MAPPING_CONE_ARRAY_HPP
