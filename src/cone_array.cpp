#include "cone_mapping/cone_array.hpp"
#include "cone_mapping/errors.hpp"

#include <algorithm>
#include <iterator>
#include <map>
#include <string>
#include <utility>

#include "rclcpp/rclcpp.hpp"

namespace cone_mapping {

// Offset (m) of the index label from the cone it belongs to
const double ANNOTATION_OFFSET = 0.2;

ConeArray::ConeArray(std::vector<Cone> cones) : cones_(std::move(cones)) {}

ConeArray::ConeArray(std::initializer_list<Cone> cones) : cones_(cones) {}

void ConeArray::append(const Cone &cone) {
    cones_.push_back(cone);
}

void ConeArray::extend(std::vector<Cone> cones) {
    // Grow first: once capacity is there, moving cones in cannot throw
    cones_.reserve(cones_.size() + cones.size());
    cones_.insert(cones_.end(), std::make_move_iterator(cones.begin()), std::make_move_iterator(cones.end()));
}

void ConeArray::extend(const ConeArray &other) {
    // Copy taken up front, other may be *this
    extend(other.cones_);
}

void ConeArray::clear() {
    cones_.clear();
}

const Cone &ConeArray::at(std::size_t index) const {
    if (index >= cones_.size()) {
        throw ConeIndexError("cone index " + std::to_string(index) + " out of range for array of size " +
                             std::to_string(cones_.size()));
    }
    return cones_[index];
}

const Cone &ConeArray::operator[](std::size_t index) const {
    return at(index);
}

ConeArray ConeArray::filterByCategory(ConeType type) const {
    if (!isValidConeType(type)) {
        throw InvalidCategoryError("cannot filter by cone type value " + std::to_string(static_cast<int>(type)));
    }

    std::vector<Cone> matching;
    std::copy_if(cones_.begin(), cones_.end(), std::back_inserter(matching),
                 [type](const Cone &cone) { return cone.type() == type; });
    return ConeArray(std::move(matching));
}

std::set<ConeType> ConeArray::categories() const {
    std::set<ConeType> types;
    for (const auto &cone : cones_) {
        types.insert(cone.type());
    }
    return types;
}

std::size_t ConeArray::count(ConeType type) const {
    return std::count_if(cones_.begin(), cones_.end(), [type](const Cone &cone) { return cone.type() == type; });
}

bool ConeArray::contains(const Cone &cone) const {
    return std::find(cones_.begin(), cones_.end(), cone) != cones_.end();
}

std::optional<ConeType> ConeArray::uniformType() const {
    if (cones_.empty()) return std::nullopt;

    const ConeType first = cones_.front().type();
    for (const auto &cone : cones_) {
        if (cone.type() != first) return std::nullopt;
    }
    return first;
}

void ConeArray::plot(DrawingSurface &surface, const StyleMap &styles, const PlotOptions &options) const {
    // Resolve and check the style of every category present before the first draw call,
    // a bad style then leaves the surface untouched
    std::map<ConeType, ConeStyle> resolved;
    for (const auto &type : categories()) {
        auto it = styles.find(type);
        const ConeStyle style = it != styles.end() ? it->second : defaultConeStyle(type);
        applyOverrides(style, options);
        resolved[type] = style;
    }

    for (size_t i = 0; i < cones_.size(); i++) {
        const Cone &cone = cones_[i];
        cone.plot(surface, resolved.at(cone.type()), options);

        if (options.annotate) {
            surface.drawText(cone.x() + ANNOTATION_OFFSET, cone.y() + ANNOTATION_OFFSET, std::to_string(i));
        }
    }

    if (options.legend && !cones_.empty()) {
        std::vector<LegendEntry> entries;
        for (const auto &[type, base_style] : resolved) {
            const ConeStyle style = applyOverrides(base_style, options);
            entries.push_back({coneTypeName(type), MarkerStyle{style.base_color, style.marker, style.marker_size}});
        }
        surface.drawLegend(entries);
    }

    RCLCPP_DEBUG(rclcpp::get_logger("ConeArray"), "Plotted %zu cones in %zu categories", cones_.size(),
                 resolved.size());
}

bool ConeArray::operator==(const ConeArray &other) const {
    return cones_ == other.cones_;
}

bool ConeArray::operator!=(const ConeArray &other) const {
    return !(*this == other);
}

std::ostream &operator<<(std::ostream &os, const ConeArray &array) {
    os << "ConeArray(";
    for (size_t i = 0; i < array.size(); i++) {
        if (i > 0) os << ", ";
        os << array[i];
    }
    return os << ")";
}

}  // namespace cone_mapping
