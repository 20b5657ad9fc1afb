#ifndef CONE_MAPPING_CONE_TYPE_HPP
#define CONE_MAPPING_CONE_TYPE_HPP

#include <array>
#include <ostream>
#include <string>

namespace cone_mapping {

  enum class ConeType {
    BIG_ORANGE,
    BLUE,
    YELLOW,
    ORANGE,
    UNKNOWN
  };

  // Every valid cone type, in declaration order
  const std::array<ConeType, 5> ALL_CONE_TYPES = {
    ConeType::BIG_ORANGE,
    ConeType::BLUE,
    ConeType::YELLOW,
    ConeType::ORANGE,
    ConeType::UNKNOWN
  };

  // Cone size constraints
  const float SMALL_CONE_BASE_RADIUS = 0.114;
  const float BIG_CONE_BASE_RADIUS = 0.143;

  // True when the value is one of the enumerators above (guards against casted integers)
  bool isValidConeType(ConeType type);

  // Canonical names: "orange-big", "blue", "yellow", "orange", "unknown"
  std::string coneTypeName(ConeType type);

  // Throws InvalidCategoryError for a name that is not one of the canonical names
  ConeType coneTypeFromName(const std::string &name);

  std::ostream &operator<<(std::ostream &os, ConeType type);
}

#endif
