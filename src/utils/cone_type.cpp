#include "cone_mapping/cone_type.hpp"
#include "cone_mapping/errors.hpp"

namespace cone_mapping {

bool isValidConeType(ConeType type) {
    for (const auto &valid : ALL_CONE_TYPES) {
        if (type == valid) return true;
    }
    return false;
}

std::string coneTypeName(ConeType type) {
    switch (type) {
        case ConeType::BIG_ORANGE:
            return "orange-big";
        case ConeType::BLUE:
            return "blue";
        case ConeType::YELLOW:
            return "yellow";
        case ConeType::ORANGE:
            return "orange";
        case ConeType::UNKNOWN:
            return "unknown";
    }
    throw InvalidCategoryError("cone type value " + std::to_string(static_cast<int>(type)) +
                               " is not a valid cone type");
}

ConeType coneTypeFromName(const std::string &name) {
    for (const auto &type : ALL_CONE_TYPES) {
        if (coneTypeName(type) == name) return type;
    }

    // Same wording as the list of accepted names, last one joined with "or"
    std::string accepted;
    for (size_t i = 0; i < ALL_CONE_TYPES.size(); i++) {
        if (i > 0) accepted += (i + 1 == ALL_CONE_TYPES.size()) ? " or " : ", ";
        accepted += "\"" + coneTypeName(ALL_CONE_TYPES[i]) + "\"";
    }
    throw InvalidCategoryError("cone type \"" + name + "\" must be one of the following types: " + accepted);
}

std::ostream &operator<<(std::ostream &os, ConeType type) {
    if (isValidConeType(type)) {
        return os << coneTypeName(type);
    }
    return os << "invalid(" << static_cast<int>(type) << ")";
}

}  // namespace cone_mapping
