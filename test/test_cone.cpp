#include <gtest/gtest.h>

#include <limits>
#include <sstream>
#include <string>
#include <unordered_set>

#include "cone_mapping/cone.hpp"
#include "cone_mapping/errors.hpp"
#include "recording_surface.hpp"

using namespace cone_mapping;

TEST(ConeTest, KeepsPositionAndType) {
    for (const auto &type : ALL_CONE_TYPES) {
        Cone cone(1.5, -2.0, type);
        EXPECT_EQ(cone.type(), type);
        EXPECT_DOUBLE_EQ(cone.x(), 1.5);
        EXPECT_DOUBLE_EQ(cone.y(), -2.0);
        EXPECT_EQ(cone.position(), Eigen::Vector2d(1.5, -2.0));
    }
}

TEST(ConeTest, RejectsNonFinitePosition) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();

    EXPECT_THROW(Cone(nan, 0.0, ConeType::BLUE), InvalidPositionError);
    EXPECT_THROW(Cone(0.0, inf, ConeType::BLUE), InvalidPositionError);
    EXPECT_THROW(Cone(Eigen::Vector2d(-inf, 1.0), ConeType::YELLOW), InvalidPositionError);
}

TEST(ConeTest, RejectsTypeOutsideEnumeration) {
    EXPECT_THROW(Cone(0.0, 0.0, static_cast<ConeType>(42)), InvalidCategoryError);
    EXPECT_THROW(Cone(0.0, 0.0, static_cast<ConeType>(-1)), InvalidCategoryError);
}

TEST(ConeTest, ErrorsShareCommonBase) {
    try {
        Cone(0.0, std::numeric_limits<double>::quiet_NaN(), ConeType::BLUE);
        FAIL() << "expected InvalidPositionError";
    } catch (const ConeMappingError &) {
        SUCCEED();
    }
}

TEST(ConeTest, EqualityNeedsPositionAndType) {
    Cone blue(1.0, 2.0, ConeType::BLUE);

    EXPECT_EQ(blue, Cone(1.0, 2.0, ConeType::BLUE));
    // same spot, different category: not the same cone
    EXPECT_NE(blue, Cone(1.0, 2.0, ConeType::YELLOW));
    EXPECT_NE(blue, Cone(1.0, 2.5, ConeType::BLUE));
}

TEST(ConeTest, SettersValidateAndKeepStateOnFailure) {
    Cone cone(1.0, 1.0, ConeType::ORANGE);

    cone.setPosition(Eigen::Vector2d(3.0, 4.0));
    cone.setType(ConeType::BIG_ORANGE);
    EXPECT_EQ(cone, Cone(3.0, 4.0, ConeType::BIG_ORANGE));

    EXPECT_THROW(cone.setPosition(Eigen::Vector2d(std::numeric_limits<double>::infinity(), 0.0)),
                 InvalidPositionError);
    EXPECT_THROW(cone.setType(static_cast<ConeType>(7)), InvalidCategoryError);
    EXPECT_EQ(cone, Cone(3.0, 4.0, ConeType::BIG_ORANGE));
}

TEST(ConeTest, StreamOutput) {
    std::ostringstream os;
    os << Cone(1.0, -2.5, ConeType::BIG_ORANGE);
    EXPECT_EQ(os.str(), "Cone(1, -2.5, orange-big)");
}

TEST(ConeTest, PlotUsesDefaultStyleOfType) {
    RecordingSurface surface;
    Cone(2.0, 3.0, ConeType::BLUE).plot(surface);

    ASSERT_EQ(surface.markers.size(), 1u);
    EXPECT_DOUBLE_EQ(surface.markers[0].x, 2.0);
    EXPECT_DOUBLE_EQ(surface.markers[0].y, 3.0);
    EXPECT_EQ(surface.markers[0].style.color, defaultConeStyle(ConeType::BLUE).base_color);
    EXPECT_EQ(surface.markers[0].style.marker, defaultConeStyle(ConeType::BLUE).marker);
    EXPECT_DOUBLE_EQ(surface.markers[0].style.size, SMALL_CONE_MARKER_SIZE);
    EXPECT_TRUE(surface.texts.empty());
    EXPECT_TRUE(surface.legends.empty());
}

TEST(ConeTest, PlotStyleIsDeterministicPerType) {
    RecordingSurface first, second;
    Cone(0.0, 0.0, ConeType::YELLOW).plot(first);
    Cone(5.0, 5.0, ConeType::YELLOW).plot(second);
    EXPECT_EQ(first.markers[0].style.color, second.markers[0].style.color);

    RecordingSurface big;
    Cone(0.0, 0.0, ConeType::BIG_ORANGE).plot(big);
    EXPECT_GT(big.markers[0].style.size, first.markers[0].style.size);
}

TEST(ConeTest, PlotAppliesOverrides) {
    PlotOptions options;
    options.marker_size = 12.0;
    options.color = "red";
    options.marker = "s";

    RecordingSurface surface;
    Cone(0.0, 0.0, ConeType::YELLOW).plot(surface, options);

    ASSERT_EQ(surface.markers.size(), 1u);
    EXPECT_EQ(surface.markers[0].style.color, "red");
    EXPECT_EQ(surface.markers[0].style.marker, "s");
    EXPECT_DOUBLE_EQ(surface.markers[0].style.size, 12.0);
}

TEST(ConeTest, DetailDrawsLayersFromLargestToTip) {
    PlotOptions options;
    options.detail = true;

    RecordingSurface surface;
    Cone(1.0, 1.0, ConeType::YELLOW).plot(surface, options);

    ASSERT_EQ(surface.markers.size(), 6u);
    for (size_t i = 1; i < surface.markers.size(); i++) {
        EXPECT_LT(surface.markers[i].style.size, surface.markers[i - 1].style.size);
    }
    EXPECT_EQ(surface.markers[1].style.color, "#000000");  // black stripe
    EXPECT_EQ(surface.markers.back().style.color, TIP_COLOR);
}

TEST(ConeTest, BadMarkerSizeLeavesSurfaceUntouched) {
    PlotOptions options;
    options.marker_size = -1.0;

    RecordingSurface surface;
    EXPECT_THROW(Cone(0.0, 0.0, ConeType::BLUE).plot(surface, options), std::invalid_argument);
    EXPECT_TRUE(surface.markers.empty());
}

TEST(ConeTest, ExplicitStyleWithBadMarkerSizeThrows) {
    ConeStyle style = defaultConeStyle(ConeType::BLUE);
    style.marker_size = std::numeric_limits<double>::quiet_NaN();

    RecordingSurface surface;
    EXPECT_THROW(Cone(0.0, 0.0, ConeType::BLUE).plot(surface, style, PlotOptions()), std::invalid_argument);
    EXPECT_TRUE(surface.markers.empty());

    // a valid global size replaces the bad one before it is checked
    PlotOptions options;
    options.marker_size = 4.0;
    Cone(0.0, 0.0, ConeType::BLUE).plot(surface, style, options);
    ASSERT_EQ(surface.markers.size(), 1u);
    EXPECT_DOUBLE_EQ(surface.markers[0].style.size, 4.0);
}

TEST(ConeTest, ErrorMessageThroughCommonBase) {
    try {
        Cone(std::numeric_limits<double>::infinity(), 0.0, ConeType::BLUE);
        FAIL() << "expected InvalidPositionError";
    } catch (const ConeMappingError &e) {
        EXPECT_NE(std::string(e.what()).find("not finite"), std::string::npos) << e.what();
    }

    try {
        Cone(0.0, 0.0, static_cast<ConeType>(9));
        FAIL() << "expected InvalidCategoryError";
    } catch (const ConeMappingError &e) {
        EXPECT_FALSE(std::string(e.what()).empty());
    }
}

TEST(ConeTest, HashAgreesWithEquality) {
    std::hash<Cone> hasher;
    EXPECT_EQ(hasher(Cone(1.0, 2.0, ConeType::BLUE)), hasher(Cone(1.0, 2.0, ConeType::BLUE)));
    EXPECT_EQ(hasher(Cone(-0.0, 0.0, ConeType::ORANGE)), hasher(Cone(0.0, -0.0, ConeType::ORANGE)));

    std::unordered_set<Cone> seen = {Cone(1.0, 2.0, ConeType::BLUE), Cone(1.0, 2.0, ConeType::BLUE),
                                     Cone(1.0, 2.0, ConeType::YELLOW), Cone(-0.0, 0.0, ConeType::ORANGE),
                                     Cone(0.0, 0.0, ConeType::ORANGE)};
    EXPECT_EQ(seen.size(), 3u);
    EXPECT_EQ(seen.count(Cone(1.0, 2.0, ConeType::YELLOW)), 1u);
    EXPECT_EQ(seen.count(Cone(2.0, 1.0, ConeType::BLUE)), 0u);
}
