#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "tp/Curve.h"
#include "tp/GeometryNormalizer.h"

#include <cmath>
#include <limits>
#include <memory>
#include <optional>

namespace
{

class FailingCurve : public tp::ICurve
{
public:
    std::optional<std::vector<glm::dvec3>> tryGetPolyline() const override
    {
        return std::nullopt;
    }
};

} // namespace

TEST_CASE("coordinates are rounded to three decimals")
{
    CHECK(tp::roundCoordinate(1.23456) == doctest::Approx(1.235));
    CHECK(tp::roundCoordinate(2.0006) == doctest::Approx(2.001));
    CHECK(tp::roundCoordinate(-7.1234) == doctest::Approx(-7.123));

    const double tinyNegative = tp::roundCoordinate(-0.00049);
    CHECK(tinyNegative == 0.0);
    CHECK_FALSE(std::signbit(tinyNegative));
}

TEST_CASE("point lists keep their order")
{
    const tp::RawPath raw = tp::PointList{{3.0, 2.0, 1.0}, {1.00049, 2.0, 3.0}, {0.0, 0.0, 0.0}};
    const std::optional<tp::Path> path = tp::normalize(raw);
    REQUIRE(path.has_value());
    REQUIRE(path->size() == 3);
    CHECK(path->pts[0].x == doctest::Approx(3.0));
    CHECK(path->pts[1].x == doctest::Approx(1.0));
    CHECK(path->pts[2].z == doctest::Approx(0.0));
}

TEST_CASE("a single point is a valid path")
{
    const std::optional<tp::Path> path = tp::normalize(tp::RawPath{tp::PointList{{1.0, 1.0, 1.0}}});
    REQUIRE(path.has_value());
    CHECK(path->size() == 1);
}

TEST_CASE("polyline curves convert to their vertices")
{
    auto curve = std::make_shared<const tp::PolylineCurve>(
        std::vector<glm::dvec3>{{0.0, 0.0, 0.0}, {10.0001, 0.0, 0.0}, {10.0, 10.0, 0.0}});
    const std::optional<tp::Path> path = tp::normalize(tp::RawPath{curve});
    REQUIRE(path.has_value());
    REQUIRE(path->size() == 3);
    CHECK(path->pts[1].x == doctest::Approx(10.0));
}

TEST_CASE("degenerate inputs produce no path")
{
    CHECK_FALSE(tp::normalize(tp::RawPath{tp::PointList{}}).has_value());
    CHECK_FALSE(tp::normalize(tp::RawPath{std::shared_ptr<const tp::ICurve>{}}).has_value());
    CHECK_FALSE(tp::normalize(tp::RawPath{std::make_shared<const FailingCurve>()}).has_value());

    // A polyline curve needs at least two vertices.
    auto lonely = std::make_shared<const tp::PolylineCurve>(std::vector<glm::dvec3>{{1.0, 1.0, 1.0}});
    CHECK_FALSE(tp::normalize(tp::RawPath{lonely}).has_value());

    const double nan = std::numeric_limits<double>::quiet_NaN();
    CHECK_FALSE(tp::normalize(tp::RawPath{tp::PointList{{0.0, 0.0, 0.0}, {nan, 1.0, 1.0}}}).has_value());
}

TEST_CASE("normalizeAll drops unusable paths and keeps the rest in order")
{
    std::vector<tp::RawPath> raws;
    raws.emplace_back(tp::PointList{{1.0, 0.0, 0.0}});
    raws.emplace_back(tp::PointList{});
    raws.emplace_back(std::make_shared<const FailingCurve>());
    raws.emplace_back(tp::PointList{{2.0, 0.0, 0.0}, {3.0, 0.0, 0.0}});

    const std::vector<tp::Path> paths = tp::normalizeAll(raws);
    REQUIRE(paths.size() == 2);
    CHECK(paths[0].pts[0].x == doctest::Approx(1.0));
    CHECK(paths[1].pts[0].x == doctest::Approx(2.0));
}
