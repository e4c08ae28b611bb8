#pragma once

#include "tp/Curve.h"

#include <glm/vec3.hpp>

#include <cstddef>
#include <memory>
#include <variant>
#include <vector>

namespace tp
{

using Point = glm::dvec3;
using PointList = std::vector<Point>;

/// One continuous tool motion. Normalized paths are never empty.
struct Path
{
    PointList pts;

    [[nodiscard]] bool empty() const noexcept
    {
        return pts.empty();
    }

    [[nodiscard]] std::size_t size() const noexcept
    {
        return pts.size();
    }
};

struct Segment
{
    Point a{0.0};
    Point b{0.0};

    [[nodiscard]] Point midpoint() const
    {
        return (a + b) * 0.5;
    }
};

/// Input path as handed over by the host: either ordered vertices or a curve
/// that may or may not reduce to a polyline.
using RawPath = std::variant<PointList, std::shared_ptr<const ICurve>>;

} // namespace tp
