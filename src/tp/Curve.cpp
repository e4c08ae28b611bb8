#include "tp/Curve.h"

#include <utility>

namespace tp
{

namespace
{
// A polyline curve needs a start and an end vertex.
constexpr std::size_t kMinPolylineVertices = 2;
}

PolylineCurve::PolylineCurve(std::vector<glm::dvec3> vertices)
    : m_vertices(std::move(vertices))
{
}

std::optional<std::vector<glm::dvec3>> PolylineCurve::tryGetPolyline() const
{
    if (m_vertices.size() < kMinPolylineVertices)
    {
        return std::nullopt;
    }
    return m_vertices;
}

} // namespace tp
