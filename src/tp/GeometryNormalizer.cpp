#include "tp/GeometryNormalizer.h"

#include "common/log.h"

#include <cmath>
#include <type_traits>

namespace tp
{

namespace
{

constexpr double kCoordinateScale = 1'000.0;

bool isFinite(const Point& point)
{
    return std::isfinite(point.x) && std::isfinite(point.y) && std::isfinite(point.z);
}

std::optional<Path> fromVertices(const PointList& vertices)
{
    if (vertices.empty())
    {
        return std::nullopt;
    }

    Path path;
    path.pts.reserve(vertices.size());
    for (const Point& vertex : vertices)
    {
        if (!isFinite(vertex))
        {
            return std::nullopt;
        }
        path.pts.push_back(roundPoint(vertex));
    }
    return path;
}

} // namespace

double roundCoordinate(double value)
{
    // Adding zero folds -0.0 into 0.0 so "-0" never reaches the output.
    return std::round(value * kCoordinateScale) / kCoordinateScale + 0.0;
}

Point roundPoint(const Point& point)
{
    return {roundCoordinate(point.x), roundCoordinate(point.y), roundCoordinate(point.z)};
}

std::optional<Path> normalize(const RawPath& raw)
{
    return std::visit(
        [](const auto& source) -> std::optional<Path> {
            using Source = std::decay_t<decltype(source)>;
            if constexpr (std::is_same_v<Source, PointList>)
            {
                return fromVertices(source);
            }
            else
            {
                if (!source)
                {
                    return std::nullopt;
                }
                const std::optional<PointList> vertices = source->tryGetPolyline();
                if (!vertices)
                {
                    return std::nullopt;
                }
                return fromVertices(*vertices);
            }
        },
        raw);
}

std::vector<Path> normalizeAll(const std::vector<RawPath>& raws)
{
    std::vector<Path> paths;
    paths.reserve(raws.size());
    for (const RawPath& raw : raws)
    {
        std::optional<Path> path = normalize(raw);
        if (path)
        {
            paths.push_back(std::move(*path));
        }
    }

    if (paths.size() != raws.size())
    {
        LOG_INFO(Tp, "skipped " + std::to_string(raws.size() - paths.size())
                         + " path(s) without usable points");
    }
    return paths;
}

} // namespace tp
