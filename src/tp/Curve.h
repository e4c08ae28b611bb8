#pragma once

#include <glm/vec3.hpp>

#include <optional>
#include <vector>

namespace tp
{

class ICurve
{
public:
    virtual ~ICurve() = default;

    /// Ordered vertices when the curve is exactly representable as a polyline.
    [[nodiscard]] virtual std::optional<std::vector<glm::dvec3>> tryGetPolyline() const = 0;
};

class PolylineCurve : public ICurve
{
public:
    PolylineCurve() = default;
    explicit PolylineCurve(std::vector<glm::dvec3> vertices);

    [[nodiscard]] std::optional<std::vector<glm::dvec3>> tryGetPolyline() const override;

private:
    std::vector<glm::dvec3> m_vertices;
};

} // namespace tp
