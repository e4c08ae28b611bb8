#include "tp/WorkspaceValidator.h"

#include <cmath>

namespace tp
{

namespace
{

struct PointChecker
{
    const Point& point;

    PointCheck operator()(const RectangularEnvelope& bounds) const
    {
        PointCheck check;
        if (point.x < 0.0) check.reasons.push_back(Violation::XBelowZero);
        if (point.y < 0.0) check.reasons.push_back(Violation::YBelowZero);
        if (point.z < 0.0) check.reasons.push_back(Violation::ZBelowZero);
        if (point.x > bounds.maxX_mm) check.reasons.push_back(Violation::XAboveBed);
        if (point.y > bounds.maxY_mm) check.reasons.push_back(Violation::YAboveBed);
        if (point.z > bounds.maxZ_mm) check.reasons.push_back(Violation::ZAboveBed);
        check.ok = check.reasons.empty();
        return check;
    }

    PointCheck operator()(const CylindricalEnvelope& bounds) const
    {
        PointCheck check;
        const double radial = std::sqrt(point.x * point.x + point.y * point.y);
        if (radial > bounds.radius_mm) check.reasons.push_back(Violation::RadiusAboveBed);
        if (point.z < 0.0) check.reasons.push_back(Violation::ZBelowZero);
        if (point.z > bounds.maxZ_mm) check.reasons.push_back(Violation::ZAboveBed);
        check.ok = check.reasons.empty();
        return check;
    }
};

} // namespace

const char* violationLabel(Violation violation)
{
    switch (violation)
    {
    case Violation::XBelowZero: return "X<0";
    case Violation::YBelowZero: return "Y<0";
    case Violation::ZBelowZero: return "Z<0";
    case Violation::XAboveBed: return "X>BedX";
    case Violation::YAboveBed: return "Y>BedY";
    case Violation::ZAboveBed: return "Z>BedZ";
    case Violation::RadiusAboveBed: return "r>BedRadius";
    }
    return "?";
}

std::string joinReasons(const std::vector<Violation>& reasons)
{
    std::string text;
    for (const Violation reason : reasons)
    {
        if (!text.empty())
        {
            text += ", ";
        }
        text += violationLabel(reason);
    }
    return text;
}

PointCheck validatePoint(const Point& point, const Envelope& envelope)
{
    return std::visit(PointChecker{point}, envelope);
}

bool validateSegment(const Point& a, const Point& b, const Envelope& envelope)
{
    if (!validatePoint(a, envelope).ok || !validatePoint(b, envelope).ok)
    {
        return false;
    }

    // Midpoint only for the box; cylindrical segments are judged by their ends.
    if (std::holds_alternative<RectangularEnvelope>(envelope))
    {
        const Segment segment{a, b};
        return validatePoint(segment.midpoint(), envelope).ok;
    }
    return true;
}

Diagnostics validatePaths(const std::vector<Path>& paths, const Envelope& envelope)
{
    Diagnostics diagnostics;
    for (const Path& path : paths)
    {
        for (const Point& point : path.pts)
        {
            const PointCheck check = validatePoint(point, envelope);
            if (!check.ok)
            {
                ++diagnostics.violations;
                diagnostics.badPoints.push_back(point);
                diagnostics.warnings.push_back({joinReasons(check.reasons), point});
            }
        }

        for (std::size_t i = 1; i < path.pts.size(); ++i)
        {
            const Point& a = path.pts[i - 1];
            const Point& b = path.pts[i];
            if (!validateSegment(a, b, envelope))
            {
                diagnostics.badSegments.push_back({a, b});
            }
        }
    }

    if (diagnostics.violations > 0)
    {
        diagnostics.status = violationSummary(diagnostics.violations);
    }
    return diagnostics;
}

std::string violationSummary(std::size_t violations)
{
    return "Out of bounds: " + std::to_string(violations) + " point(s)";
}

} // namespace tp
