#pragma once

#include "tp/Envelope.h"
#include "tp/Toolpath.h"

#include <cstddef>
#include <string>
#include <vector>

namespace tp
{

enum class Violation
{
    XBelowZero,
    YBelowZero,
    ZBelowZero,
    XAboveBed,
    YAboveBed,
    ZAboveBed,
    RadiusAboveBed
};

[[nodiscard]] const char* violationLabel(Violation violation);
[[nodiscard]] std::string joinReasons(const std::vector<Violation>& reasons);

struct PointCheck
{
    bool ok{true};
    std::vector<Violation> reasons;
};

struct PointWarning
{
    std::string text;
    Point point{0.0};
};

inline constexpr const char* kStatusOk = "OK";

/// Validation results of one run.
struct Diagnostics
{
    std::size_t violations{0};
    std::vector<Point> badPoints;
    std::vector<Segment> badSegments;
    std::vector<PointWarning> warnings;
    std::string status{kStatusOk};

    [[nodiscard]] bool ok() const noexcept
    {
        return violations == 0;
    }
};

/**
 * Checks a point against every constraint of the envelope. All violated
 * constraints are reported, in a fixed order.
 */
[[nodiscard]] PointCheck validatePoint(const Point& point, const Envelope& envelope);

/**
 * A segment is valid when both endpoints are. For rectangular envelopes the
 * midpoint must be valid as well; cylindrical envelopes only test endpoints.
 */
[[nodiscard]] bool validateSegment(const Point& a, const Point& b, const Envelope& envelope);

/// Point and segment checks over every path. Only point violations change the status.
[[nodiscard]] Diagnostics validatePaths(const std::vector<Path>& paths, const Envelope& envelope);

[[nodiscard]] std::string violationSummary(std::size_t violations);

} // namespace tp
