#include "tp/PrinterProfile.h"

#include <cmath>
#include <numbers>

namespace tp
{

namespace
{

constexpr int kCircleSegments = 64;

struct OutlineBuilder
{
    BedOutline operator()(const RectangularEnvelope& bounds) const
    {
        BedOutline outline;
        outline.kind = BedOutline::Kind::Rectangle;
        outline.pts = {Point{0.0, 0.0, 0.0},
                       Point{bounds.maxX_mm, 0.0, 0.0},
                       Point{bounds.maxX_mm, bounds.maxY_mm, 0.0},
                       Point{0.0, bounds.maxY_mm, 0.0},
                       Point{0.0, 0.0, 0.0}};
        return outline;
    }

    BedOutline operator()(const CylindricalEnvelope& bounds) const
    {
        BedOutline outline;
        outline.kind = BedOutline::Kind::Circle;
        outline.pts.reserve(kCircleSegments + 1);
        for (int i = 0; i <= kCircleSegments; ++i)
        {
            // Closing vertex reuses angle zero exactly.
            const double angle = (i == kCircleSegments)
                                     ? 0.0
                                     : 2.0 * std::numbers::pi * static_cast<double>(i) / kCircleSegments;
            outline.pts.emplace_back(bounds.radius_mm * std::cos(angle),
                                     bounds.radius_mm * std::sin(angle),
                                     0.0);
        }
        return outline;
    }
};

} // namespace

void PrinterProfile::ensureValid()
{
    tp::ensureValid(process);
    if (bed.empty())
    {
        bed = makeBedOutline(envelope);
    }
}

BedOutline makeBedOutline(const Envelope& envelope)
{
    return std::visit(OutlineBuilder{}, envelope);
}

PrinterProfile makeDefaultProfile()
{
    PrinterProfile profile;
    profile.process = MotionOnlyParams{};
    profile.envelope = RectangularEnvelope{};
    profile.ensureValid();
    return profile;
}

} // namespace tp
