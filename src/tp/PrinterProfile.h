#pragma once

#include "tp/Envelope.h"
#include "tp/ProcessParams.h"
#include "tp/Toolpath.h"

#include <vector>

namespace tp
{

/// Closed outline of the print bed, for display next to the toolpaths.
struct BedOutline
{
    enum class Kind
    {
        Rectangle,
        Circle,
        Custom
    };

    Kind kind{Kind::Rectangle};
    PointList pts;

    [[nodiscard]] bool empty() const noexcept
    {
        return pts.empty();
    }
};

struct PrinterProfile
{
    ProcessParams process{MotionOnlyParams{}};
    Envelope envelope{RectangularEnvelope{}};
    BedOutline bed;

    [[nodiscard]] ProcessMode mode() const
    {
        return modeOf(process);
    }

    [[nodiscard]] PrinterType printerType() const
    {
        return printerTypeOf(envelope);
    }

    void ensureValid();
};

[[nodiscard]] BedOutline makeBedOutline(const Envelope& envelope);
PrinterProfile makeDefaultProfile();

} // namespace tp
