#pragma once

#include "tp/Instruction.h"
#include "tp/PrinterProfile.h"
#include "tp/Toolpath.h"

#include <vector>

namespace tp
{

/**
 * Turns normalized paths into motion instructions for one printer profile.
 *
 * Every path is bracketed by a rapid approach above its first point, a
 * descent onto it, and a rapid lift after its last point. In thermoplastic
 * mode each move carries the cumulative extrusion, which keeps growing across
 * paths for the whole run. Paths and their points are emitted in input order.
 */
class MotionCompiler
{
public:
    static constexpr double kRapidFeed_mm_min = 2'000.0;
    static constexpr int kExtrusionDecimals = 4;

    explicit MotionCompiler(const PrinterProfile& profile);

    [[nodiscard]] Program compile(const std::vector<Path>& paths) const;

private:
    struct RunState
    {
        double extrusion{0.0};
        Program out;
    };

    void emitPath(RunState& state, const Path& path) const;
    [[nodiscard]] Instruction moveTo(const Point& point) const;

    MotionPlan m_plan;
};

[[nodiscard]] Program compileMotion(const std::vector<Path>& paths, const PrinterProfile& profile);

} // namespace tp
