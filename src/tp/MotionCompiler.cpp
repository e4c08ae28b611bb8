#include "tp/MotionCompiler.h"

#include "common/Enforce.h"

#include <glm/geometric.hpp>

#include <utility>

namespace tp
{

MotionCompiler::MotionCompiler(const PrinterProfile& profile)
    : m_plan(motionPlanFor(profile.process))
{
}

Program MotionCompiler::compile(const std::vector<Path>& paths) const
{
    RunState state;
    for (const Path& path : paths)
    {
        emitPath(state, path);
    }
    return std::move(state.out);
}

void MotionCompiler::emitPath(RunState& state, const Path& path) const
{
    ENFORCE(!path.empty(), "normalized paths are never empty");

    const std::size_t last = path.size() - 1;
    for (std::size_t j = 0; j < path.size(); ++j)
    {
        const Point& point = path.pts[j];

        if (j == 0)
        {
            state.out.push_back(Instruction::comment("Start path"));
            state.out.push_back(Instruction::command("G1", "move above start")
                                    .with('X', point.x)
                                    .with('Y', point.y)
                                    .with('Z', point.z + m_plan.clearance_mm)
                                    .with('F', kRapidFeed_mm_min));
            state.out.push_back(Instruction::command("G1", "descend to start")
                                    .with('X', point.x)
                                    .with('Y', point.y)
                                    .with('Z', point.z)
                                    .with('F', m_plan.feed_mm_min));
        }
        else
        {
            Instruction move = moveTo(point);
            if (m_plan.extrusionPerMm)
            {
                const double distance = glm::distance(path.pts[j - 1], point);
                state.extrusion += distance * *m_plan.extrusionPerMm;
                move.withFixed('E', state.extrusion, kExtrusionDecimals);
            }
            move.with('F', m_plan.feed_mm_min);
            state.out.push_back(std::move(move));
        }

        if (j == last)
        {
            state.out.push_back(Instruction::comment("End path"));
            state.out.push_back(Instruction::command("G1", "lift tool")
                                    .with('Z', point.z + m_plan.clearance_mm)
                                    .with('F', kRapidFeed_mm_min));
        }
    }
}

Instruction MotionCompiler::moveTo(const Point& point) const
{
    Instruction move = Instruction::command("G1");
    move.with('X', point.x).with('Y', point.y).with('Z', point.z);
    return move;
}

Program compileMotion(const std::vector<Path>& paths, const PrinterProfile& profile)
{
    return MotionCompiler(profile).compile(paths);
}

} // namespace tp
