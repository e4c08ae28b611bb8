#pragma once

#include "tp/Instruction.h"
#include "tp/PrinterProfile.h"
#include "tp/Toolpath.h"

#include <initializer_list>
#include <utility>
#include <vector>

namespace foam_tests
{

inline tp::Path makePath(std::initializer_list<tp::Point> points)
{
    tp::Path path;
    path.pts.assign(points.begin(), points.end());
    return path;
}

inline tp::PrinterProfile makeProfile(tp::ProcessParams process, tp::Envelope envelope = tp::RectangularEnvelope{})
{
    tp::PrinterProfile profile;
    profile.process = std::move(process);
    profile.envelope = envelope;
    profile.ensureValid();
    return profile;
}

inline tp::PrinterProfile hotProfile(double multiplier = 0.20)
{
    tp::ThermoplasticParams params;
    params.extrusionMultiplier = multiplier;
    return makeProfile(params);
}

inline std::vector<tp::Instruction> movesOf(const tp::Program& program)
{
    std::vector<tp::Instruction> moves;
    for (const tp::Instruction& instruction : program)
    {
        if (instruction.isMove())
        {
            moves.push_back(instruction);
        }
    }
    return moves;
}

/// Moves that reach a path vertex, i.e. everything except approach and lift.
inline std::vector<tp::Instruction> vertexMovesOf(const tp::Program& program)
{
    std::vector<tp::Instruction> moves;
    for (const tp::Instruction& instruction : program)
    {
        if (instruction.isMove() && instruction.text != "move above start" && instruction.text != "lift tool")
        {
            moves.push_back(instruction);
        }
    }
    return moves;
}

} // namespace foam_tests
