#include "tp/ProcessParams.h"

#include <algorithm>

namespace tp
{

namespace
{

struct PlanBuilder
{
    MotionPlan operator()(const ThermoplasticParams& params) const
    {
        return {params.feed_mm_min, params.clearance_mm, params.extrusionMultiplier};
    }

    MotionPlan operator()(const PasteParams& params) const
    {
        return {params.feed_mm_min, params.clearance_mm, std::nullopt};
    }

    MotionPlan operator()(const MotionOnlyParams& params) const
    {
        return {params.feed_mm_min, params.clearance_mm, std::nullopt};
    }
};

} // namespace

void ThermoplasticParams::ensureValid()
{
    // Negative flow would make the cumulative E value run backwards.
    extrusionMultiplier = std::max(extrusionMultiplier, 0.0);
}

ProcessMode modeOf(const ProcessParams& params)
{
    switch (params.index())
    {
    case 0: return ProcessMode::Thermoplastic;
    case 1: return ProcessMode::Paste;
    default: return ProcessMode::MotionOnly;
    }
}

const char* modeName(ProcessMode mode)
{
    switch (mode)
    {
    case ProcessMode::Thermoplastic: return "Hot";
    case ProcessMode::Paste: return "Clay";
    case ProcessMode::MotionOnly: return "Pen";
    }
    return "Pen";
}

ProcessParams defaultParamsFor(ProcessMode mode)
{
    switch (mode)
    {
    case ProcessMode::Thermoplastic: return ThermoplasticParams{};
    case ProcessMode::Paste: return PasteParams{};
    case ProcessMode::MotionOnly: return MotionOnlyParams{};
    }
    return MotionOnlyParams{};
}

MotionPlan motionPlanFor(const ProcessParams& params)
{
    return std::visit(PlanBuilder{}, params);
}

void ensureValid(ProcessParams& params)
{
    if (auto* hot = std::get_if<ThermoplasticParams>(&params))
    {
        hot->ensureValid();
    }
}

} // namespace tp
