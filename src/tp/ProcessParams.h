#pragma once

#include <optional>
#include <variant>

namespace tp
{

enum class ProcessMode
{
    Thermoplastic,
    Paste,
    MotionOnly
};

/// Heated-nozzle filament extrusion ("Hot").
struct ThermoplasticParams
{
    double nozzleTemp_C{210.0};
    double bedTemp_C{30.0};
    double extrusionMultiplier{0.20};
    double feed_mm_min{1'500.0};
    double clearance_mm{5.0};

    void ensureValid();
};

/// Pressure-driven paste or clay extrusion ("Clay").
struct PasteParams
{
    double extrusionPressure{4.0};
    double flowRate{10.0};
    double retractionDelay_s{0.5};
    double curePause_s{0.0};
    double feed_mm_min{800.0};
    double clearance_mm{5.0};
};

/// Pen plotting or dry motion ("Pen").
struct MotionOnlyParams
{
    double penUpHeight_mm{5.0};
    double penDownOffset_mm{0.2};
    double penDownDelay_ms{100.0};
    double feed_mm_min{1'000.0};
    double clearance_mm{5.0};
};

using ProcessParams = std::variant<ThermoplasticParams, PasteParams, MotionOnlyParams>;

/// What the motion compiler needs from the active parameter set.
struct MotionPlan
{
    double feed_mm_min{0.0};
    double clearance_mm{0.0};
    std::optional<double> extrusionPerMm;
};

[[nodiscard]] ProcessMode modeOf(const ProcessParams& params);
[[nodiscard]] const char* modeName(ProcessMode mode);
[[nodiscard]] ProcessParams defaultParamsFor(ProcessMode mode);
[[nodiscard]] MotionPlan motionPlanFor(const ProcessParams& params);

void ensureValid(ProcessParams& params);

} // namespace tp
