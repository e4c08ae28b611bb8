#include "tp/GCodeGenerator.h"

#include "tp/GeometryNormalizer.h"
#include "tp/MotionCompiler.h"

#include "common/log.h"

#include <sstream>
#include <utility>

namespace tp
{

namespace
{

std::string describe(const PrinterProfile& profile)
{
    std::ostringstream oss;
    oss << "Mode=" << modeName(profile.mode())
        << ", PrinterType=" << printerTypeName(profile.printerType());
    if (const auto* box = std::get_if<RectangularEnvelope>(&profile.envelope))
    {
        oss << ", bedX=" << box->maxX_mm << ", bedY=" << box->maxY_mm << ", bedZ=" << box->maxZ_mm;
    }
    else if (const auto* cylinder = std::get_if<CylindricalEnvelope>(&profile.envelope))
    {
        oss << ", bedRadius=" << cylinder->radius_mm << ", bedZ=" << cylinder->maxZ_mm;
    }
    return oss.str();
}

} // namespace

GenerationResult GCodeGenerator::generate(const std::vector<RawPath>& geometry,
                                          const PrinterProfile& profile,
                                          const HeaderOverride& headerOverride) const
{
    LOG_INFO(Tp, describe(profile));

    GenerationResult result;
    result.bed = profile.bed.empty() ? makeBedOutline(profile.envelope) : profile.bed;
    result.previewPaths = normalizeAll(geometry);

    result.diagnostics = validatePaths(result.previewPaths, profile.envelope);
    result.status = result.diagnostics.status;
    if (!result.diagnostics.ok())
    {
        LOG_WARN(Tp, result.status);
    }

    Program body = MotionCompiler(profile).compile(result.previewPaths);
    result.program = ProgramAssembler(profile).assemble(std::move(body), headerOverride);
    result.lines = toText(result.program);
    return result;
}

} // namespace tp
