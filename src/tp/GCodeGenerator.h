#pragma once

#include "tp/Instruction.h"
#include "tp/PrinterProfile.h"
#include "tp/ProgramAssembler.h"
#include "tp/Toolpath.h"
#include "tp/WorkspaceValidator.h"

#include <string>
#include <vector>

namespace tp
{

struct GenerationResult
{
    Program program;
    std::vector<std::string> lines;
    std::vector<Path> previewPaths;
    std::string status{kStatusOk};
    BedOutline bed;
    Diagnostics diagnostics;
};

/**
 * Runs one complete compilation: normalizes the raw paths, validates them
 * against the profile's envelope, compiles the motion and wraps it in a
 * header and footer. Workspace violations are reported, never fatal.
 */
class GCodeGenerator
{
public:
    GCodeGenerator() = default;

    [[nodiscard]] GenerationResult generate(const std::vector<RawPath>& geometry,
                                            const PrinterProfile& profile,
                                            const HeaderOverride& headerOverride = std::nullopt) const;
};

} // namespace tp
