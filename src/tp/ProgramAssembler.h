#pragma once

#include "tp/Instruction.h"
#include "tp/PrinterProfile.h"

#include <optional>
#include <string>
#include <vector>

namespace tp
{

using HeaderOverride = std::optional<std::vector<std::string>>;

/**
 * Wraps a compiled body with the start and end blocks of the program.
 * A non-empty header override replaces the generated header line for line;
 * the generated footer is appended in every case.
 */
class ProgramAssembler
{
public:
    explicit ProgramAssembler(const PrinterProfile& profile);

    [[nodiscard]] Program header() const;
    [[nodiscard]] Program footer() const;
    [[nodiscard]] Program assemble(Program body, const HeaderOverride& headerOverride = std::nullopt) const;

private:
    std::optional<ThermoplasticParams> m_heated;
};

} // namespace tp
