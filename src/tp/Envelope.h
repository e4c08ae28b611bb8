#pragma once

#include <variant>

namespace tp
{

enum class PrinterType
{
    Cartesian,
    Delta
};

/// Origin-anchored box reachable by a Cartesian machine.
struct RectangularEnvelope
{
    double maxX_mm{300.0};
    double maxY_mm{300.0};
    double maxZ_mm{300.0};
};

/// Cylinder about the Z axis reachable by a delta machine.
struct CylindricalEnvelope
{
    double radius_mm{150.0};
    double maxZ_mm{300.0};
};

using Envelope = std::variant<RectangularEnvelope, CylindricalEnvelope>;

[[nodiscard]] PrinterType printerTypeOf(const Envelope& envelope);
[[nodiscard]] const char* printerTypeName(PrinterType type);

} // namespace tp
