#include "tp/Envelope.h"

namespace tp
{

PrinterType printerTypeOf(const Envelope& envelope)
{
    return std::holds_alternative<CylindricalEnvelope>(envelope) ? PrinterType::Delta
                                                                 : PrinterType::Cartesian;
}

const char* printerTypeName(PrinterType type)
{
    switch (type)
    {
    case PrinterType::Cartesian: return "Cartesian";
    case PrinterType::Delta: return "Delta";
    }
    return "Cartesian";
}

} // namespace tp
