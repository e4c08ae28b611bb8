#pragma once

#include "tp/PrinterProfile.h"

#include <QtCore/QJsonArray>
#include <QtCore/QJsonObject>
#include <QtCore/QJsonValue>
#include <QtCore/QString>

#include <stdexcept>

namespace tp
{

/// Raised when a profile names its machine in a way that cannot be resolved.
class ProfileError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/**
 * Keyed profile: {"Mode", "PrinterType", "Params", "BedX", "BedY", "BedZ",
 * "BedRadius", "BedShape"}. Absent or null entries take their defaults.
 */
PrinterProfile profileFromJson(const QJsonObject& object);

/// Positional profile: [Mode, PrinterType, Params, BedX, BedY, BedZ, BedRadius, BedShape].
PrinterProfile profileFromJson(const QJsonArray& array);

/// Dispatches on the JSON shape; null, undefined and scalars give the default profile.
PrinterProfile profileFromJson(const QJsonValue& value);

/// Decodes a profile serialized as JSON text; undecodable text gives the default profile.
PrinterProfile decodeProfile(const QString& encoded);

QJsonObject profileToJson(const PrinterProfile& profile);

} // namespace tp
