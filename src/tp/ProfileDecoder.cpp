#include "tp/ProfileDecoder.h"

#include "common/log.h"

#include <QtCore/QJsonDocument>
#include <QtCore/QJsonParseError>

#include <cmath>
#include <optional>

namespace tp
{

namespace
{

namespace key
{
const QString mode = QStringLiteral("Mode");
const QString printerType = QStringLiteral("PrinterType");
const QString params = QStringLiteral("Params");
const QString bedX = QStringLiteral("BedX");
const QString bedY = QStringLiteral("BedY");
const QString bedZ = QStringLiteral("BedZ");
const QString bedRadius = QStringLiteral("BedRadius");
const QString bedShape = QStringLiteral("BedShape");
} // namespace key

enum Slot
{
    kSlotMode = 0,
    kSlotPrinterType,
    kSlotParams,
    kSlotBedX,
    kSlotBedY,
    kSlotBedZ,
    kSlotBedRadius,
    kSlotBedShape
};

constexpr std::size_t kMinOutlineVertices = 2;

bool isAbsent(const QJsonValue& value)
{
    return value.isUndefined() || value.isNull();
}

double readNumber(const QJsonValue& value, double fallback, const QString& name, bool* ok = nullptr)
{
    bool valid = true;
    double result = fallback;

    if (value.isDouble())
    {
        result = value.toDouble(fallback);
    }
    else if (value.isString())
    {
        bool parsed = false;
        const double candidate = value.toString().trimmed().toDouble(&parsed);
        if (parsed)
        {
            result = candidate;
        }
        else
        {
            valid = false;
        }
    }
    else if (!isAbsent(value))
    {
        valid = false;
    }

    if (valid && !std::isfinite(result))
    {
        valid = false;
        result = fallback;
    }

    if (!valid)
    {
        LOG_WARN(Config, QStringLiteral("'%1' is not a number, using %2").arg(name).arg(fallback));
    }
    if (ok)
    {
        *ok = valid;
    }
    return result;
}

// Kept as given; a negative bound rejects every point on that axis.
double readBound(const QJsonValue& value, double fallback, const QString& name)
{
    const double result = readNumber(value, fallback, name);
    if (result < 0.0)
    {
        LOG_WARN(Config, QStringLiteral("%1 is negative (%2)").arg(name).arg(result));
    }
    return result;
}

ProcessMode readMode(const QJsonValue& value)
{
    if (isAbsent(value))
    {
        return ProcessMode::MotionOnly;
    }

    const QString text = value.toString().trimmed();
    if (text.compare(QStringLiteral("Hot"), Qt::CaseInsensitive) == 0
        || text.compare(QStringLiteral("Thermoplastic"), Qt::CaseInsensitive) == 0)
    {
        return ProcessMode::Thermoplastic;
    }
    if (text.compare(QStringLiteral("Clay"), Qt::CaseInsensitive) == 0
        || text.compare(QStringLiteral("Paste"), Qt::CaseInsensitive) == 0)
    {
        return ProcessMode::Paste;
    }
    if (text.compare(QStringLiteral("Pen"), Qt::CaseInsensitive) == 0
        || text.compare(QStringLiteral("MotionOnly"), Qt::CaseInsensitive) == 0)
    {
        return ProcessMode::MotionOnly;
    }

    LOG_WARN(Config, QStringLiteral("unknown mode '%1', running without extrusion").arg(text));
    return ProcessMode::MotionOnly;
}

std::optional<PrinterType> readPrinterType(const QJsonValue& value)
{
    if (isAbsent(value))
    {
        return std::nullopt;
    }

    if (value.isDouble())
    {
        const double toggle = value.toDouble();
        if (toggle == 0.0)
        {
            return PrinterType::Cartesian;
        }
        if (toggle == 1.0)
        {
            return PrinterType::Delta;
        }
        throw ProfileError("PrinterType toggle must be 0 (Cartesian) or 1 (Delta), got "
                           + std::to_string(toggle));
    }

    const QString text = value.toString().trimmed();
    if (value.isString())
    {
        if (text.compare(QStringLiteral("Cartesian"), Qt::CaseInsensitive) == 0 || text == QStringLiteral("0"))
        {
            return PrinterType::Cartesian;
        }
        if (text.compare(QStringLiteral("Delta"), Qt::CaseInsensitive) == 0 || text == QStringLiteral("1"))
        {
            return PrinterType::Delta;
        }
    }
    throw ProfileError("unrecognized PrinterType '" + text.toStdString() + "'");
}

ProcessParams readParams(ProcessMode mode, const QJsonValue& value)
{
    QJsonObject object;
    if (value.isObject())
    {
        object = value.toObject();
    }
    else if (!isAbsent(value))
    {
        LOG_WARN(Config, "Params is not a mapping, using mode defaults");
    }

    const auto field = [&object](const char* name, double fallback) {
        const QString fieldKey = QString::fromLatin1(name);
        return readNumber(object.value(fieldKey), fallback, fieldKey);
    };

    ProcessParams params = defaultParamsFor(mode);
    if (auto* hot = std::get_if<ThermoplasticParams>(&params))
    {
        hot->nozzleTemp_C = field("NozzleTemp", hot->nozzleTemp_C);
        hot->bedTemp_C = field("BedTemp", hot->bedTemp_C);
        hot->extrusionMultiplier = field("ExtrusionMultiplier", hot->extrusionMultiplier);
        hot->feed_mm_min = field("FeedRate", hot->feed_mm_min);
        hot->clearance_mm = field("ClearanceHeight", hot->clearance_mm);
    }
    else if (auto* paste = std::get_if<PasteParams>(&params))
    {
        paste->extrusionPressure = field("ExtrusionPressure", paste->extrusionPressure);
        paste->flowRate = field("FlowRate", paste->flowRate);
        paste->retractionDelay_s = field("RetractionDelay", paste->retractionDelay_s);
        paste->curePause_s = field("CurePause", paste->curePause_s);
        paste->feed_mm_min = field("FeedRate", paste->feed_mm_min);
        paste->clearance_mm = field("ClearanceHeight", paste->clearance_mm);
    }
    else if (auto* pen = std::get_if<MotionOnlyParams>(&params))
    {
        pen->penUpHeight_mm = field("PenUpHeight", pen->penUpHeight_mm);
        pen->penDownOffset_mm = field("PenDownOffset", pen->penDownOffset_mm);
        pen->penDownDelay_ms = field("PenDownDelay", pen->penDownDelay_ms);
        pen->feed_mm_min = field("FeedRate", pen->feed_mm_min);
        pen->clearance_mm = field("ClearanceHeight", pen->clearance_mm);
    }

    if (motionPlanFor(params).clearance_mm < 0.0)
    {
        LOG_WARN(Config, "ClearanceHeight is negative, approach moves run below the path");
    }
    return params;
}

std::optional<Point> readVertex(const QJsonValue& value)
{
    if (!value.isArray())
    {
        return std::nullopt;
    }
    const QJsonArray coords = value.toArray();
    if (coords.size() < 2 || coords.size() > 3)
    {
        return std::nullopt;
    }

    Point vertex{0.0};
    for (qsizetype i = 0; i < coords.size(); ++i)
    {
        if (!coords.at(i).isDouble())
        {
            return std::nullopt;
        }
        vertex[static_cast<glm::length_t>(i)] = coords.at(i).toDouble();
    }
    return vertex;
}

std::optional<BedOutline> readOutline(const QJsonValue& value)
{
    if (isAbsent(value))
    {
        return std::nullopt;
    }

    BedOutline outline;
    outline.kind = BedOutline::Kind::Custom;
    if (value.isArray())
    {
        for (const QJsonValue& entry : value.toArray())
        {
            const std::optional<Point> vertex = readVertex(entry);
            if (!vertex)
            {
                outline.pts.clear();
                break;
            }
            outline.pts.push_back(*vertex);
        }
    }

    if (outline.pts.size() < kMinOutlineVertices)
    {
        LOG_WARN(Config, "BedShape is not a point list, deriving the outline from the bed size");
        return std::nullopt;
    }
    return outline;
}

struct RawProfile
{
    QJsonValue mode;
    QJsonValue printerType;
    QJsonValue params;
    QJsonValue bedX;
    QJsonValue bedY;
    QJsonValue bedZ;
    QJsonValue bedRadius;
    QJsonValue bedShape;
};

// Without an explicit type only a purely rectangular description is accepted.
PrinterType resolvePrinterType(const RawProfile& raw)
{
    if (std::optional<PrinterType> type = readPrinterType(raw.printerType))
    {
        return *type;
    }
    if (!isAbsent(raw.bedRadius))
    {
        const bool square = !isAbsent(raw.bedX) || !isAbsent(raw.bedY);
        throw ProfileError(square ? "profile without PrinterType carries both BedRadius and BedX/BedY"
                                  : "profile without PrinterType carries BedRadius");
    }
    return PrinterType::Cartesian;
}

PrinterProfile assemble(const RawProfile& raw)
{
    const PrinterType type = resolvePrinterType(raw);
    PrinterProfile profile;
    profile.process = readParams(readMode(raw.mode), raw.params);

    if (type == PrinterType::Delta)
    {
        CylindricalEnvelope bounds;
        bounds.radius_mm = readBound(raw.bedRadius, bounds.radius_mm, key::bedRadius);
        bounds.maxZ_mm = readBound(raw.bedZ, bounds.maxZ_mm, key::bedZ);
        profile.envelope = bounds;
    }
    else
    {
        RectangularEnvelope bounds;
        bounds.maxX_mm = readBound(raw.bedX, bounds.maxX_mm, key::bedX);
        bounds.maxY_mm = readBound(raw.bedY, bounds.maxY_mm, key::bedY);
        bounds.maxZ_mm = readBound(raw.bedZ, bounds.maxZ_mm, key::bedZ);
        profile.envelope = bounds;
    }

    if (std::optional<BedOutline> outline = readOutline(raw.bedShape))
    {
        profile.bed = std::move(*outline);
    }
    profile.ensureValid();
    return profile;
}

QJsonArray outlineToJson(const BedOutline& outline)
{
    QJsonArray points;
    for (const Point& vertex : outline.pts)
    {
        points.append(QJsonArray{vertex.x, vertex.y, vertex.z});
    }
    return points;
}

} // namespace

PrinterProfile profileFromJson(const QJsonObject& object)
{
    RawProfile raw;
    raw.mode = object.value(key::mode);
    raw.printerType = object.value(key::printerType);
    raw.params = object.value(key::params);
    raw.bedX = object.value(key::bedX);
    raw.bedY = object.value(key::bedY);
    raw.bedZ = object.value(key::bedZ);
    raw.bedRadius = object.value(key::bedRadius);
    raw.bedShape = object.value(key::bedShape);

    return assemble(raw);
}

PrinterProfile profileFromJson(const QJsonArray& array)
{
    const auto slot = [&array](Slot index) {
        return (index < array.size()) ? array.at(index) : QJsonValue(QJsonValue::Undefined);
    };

    RawProfile raw;
    raw.mode = slot(kSlotMode);
    raw.printerType = slot(kSlotPrinterType);
    raw.params = slot(kSlotParams);
    raw.bedX = slot(kSlotBedX);
    raw.bedY = slot(kSlotBedY);
    raw.bedZ = slot(kSlotBedZ);
    raw.bedRadius = slot(kSlotBedRadius);
    raw.bedShape = slot(kSlotBedShape);

    return assemble(raw);
}

PrinterProfile profileFromJson(const QJsonValue& value)
{
    if (value.isObject())
    {
        return profileFromJson(value.toObject());
    }
    if (value.isArray())
    {
        return profileFromJson(value.toArray());
    }
    if (value.isString())
    {
        return decodeProfile(value.toString());
    }
    if (!isAbsent(value))
    {
        LOG_WARN(Config, "profile is neither a mapping nor a list, using defaults");
    }
    return makeDefaultProfile();
}

PrinterProfile decodeProfile(const QString& encoded)
{
    if (encoded.trimmed().isEmpty())
    {
        return makeDefaultProfile();
    }

    QJsonParseError error{};
    const QJsonDocument document = QJsonDocument::fromJson(encoded.toUtf8(), &error);
    if (error.error != QJsonParseError::NoError)
    {
        LOG_WARN(Config, QStringLiteral("could not decode profile (%1 at offset %2), using defaults")
                             .arg(error.errorString())
                             .arg(error.offset));
        return makeDefaultProfile();
    }

    if (document.isObject())
    {
        return profileFromJson(document.object());
    }
    if (document.isArray())
    {
        return profileFromJson(document.array());
    }
    return makeDefaultProfile();
}

QJsonObject profileToJson(const PrinterProfile& profile)
{
    QJsonObject obj;
    obj.insert(key::mode, QString::fromLatin1(modeName(profile.mode())));
    obj.insert(key::printerType, QString::fromLatin1(printerTypeName(profile.printerType())));

    QJsonObject params;
    if (const auto* hot = std::get_if<ThermoplasticParams>(&profile.process))
    {
        params.insert(QStringLiteral("NozzleTemp"), hot->nozzleTemp_C);
        params.insert(QStringLiteral("BedTemp"), hot->bedTemp_C);
        params.insert(QStringLiteral("ExtrusionMultiplier"), hot->extrusionMultiplier);
        params.insert(QStringLiteral("FeedRate"), hot->feed_mm_min);
        params.insert(QStringLiteral("ClearanceHeight"), hot->clearance_mm);
    }
    else if (const auto* paste = std::get_if<PasteParams>(&profile.process))
    {
        params.insert(QStringLiteral("ExtrusionPressure"), paste->extrusionPressure);
        params.insert(QStringLiteral("FlowRate"), paste->flowRate);
        params.insert(QStringLiteral("RetractionDelay"), paste->retractionDelay_s);
        params.insert(QStringLiteral("CurePause"), paste->curePause_s);
        params.insert(QStringLiteral("FeedRate"), paste->feed_mm_min);
        params.insert(QStringLiteral("ClearanceHeight"), paste->clearance_mm);
    }
    else if (const auto* pen = std::get_if<MotionOnlyParams>(&profile.process))
    {
        params.insert(QStringLiteral("PenUpHeight"), pen->penUpHeight_mm);
        params.insert(QStringLiteral("PenDownOffset"), pen->penDownOffset_mm);
        params.insert(QStringLiteral("PenDownDelay"), pen->penDownDelay_ms);
        params.insert(QStringLiteral("FeedRate"), pen->feed_mm_min);
        params.insert(QStringLiteral("ClearanceHeight"), pen->clearance_mm);
    }
    obj.insert(key::params, params);

    if (const auto* box = std::get_if<RectangularEnvelope>(&profile.envelope))
    {
        obj.insert(key::bedX, box->maxX_mm);
        obj.insert(key::bedY, box->maxY_mm);
        obj.insert(key::bedZ, box->maxZ_mm);
    }
    else if (const auto* cylinder = std::get_if<CylindricalEnvelope>(&profile.envelope))
    {
        obj.insert(key::bedRadius, cylinder->radius_mm);
        obj.insert(key::bedZ, cylinder->maxZ_mm);
    }

    if (profile.bed.kind == BedOutline::Kind::Custom)
    {
        obj.insert(key::bedShape, outlineToJson(profile.bed));
    }
    return obj;
}

} // namespace tp
