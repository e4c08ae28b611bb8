#include "app/JobFile.h"

#include "common/log.h"
#include "tp/Curve.h"

#include <QtCore/QFile>
#include <QtCore/QJsonArray>
#include <QtCore/QJsonDocument>
#include <QtCore/QJsonObject>

#include <memory>
#include <optional>
#include <string>

namespace app
{

namespace
{

std::optional<tp::PointList> pointsFromJson(const QJsonArray& array)
{
    tp::PointList points;
    points.reserve(static_cast<std::size_t>(array.size()));
    for (const QJsonValue& entry : array)
    {
        const QJsonArray coords = entry.toArray();
        if (!entry.isArray() || coords.size() != 3)
        {
            return std::nullopt;
        }
        for (const QJsonValue& coord : coords)
        {
            if (!coord.isDouble())
            {
                return std::nullopt;
            }
        }
        points.emplace_back(coords.at(0).toDouble(), coords.at(1).toDouble(), coords.at(2).toDouble());
    }
    return points;
}

std::optional<tp::RawPath> pathFromJson(const QJsonValue& value)
{
    if (value.isArray())
    {
        std::optional<tp::PointList> points = pointsFromJson(value.toArray());
        if (!points)
        {
            return std::nullopt;
        }
        return tp::RawPath{std::move(*points)};
    }

    if (value.isObject())
    {
        const QJsonObject object = value.toObject();
        const QString kind = object.value(QStringLiteral("curve")).toString();
        if (kind != QStringLiteral("polyline"))
        {
            return std::nullopt;
        }
        std::optional<tp::PointList> points = pointsFromJson(object.value(QStringLiteral("points")).toArray());
        if (!points)
        {
            return std::nullopt;
        }
        return tp::RawPath{std::make_shared<const tp::PolylineCurve>(std::move(*points))};
    }
    return std::nullopt;
}

} // namespace

bool loadJob(const QString& path, Job& job, QString* error)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text))
    {
        if (error)
        {
            *error = QStringLiteral("Unable to open %1 for reading.").arg(path);
        }
        return false;
    }
    return parseJob(file.readAll(), job, error);
}

bool parseJob(const QByteArray& data, Job& job, QString* error)
{
    QJsonParseError parseError{};
    const QJsonDocument document = QJsonDocument::fromJson(data, &parseError);
    if (parseError.error != QJsonParseError::NoError || !document.isObject())
    {
        if (error)
        {
            *error = parseError.error != QJsonParseError::NoError
                         ? QStringLiteral("Invalid job file: %1").arg(parseError.errorString())
                         : QStringLiteral("Invalid job file: expected a JSON object.");
        }
        return false;
    }

    const QJsonObject root = document.object();
    job.profile = root.value(QStringLiteral("profile"));

    job.paths.clear();
    const QJsonArray paths = root.value(QStringLiteral("paths")).toArray();
    job.geometryCount = static_cast<std::size_t>(paths.size());
    std::size_t unreadable = 0;
    for (const QJsonValue& entry : paths)
    {
        // Unreadable entries become empty paths, which the normalizer drops.
        std::optional<tp::RawPath> raw = pathFromJson(entry);
        if (!raw)
        {
            ++unreadable;
        }
        job.paths.push_back(raw ? std::move(*raw) : tp::RawPath{tp::PointList{}});
    }
    if (unreadable > 0)
    {
        LOG_WARN(Io, std::to_string(unreadable) + " path entries could not be read");
    }

    job.header.reset();
    const QJsonValue header = root.value(QStringLiteral("header"));
    if (header.isArray())
    {
        std::vector<std::string> lines;
        for (const QJsonValue& line : header.toArray())
        {
            lines.push_back(line.toString().toStdString());
        }
        job.header = std::move(lines);
    }
    return true;
}

} // namespace app
