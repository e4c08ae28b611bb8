#pragma once

#include "tp/ProgramAssembler.h"
#include "tp/Toolpath.h"

#include <QtCore/QByteArray>
#include <QtCore/QJsonValue>
#include <QtCore/QString>

#include <cstddef>
#include <vector>

namespace app
{

/**
 * Contents of a job file:
 *   {"profile": <mapping | list | encoded string>,
 *    "paths":   [[[x,y,z], ...], {"curve": "polyline", "points": [...]}, ...],
 *    "header":  ["G28", ...]}
 * Profile decoding is left to the caller so profile errors surface there.
 */
struct Job
{
    QJsonValue profile;
    std::vector<tp::RawPath> paths;
    std::size_t geometryCount{0};
    tp::HeaderOverride header;
};

bool loadJob(const QString& path, Job& job, QString* error = nullptr);
bool parseJob(const QByteArray& data, Job& job, QString* error = nullptr);

} // namespace app
