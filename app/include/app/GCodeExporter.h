#pragma once

#include <QtCore/QString>

#include <string>
#include <vector>

namespace app
{

class GCodeExporter
{
public:
    static bool exportToFile(const std::vector<std::string>& lines,
                             const QString& path,
                             QString* error = nullptr);
};

} // namespace app
