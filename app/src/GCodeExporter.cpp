#include "app/GCodeExporter.h"

#include <QtCore/QFile>

namespace app
{

bool GCodeExporter::exportToFile(const std::vector<std::string>& lines,
                                 const QString& path,
                                 QString* error)
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate | QIODevice::Text))
    {
        if (error)
        {
            *error = QStringLiteral("Unable to open %1 for writing.").arg(path);
        }
        return false;
    }

    std::string data;
    for (std::size_t i = 0; i < lines.size(); ++i)
    {
        if (i > 0)
        {
            data.push_back('\n');
        }
        data.append(lines[i]);
    }

    if (file.write(data.c_str(), static_cast<qint64>(data.size())) == -1)
    {
        if (error)
        {
            *error = QStringLiteral("Failed to write to %1.").arg(path);
        }
        return false;
    }

    return true;
}

} // namespace app
