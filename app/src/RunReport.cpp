#include "app/RunReport.h"

#include <QtCore/QStringList>

#include <algorithm>

namespace app
{

QString previewText(const std::vector<std::string>& lines, std::size_t maxLines)
{
    if (lines.empty())
    {
        return QStringLiteral("No G-code generated");
    }

    QStringList head;
    const std::size_t shown = std::min(maxLines, lines.size());
    for (std::size_t i = 0; i < shown; ++i)
    {
        head.append(QString::fromStdString(lines[i]));
    }
    return head.join(QLatin1Char('\n'))
           + QStringLiteral("\n... (%1 lines total)").arg(static_cast<qulonglong>(lines.size()));
}

QString reportLine(std::size_t geometryCount,
                   std::size_t pathCount,
                   std::size_t lineCount,
                   const std::string& status)
{
    return QStringLiteral("Geometry: %1, Paths: %2, G-code lines: %3, Status: %4")
        .arg(static_cast<qulonglong>(geometryCount))
        .arg(static_cast<qulonglong>(pathCount))
        .arg(static_cast<qulonglong>(lineCount))
        .arg(QString::fromStdString(status));
}

QString saveFailureReport(const QString& reason)
{
    return QStringLiteral("Failed to save G-code: %1").arg(reason);
}

} // namespace app
