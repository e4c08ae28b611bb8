#pragma once

#include <QtCore/QString>

#include <cstddef>
#include <string>
#include <vector>

namespace app
{

constexpr std::size_t kPreviewLines = 30;

/// First lines of the program followed by the total line count.
QString previewText(const std::vector<std::string>& lines, std::size_t maxLines = kPreviewLines);

QString reportLine(std::size_t geometryCount,
                   std::size_t pathCount,
                   std::size_t lineCount,
                   const std::string& status);

QString saveFailureReport(const QString& reason);

} // namespace app
