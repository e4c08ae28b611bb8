#include "common/logging.h"

#include <QtCore/QDateTime>
#include <QtCore/QTextStream>

#include <cstdlib>

namespace common
{

Q_LOGGING_CATEGORY(appLog, "foam.app")

namespace
{

void outputMessage(QtMsgType type, const QMessageLogContext& context, const QString& message)
{
    QString level;
    switch (type)
    {
    case QtDebugMsg: level = QStringLiteral("DEBUG"); break;
    case QtInfoMsg: level = QStringLiteral("INFO"); break;
    case QtWarningMsg: level = QStringLiteral("WARN"); break;
    case QtCriticalMsg: level = QStringLiteral("CRITICAL"); break;
    case QtFatalMsg: level = QStringLiteral("FATAL"); break;
    }

    QTextStream stream(stderr);
    stream << '[' << QDateTime::currentDateTime().toString(Qt::ISODateWithMs) << "] "
           << level << ' ';
    if (context.category != nullptr)
    {
        stream << '(' << context.category << ") ";
    }
    stream << message << Qt::endl;

    if (type == QtFatalMsg)
    {
        abort();
    }
}

} // namespace

void initLogging(bool verbose)
{
    qInstallMessageHandler(outputMessage);
    // Run summaries are info level; keep them quiet unless asked for.
    if (!verbose)
    {
        QLoggingCategory::setFilterRules(QStringLiteral("foam.*.info=false"));
    }
}

void logInfo(const QString& message)
{
    qCInfo(appLog).noquote() << message;
}

void logWarning(const QString& message)
{
    qCWarning(appLog).noquote() << message;
}

void logError(const QString& message)
{
    qCCritical(appLog).noquote() << message;
}

} // namespace common
