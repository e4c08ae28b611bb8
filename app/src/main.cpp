#include "app/GCodeExporter.h"
#include "app/JobFile.h"
#include "app/RunReport.h"
#include "common/logging.h"
#include "tp/GCodeGenerator.h"
#include "tp/ProfileDecoder.h"

#include <QtCore/QCommandLineOption>
#include <QtCore/QCommandLineParser>
#include <QtCore/QCoreApplication>
#include <QtCore/QJsonDocument>
#include <QtCore/QTextStream>

namespace
{

enum ExitCode
{
    kExitOk = 0,
    kExitBadInput = 1,
    kExitWriteFailed = 2
};

} // namespace

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("foam_gcode"));
    app.setOrganizationName(QStringLiteral("FOAM"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Compiles toolpath polylines into printer G-code."));
    parser.addHelpOption();
    parser.addPositionalArgument(QStringLiteral("job"), QStringLiteral("Job file (JSON) with profile and paths."));
    const QCommandLineOption outputOption({QStringLiteral("o"), QStringLiteral("output")},
                                          QStringLiteral("Write the full program to <file>."),
                                          QStringLiteral("file"));
    const QCommandLineOption verboseOption({QStringLiteral("v"), QStringLiteral("verbose")},
                                           QStringLiteral("Log run details."));
    parser.addOption(outputOption);
    parser.addOption(verboseOption);
    parser.process(app);

    common::initLogging(parser.isSet(verboseOption));

    const QStringList positional = parser.positionalArguments();
    if (positional.size() != 1)
    {
        parser.showHelp(kExitBadInput);
    }

    app::Job job;
    QString error;
    if (!app::loadJob(positional.front(), job, &error))
    {
        common::logError(error);
        return kExitBadInput;
    }

    tp::PrinterProfile profile;
    try
    {
        profile = tp::profileFromJson(job.profile);
    }
    catch (const tp::ProfileError& ex)
    {
        common::logError(QStringLiteral("Rejected profile: %1").arg(QString::fromUtf8(ex.what())));
        return kExitBadInput;
    }

    if (parser.isSet(verboseOption))
    {
        const QJsonDocument resolved(tp::profileToJson(profile));
        common::logInfo(QStringLiteral("Resolved profile: %1")
                            .arg(QString::fromUtf8(resolved.toJson(QJsonDocument::Compact))));
    }

    const tp::GCodeGenerator generator;
    const tp::GenerationResult result = generator.generate(job.paths, profile, job.header);

    QTextStream out(stdout);
    out << app::previewText(result.lines) << Qt::endl;

    QString report = app::reportLine(job.geometryCount, result.previewPaths.size(), result.lines.size(), result.status);
    int exitCode = kExitOk;
    if (parser.isSet(outputOption))
    {
        if (!app::GCodeExporter::exportToFile(result.lines, parser.value(outputOption), &error))
        {
            report = app::saveFailureReport(error);
            exitCode = kExitWriteFailed;
        }
    }

    for (const tp::PointWarning& warning : result.diagnostics.warnings)
    {
        common::logWarning(QStringLiteral("%1 at (%2, %3, %4)")
                               .arg(QString::fromStdString(warning.text))
                               .arg(warning.point.x)
                               .arg(warning.point.y)
                               .arg(warning.point.z));
    }

    out << report << Qt::endl;
    return exitCode;
}
