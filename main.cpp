/*******************************************************************************
 Copyright 2023 Daniel Neuwirth
 This program is distributed under the terms of the GNU General Public License.
*******************************************************************************/

/* Application:     Cricket Match Report
 *
 * IDE/framework:   Qt 5
 * Language:        C++11
 */

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QJsonDocument>
#include <QLocale>
#include <QTextStream>
#include <QtDebug>
#include "loader/matchloader.h"
#include "settings/settings.h"
#include "shared/error.h"

int main(int argc, char * argv[]) {

    QLocale::setDefault(QLocale(QLocale::English, QLocale::UnitedKingdom));

    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("cricketreport"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Ball-by-ball cricket match statistics and text reports."));
    parser.addHelpOption();

    const QCommandLineOption configOption(QStringList { QStringLiteral("c"), QStringLiteral("config") },
                                          QStringLiteral("Settings file (INI)."), QStringLiteral("file"));
    const QCommandLineOption metadataOption(QStringList { QStringLiteral("m"), QStringLiteral("metadata") },
                                            QStringLiteral("Print metadata record (JSON) instead of the report."));
    const QCommandLineOption warningsOption(QStringList { QStringLiteral("w"), QStringLiteral("warnings") },
                                            QStringLiteral("Print warnings collected for every match."));

    parser.addOption(configOption);
    parser.addOption(metadataOption);
    parser.addOption(warningsOption);
    parser.addPositionalArgument(QStringLiteral("paths"), QStringLiteral("Match files or directories."),
                                 QStringLiteral("<file-or-dir>..."));
    parser.process(app);

    if (parser.positionalArguments().isEmpty())
        parser.showHelp(1);

    Settings settings;

    try {

        if (parser.isSet(configOption))
            settings.loadFromFile(parser.value(configOption));
    }
    catch (ReportException & e) {

        qCritical().noquote() << e.description();
        return 2;
    }

    const MatchLoader loader(settings);
    QVector<MatchDocument> documents;
    QVector<MatchLoader::Failure> failures;

    for (const auto & path: parser.positionalArguments())
        loader.loadPath(path, documents, failures);

    QTextStream out(stdout);

    for (const auto & document: documents) {

        if (parser.isSet(metadataOption))
            out << QJsonDocument(document.metadata().toJson()).toJson(QJsonDocument::Compact) << '\n';
        else
            out << "=== " << document.metadata().fileName() << " ===\n" << document.text() << "\n\n";

        if (parser.isSet(warningsOption))
            for (const auto & warning: document.warnings())
                out << "warning: " << warning.description() << '\n';
    }

    out.flush();

    if (!failures.isEmpty()) {

        qWarning() << failures.size() << "file(s) could not be processed";
        return 1;
    }

    return 0;
}
