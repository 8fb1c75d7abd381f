/*******************************************************************************
 Copyright 2023 Daniel Neuwirth
 This program is distributed under the terms of the GNU General Public License.
*******************************************************************************/

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QtDebug>
#include "loader/matchloader.h"
#include "match/matchparser.h"
#include "shared/error.h"
#include "stats/aggregator.h"

QStringList MatchLoader::matchFiles(const QString & path) const {

    const QFileInfo entry(path);

    if (entry.isFile())
        return QStringList { entry.filePath() };

    if (!entry.isDir())
        throw FileOperationFailedException(path, QStringLiteral("no such file or directory"));

    const QDir directory(path);
    QStringList files;

    for (const auto & fileName: directory.entryList(QStringList { QStringLiteral("*.json") }, QDir::Files, QDir::Name))
        files.append(directory.filePath(fileName));

    return files;
}

MatchDocument MatchLoader::loadFile(const QString & fileName) const {

    QFile file(fileName);

    if (!file.open(QIODevice::ReadOnly))
        throw FileOperationFailedException(fileName, file.errorString());

    const QByteArray content = file.readAll();
    file.close();

    // fresh parser and aggregator state for every match
    const MatchRecord record = MatchParser().parse(content);
    const MatchStatistics statistics = StatisticsAggregator(_settings).aggregate(record);

    qDebug() << "processed" << fileName << "|" << record.innings().size() << "innings |"
             << statistics.warnings().size() << "warnings";

    return MatchDocument::build(fileName, record, statistics, _settings);
}

int MatchLoader::loadPath(const QString & path, QVector<MatchDocument> & documents, QVector<Failure> & failures) const {

    const int failuresBefore = failures.size();
    QStringList files;

    try {

        files = this->matchFiles(path);
    }
    catch (ReportException & e) {

        qWarning().noquote() << e.description();
        failures.push_back(qMakePair(path, e.description()));
        return 1;
    }

    for (const auto & fileName: files) {

        try {

            documents.push_back(this->loadFile(fileName));
        }
        catch (ReportException & e) {

            qWarning().noquote() << "skipping" << fileName << "|" << e.description();
            failures.push_back(qMakePair(fileName, e.description()));
        }
    }

    return (failures.size() - failuresBefore);
}
