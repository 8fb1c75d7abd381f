/*******************************************************************************
 Copyright 2023 Daniel Neuwirth
 This program is distributed under the terms of the GNU General Public License.
*******************************************************************************/

#include <QFileInfo>
#include <QJsonArray>
#include "report/matchdocument.h"
#include "report/reportrenderer.h"
#include "shared/constants.h"

MatchMetadata::MatchMetadata(const QString & fileName, const QString & matchId, const QStringList & teams,
                             const QString & date, const QString & venue, const QString & event):
    _fileName(fileName), _matchId(matchId), _teams(teams), _date(date), _venue(venue), _event(event) {}

QJsonObject MatchMetadata::toJson() const {

    QJsonObject json;

    json.insert(QStringLiteral("filename"), _fileName);
    json.insert(QStringLiteral("match_id"), _matchId);
    json.insert(QStringLiteral("teams"), QJsonArray::fromStringList(_teams));
    json.insert(QStringLiteral("date"), _date);
    json.insert(QStringLiteral("venue"), _venue);
    json.insert(QStringLiteral("event"), _event);

    return json;
}

MatchDocument MatchDocument::build(const QString & fileName, const MatchRecord & record,
                                   const MatchStatistics & statistics, const Settings & settings) {

    const MatchInfo & info = record.info();
    const QFileInfo file(fileName);

    // teams are listed only if the record names them
    QStringList teams = info.teamList();
    if (teams.contains(unknownValue.Value))
        teams.clear();

    MatchDocument document;

    document._text = ReportRenderer(settings).render(record, statistics);
    document._metadata = MatchMetadata(file.fileName(), file.completeBaseName(), teams, info.date(), info.venue(),
                                       info.eventName());
    document._warnings = statistics.warnings();

    return document;
}
