/*******************************************************************************
 Copyright 2023 Daniel Neuwirth
 This program is distributed under the terms of the GNU General Public License.
*******************************************************************************/

#ifndef MATCHDOCUMENT_H
#define MATCHDOCUMENT_H

#include <QJsonObject>
#include <QString>
#include <QStringList>
#include <QVector>
#include "match/matchrecord.h"
#include "settings/settings.h"
#include "shared/matchwarning.h"
#include "stats/inningsstats.h"

class MatchMetadata {

    public:
        MatchMetadata() {}
        MatchMetadata(const QString &, const QString &, const QStringList &, const QString &, const QString &,
                      const QString &);
        ~MatchMetadata() {}

        inline QString fileName() const { return _fileName; }
        inline QString matchId() const { return _matchId; }
        inline QStringList teams() const { return _teams; }
        inline QString date() const { return _date; }
        inline QString venue() const { return _venue; }
        inline QString event() const { return _event; }

        // {"filename", "match_id", "teams", "date", "venue", "event"}
        QJsonObject toJson() const;

    private:
        QString _fileName;
        QString _matchId;       // file name without extension
        QStringList _teams;
        QString _date;
        QString _venue;
        QString _event;
};

// rendered report of one match together with its metadata record
class MatchDocument {

    public:
        MatchDocument() {}
        ~MatchDocument() {}

        static MatchDocument build(const QString &, const MatchRecord &, const MatchStatistics &, const Settings &);

        inline QString text() const { return _text; }
        inline const MatchMetadata & metadata() const { return _metadata; }
        inline QVector<MatchWarning> warnings() const { return _warnings; }

    private:
        QString _text;
        MatchMetadata _metadata;
        QVector<MatchWarning> _warnings;
};

#endif // MATCHDOCUMENT_H
