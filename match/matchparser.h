/*******************************************************************************
 Copyright 2023 Daniel Neuwirth
 This program is distributed under the terms of the GNU General Public License.
*******************************************************************************/

#ifndef MATCHPARSER_H
#define MATCHPARSER_H

#include <QByteArray>
#include <QJsonArray>
#include <QJsonObject>
#include <QJsonValue>
#include <QString>
#include <QStringList>
#include "match/matchrecord.h"

// Converts a raw match record (JSON) into MatchRecord. Absent descriptive fields
// default to the "Unknown" sentinel; missing or invalid innings/over/delivery
// structure throws MalformedMatchError naming the offending field path.
class MatchParser {

    public:
        MatchParser() {}
        ~MatchParser() {}

        MatchRecord parse(const QByteArray &) const;
        MatchRecord parse(const QJsonObject &) const;

    private:
        MatchInfo parseInfo(const QJsonValue &, const QString &) const;
        void parseOutcome(const QJsonObject &, const QString &, Outcome &) const;
        void parseOfficials(const QJsonObject &, const QString &, Officials &) const;

        Innings parseInnings(const QJsonValue &, const QString &, const MatchInfo &) const;
        Over parseOver(const QJsonValue &, const QString &) const;
        Delivery parseDelivery(const QJsonValue &, const QString &) const;
        Wicket parseWicket(const QJsonValue &, const QString &) const;
        Fielder parseFielder(const QJsonValue &, const QString &) const;

        QJsonObject requireObject(const QJsonValue &, const QString &) const;
        QJsonArray requireArray(const QJsonObject &, const QString &, const QString &) const;
        QJsonObject optionalObject(const QJsonObject &, const QString &, const QString &) const;
        QJsonArray optionalArray(const QJsonObject &, const QString &, const QString &) const;

        QString readString(const QJsonObject &, const QString &, const QString &) const;
        QStringList readStringList(const QJsonObject &, const QString &, const QString &) const;
        uint16_t readNumber(const QJsonObject &, const QString &, const QString &, const uint16_t = 0) const;
        uint16_t toNumber(const QJsonValue &, const QString &) const;
        double readDecimal(const QJsonObject &, const QString &, const QString &) const;
        bool readFlag(const QJsonObject &, const QString &, const QString &) const;

        static QString fieldPath(const QString &, const QString &);
        static QString indexPath(const QString &, const int);
};

#endif // MATCHPARSER_H
