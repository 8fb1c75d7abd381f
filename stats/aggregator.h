/*******************************************************************************
 Copyright 2023 Daniel Neuwirth
 This program is distributed under the terms of the GNU General Public License.
*******************************************************************************/

#ifndef AGGREGATOR_H
#define AGGREGATOR_H

#include <QMap>
#include <QString>
#include <QStringList>
#include <cstdint>
#include "match/matchrecord.h"
#include "settings/settings.h"
#include "shared/matchwarning.h"
#include "stats/inningsstats.h"

// running state of one innings pass; lives only while the innings is processed
struct InningsState {

    InningsState(InningsStatistics & innings, const QStringList & battingSquad, const QStringList & fieldingSquad):
        statistics(innings), battingSquad(battingSquad), fieldingSquad(fieldingSquad),
        partnershipOpen(false), previousOverNo(-1), ballNo(0) {}

    InningsStatistics & statistics;
    const QStringList battingSquad;     // empty if not listed in the record
    const QStringList fieldingSquad;

    bool partnershipOpen;
    Partnership partnership;

    OverSummary over;
    QMap<QString, uint8_t> overBowlerBalls;    // valid balls per bowler within the current over
    int32_t previousOverNo;

    QString overPath;
    uint8_t ballNo;     // position of the delivery within the over (1-based)
    QString path;       // field path of the delivery being processed
};

// Single forward pass per innings producing batting, bowling, fielding,
// partnership, over, phase and matchup statistics. Anomalies of single
// deliveries are collected as warnings; the pass itself never aborts.
class StatisticsAggregator {

    public:
        explicit StatisticsAggregator(const Settings & settings): _settings(settings) {}
        ~StatisticsAggregator() {}

        MatchStatistics aggregate(const MatchRecord &) const;

    private:
        InningsStatistics processInnings(const MatchInfo &, const Innings &, const uint8_t) const;

        void openOver(const Over &, const QString &, InningsState &) const;
        void processDelivery(const Delivery &, InningsState &) const;
        void processWicket(const Wicket &, const Delivery &, const QString &, InningsState &) const;
        void closeOver(InningsState &) const;
        void closePartnership(InningsState &, const uint8_t) const;

        void checkDelivery(const Delivery &, InningsState &) const;
        void checkPlayer(const QString &, const QStringList &, const QString &, const QString &, InningsState &) const;
        void addWarning(InningsState &, const MatchWarning::WarningType, const QString &, const QString &) const;

        const Settings _settings;
};

#endif // AGGREGATOR_H
