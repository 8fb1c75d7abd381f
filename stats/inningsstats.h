/*******************************************************************************
 Copyright 2023 Daniel Neuwirth
 This program is distributed under the terms of the GNU General Public License.
*******************************************************************************/

#ifndef INNINGSSTATS_H
#define INNINGSSTATS_H

#include <QMap>
#include <QString>
#include <QVector>
#include <cstdint>
#include "match/matchrecord.h"
#include "shared/matchwarning.h"
#include "stats/matchup.h"
#include "stats/oversummary.h"
#include "stats/partnership.h"
#include "stats/phase.h"
#include "stats/playerstats.h"

class InningsStatistics {

    friend class StatisticsAggregator;

    public:
        InningsStatistics(): InningsStatistics(0, QString(), QString(), false) {}
        InningsStatistics(const uint8_t, const QString &, const QString &, const bool);
        ~InningsStatistics() {}

        inline uint8_t inningsNo() const { return _inningsNo; }
        inline QString battingTeam() const { return _battingTeam; }
        inline QString fieldingTeam() const { return _fieldingTeam; }
        inline bool superOver() const { return _superOver; }

        // players are listed in order of their first appearance in the innings
        inline const QVector<BatterStat> & batters() const { return _batters; }
        inline const QVector<BowlerStat> & bowlers() const { return _bowlers; }
        inline const QVector<FielderStat> & fielders() const { return _fielders; }

        BatterStat batter(const QString &) const;
        BowlerStat bowler(const QString &) const;
        FielderStat fielder(const QString &) const;

        inline const MatchupTable & matchups() const { return _matchups; }
        inline const QVector<OverSummary> & overs() const { return _overs; }
        inline const PhaseSplit & phaseSplit(const MatchPhase::Phase phase) const
            { return _phaseSplits[static_cast<uint8_t>(phase)]; }
        inline const QVector<Partnership> & partnerships() const { return _partnerships; }

        inline uint16_t extras(const DeliveryExtras::Type type) const { return _extrasBreakdown.value(type, 0); }

        inline uint16_t runs() const { return _runs; }
        inline uint16_t wickets() const { return _wickets; }
        inline uint16_t balls() const { return _balls; }
        inline uint16_t validBalls() const { return _validBalls; }
        inline uint16_t fours() const { return _fours; }
        inline uint16_t sixes() const { return _sixes; }
        inline uint16_t extrasTotal() const { return _extras; }

        double runRate(const uint8_t) const;

        // wickets credited to bowlers (run outs and retirements excluded)
        uint16_t bowlerWickets() const;
        // share of the bowler's wickets on all bowler-credited wickets (in %)
        double wicketShare(const QString &) const;

        inline const QVector<MatchWarning> & warnings() const { return _warnings; }

    private:
        BatterStat & batterEntry(const QString &);
        BowlerStat & bowlerEntry(const QString &);
        FielderStat & fielderEntry(const QString &);

        void addOver(const OverSummary &);
        inline void addPartnership(const Partnership & partnership) { _partnerships.push_back(partnership); return; }
        inline void addWarning(const MatchWarning & warning) { _warnings.push_back(warning); return; }

        void finalize(const uint8_t);

        uint8_t _inningsNo;
        QString _battingTeam;
        QString _fieldingTeam;
        bool _superOver;

        QVector<BatterStat> _batters;
        QVector<BowlerStat> _bowlers;
        QVector<FielderStat> _fielders;
        QMap<QString, int> _batterIndex;
        QMap<QString, int> _bowlerIndex;
        QMap<QString, int> _fielderIndex;

        MatchupTable _matchups;
        QVector<OverSummary> _overs;
        QVector<PhaseSplit> _phaseSplits;
        QVector<Partnership> _partnerships;
        QMap<DeliveryExtras::Type, uint16_t> _extrasBreakdown;

        uint16_t _runs = 0;
        uint16_t _wickets = 0;
        uint16_t _balls = 0;
        uint16_t _validBalls = 0;
        uint16_t _fours = 0;
        uint16_t _sixes = 0;
        uint16_t _extras = 0;

        QVector<MatchWarning> _warnings;
};

class MatchStatistics {

    friend class StatisticsAggregator;

    public:
        MatchStatistics() {}
        ~MatchStatistics() {}

        inline const QVector<InningsStatistics> & innings() const { return _innings; }

        uint32_t totalRuns() const;
        uint32_t totalWickets() const;
        uint32_t totalFours() const;
        uint32_t totalSixes() const;
        uint32_t totalExtras() const;
        uint32_t totalValidBalls() const;

        // warnings of all innings in order of occurrence
        QVector<MatchWarning> warnings() const;

    private:
        QVector<InningsStatistics> _innings;
};

#endif // INNINGSSTATS_H
