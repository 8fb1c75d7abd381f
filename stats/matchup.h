/*******************************************************************************
 Copyright 2023 Daniel Neuwirth
 This program is distributed under the terms of the GNU General Public License.
*******************************************************************************/

#ifndef MATCHUP_H
#define MATCHUP_H

#include <QMap>
#include <QPair>
#include <QString>
#include <QVector>
#include <cstdint>

// counters of one batter facing one bowler (or one partnership facing one bowler)
class MatchupFigures {

    public:
        MatchupFigures(): _runs(0), _balls(0), _fours(0), _sixes(0), _dots(0), _dismissals(0) {}
        ~MatchupFigures() {}

        inline void addRuns(const uint16_t runs) { _runs += runs; return; }
        inline void addBall() { ++_balls; return; }
        inline void addFour() { ++_fours; return; }
        inline void addSix() { ++_sixes; return; }
        inline void addDot() { ++_dots; return; }
        inline void addDismissal() { ++_dismissals; return; }

        inline uint16_t runs() const { return _runs; }
        inline uint16_t balls() const { return _balls; }
        inline uint16_t fours() const { return _fours; }
        inline uint16_t sixes() const { return _sixes; }
        inline uint16_t dots() const { return _dots; }
        // seen from the bowler's side these are the bowler's wickets against the batter
        inline uint16_t dismissals() const { return _dismissals; }

        double strikeRate() const;
        double runRate(const uint8_t) const;
        double boundaryPercentage() const;
        double dotPercentage() const;

    private:
        uint16_t _runs;
        uint16_t _balls;
        uint16_t _fours;
        uint16_t _sixes;
        uint16_t _dots;
        uint16_t _dismissals;
};

// Sparse (batter, bowler) -> figures map. Batter-vs-bowler and bowler-vs-batter
// views read the same entries so they always mirror each other.
class MatchupTable {

    public:
        typedef QPair<QString, QString> Key;
        typedef QPair<QString, MatchupFigures> Entry;

        MatchupTable() {}
        ~MatchupTable() {}

        MatchupFigures & figures(const QString &, const QString &);
        MatchupFigures figures(const QString &, const QString &) const;
        inline bool contains(const QString & batter, const QString & bowler) const
            { return _table.contains(qMakePair(batter, bowler)); }

        // ordered by opponent name
        QVector<Entry> vsBowlers(const QString &) const;
        QVector<Entry> vsBatters(const QString &) const;

        inline int size() const { return _table.size(); }

    private:
        QMap<Key, MatchupFigures> _table;
};

#endif // MATCHUP_H
