/*******************************************************************************
 Copyright 2023 Daniel Neuwirth
 This program is distributed under the terms of the GNU General Public License.
*******************************************************************************/

#ifndef PARTNERSHIP_H
#define PARTNERSHIP_H

#include <QMap>
#include <QPair>
#include <QString>
#include <cstdint>
#include "match/matchrecord.h"
#include "stats/matchup.h"

class Partnership {

    public:
        Partnership(): Partnership(QString(), QString(), 0) {}
        Partnership(const QString &, const QString &, const uint16_t);
        ~Partnership() {}

        void addDelivery(const Delivery &);
        inline void addBowlerWicket(const QString & bowler) { _bowlers[bowler].addDismissal(); return; }
        // wicket number is 0 if the partnership was not ended by a fallen wicket (innings end, retirement)
        void close(const uint16_t, const uint8_t);

        inline QPair<QString, QString> batters() const { return _batters; }
        inline uint16_t startScore() const { return _startScore; }
        inline uint16_t endScore() const { return _endScore; }
        inline uint8_t wicketNumber() const { return _wicketNumber; }
        inline bool endedByWicket() const { return (_wicketNumber > 0); }

        inline uint16_t runs() const { return _runs; }
        inline uint16_t balls() const { return _balls; }
        inline uint16_t fours() const { return _fours; }
        inline uint16_t sixes() const { return _sixes; }
        inline uint16_t dots() const { return _dots; }

        inline uint16_t batterRuns(const QString & batter) const { return _batterRuns.value(batter, 0); }
        inline QMap<QString, MatchupFigures> bowlers() const { return _bowlers; }

        double runRate(const uint8_t) const;
        double boundaryPercentage() const;
        double dotPercentage() const;

    private:
        QPair<QString, QString> _batters;
        uint16_t _startScore;
        uint16_t _endScore;
        uint8_t _wicketNumber;

        uint16_t _runs;
        uint16_t _balls;
        uint16_t _fours;
        uint16_t _sixes;
        uint16_t _dots;

        QMap<QString, uint16_t> _batterRuns;
        QMap<QString, MatchupFigures> _bowlers;
};

#endif // PARTNERSHIP_H
