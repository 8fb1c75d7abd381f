/*******************************************************************************
 Copyright 2023 Daniel Neuwirth
 This program is distributed under the terms of the GNU General Public License.
*******************************************************************************/

#ifndef OVERSUMMARY_H
#define OVERSUMMARY_H

#include <QString>
#include <cstdint>
#include "match/matchrecord.h"

namespace MatchPhase {

    // do not change the assigned values; they are used as indices of phase splits
    enum class Phase: uint8_t { POWERPLAY = 0, MIDDLE = 1, DEATH = 2 };
}

class OverSummary {

    public:
        OverSummary();
        explicit OverSummary(const uint16_t, const MatchPhase::Phase);
        ~OverSummary() {}

        void addDelivery(const Delivery &);
        inline void addWicket() { ++_wickets; return; }

        // returns false if the bowler differs from the one who started the over
        bool assignBowler(const QString &);

        // cumulative figures are those of the innings after this over
        void finalize(const uint16_t, const uint16_t, const uint16_t, const uint8_t);

        inline uint16_t number() const { return _number; }
        inline MatchPhase::Phase phase() const { return _phase; }
        inline QString bowler() const { return _bowler; }
        inline bool singleBowler() const { return _singleBowler; }

        inline uint16_t runs() const { return _runs; }
        inline uint8_t wickets() const { return _wickets; }
        inline uint8_t fours() const { return _fours; }
        inline uint8_t sixes() const { return _sixes; }
        inline uint16_t extras() const { return _extras; }
        inline uint8_t dots() const { return _dots; }
        inline uint8_t balls() const { return _balls; }
        inline uint8_t validBalls() const { return _validBalls; }

        inline uint16_t cumulativeRuns() const { return _cumulativeRuns; }
        inline uint16_t cumulativeWickets() const { return _cumulativeWickets; }
        inline double runRate() const { return _runRate; }
        inline double cumulativeRunRate() const { return _cumulativeRunRate; }
        inline bool maiden() const { return _maiden; }

    private:
        uint16_t _number;
        MatchPhase::Phase _phase;
        QString _bowler;
        bool _singleBowler;

        uint16_t _runs;
        uint8_t _wickets;
        uint8_t _fours;
        uint8_t _sixes;
        uint16_t _extras;
        uint8_t _dots;
        uint8_t _balls;
        uint8_t _validBalls;

        uint16_t _cumulativeRuns;
        uint16_t _cumulativeWickets;
        double _runRate;
        double _cumulativeRunRate;
        bool _maiden;
};

#endif // OVERSUMMARY_H
