/*******************************************************************************
 Copyright 2023 Daniel Neuwirth
 This program is distributed under the terms of the GNU General Public License.
*******************************************************************************/

#ifndef PHASE_H
#define PHASE_H

#include <QMap>
#include <QString>
#include <QVector>
#include <cstdint>
#include "stats/oversummary.h"

// Splits an innings into three non-overlapping ranges of overs (0-indexed):
// powerplay [0, powerplayEnd), middle [powerplayEnd, middleEnd), death [middleEnd, ...)
class PhasePolicy {

    public:
        PhasePolicy();
        PhasePolicy(const uint16_t, const uint16_t);
        ~PhasePolicy() {}

        MatchPhase::Phase phaseOf(const uint16_t) const;

        inline uint16_t powerplayEnd() const { return _powerplayEnd; }
        inline uint16_t middleEnd() const { return _middleEnd; }
        inline bool isValid() const { return (_powerplayEnd <= _middleEnd); }

        uint16_t firstOver(const MatchPhase::Phase) const;
        // -1 = phase lasts until the end of innings
        int32_t lastOver(const MatchPhase::Phase) const;

        static QString phaseName(const MatchPhase::Phase);
        static QVector<MatchPhase::Phase> allPhases();

    private:
        static const QMap<MatchPhase::Phase, QString> _phaseNames;

        uint16_t _powerplayEnd;
        uint16_t _middleEnd;
};

// totals of all finished overs belonging to one phase
class PhaseSplit {

    public:
        PhaseSplit(): PhaseSplit(MatchPhase::Phase::POWERPLAY) {}
        explicit PhaseSplit(const MatchPhase::Phase);
        ~PhaseSplit() {}

        void addOver(const OverSummary &);

        inline MatchPhase::Phase phase() const { return _phase; }
        inline uint16_t overs() const { return _overs; }
        inline uint16_t runs() const { return _runs; }
        inline uint16_t wickets() const { return _wickets; }
        inline uint16_t fours() const { return _fours; }
        inline uint16_t sixes() const { return _sixes; }
        inline uint16_t extras() const { return _extras; }
        inline uint16_t dots() const { return _dots; }
        inline uint16_t validBalls() const { return _validBalls; }

        inline bool isEmpty() const { return (_overs == 0); }

        double runRate(const uint8_t) const;
        double boundaryPercentage() const;
        double dotPercentage() const;

    private:
        MatchPhase::Phase _phase;
        uint16_t _overs;
        uint16_t _runs;
        uint16_t _wickets;
        uint16_t _fours;
        uint16_t _sixes;
        uint16_t _extras;
        uint16_t _dots;
        uint16_t _validBalls;
};

#endif // PHASE_H
