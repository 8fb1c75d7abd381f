/*******************************************************************************
 Copyright 2023 Daniel Neuwirth
 This program is distributed under the terms of the GNU General Public License.
*******************************************************************************/

#include "shared/constants.h"
#include "stats/phase.h"

const QMap<MatchPhase::Phase, QString> PhasePolicy::_phaseNames {

    { MatchPhase::Phase::POWERPLAY, QStringLiteral("Powerplay") },
    { MatchPhase::Phase::MIDDLE, QStringLiteral("Middle Overs") },
    { MatchPhase::Phase::DEATH, QStringLiteral("Death Overs") }
};

PhasePolicy::PhasePolicy(): _powerplayEnd(cricketDefaults.PowerplayEnd), _middleEnd(cricketDefaults.MiddleEnd) {}

PhasePolicy::PhasePolicy(const uint16_t powerplayEnd, const uint16_t middleEnd):
    _powerplayEnd(powerplayEnd), _middleEnd(middleEnd) {}

MatchPhase::Phase PhasePolicy::phaseOf(const uint16_t overNo) const {

    if (overNo < _powerplayEnd)
        return MatchPhase::Phase::POWERPLAY;
    if (overNo < _middleEnd)
        return MatchPhase::Phase::MIDDLE;

    return MatchPhase::Phase::DEATH;
}

uint16_t PhasePolicy::firstOver(const MatchPhase::Phase phase) const {

    switch (phase) {

        case MatchPhase::Phase::POWERPLAY: return 0;
        case MatchPhase::Phase::MIDDLE: return _powerplayEnd;
        case MatchPhase::Phase::DEATH: return _middleEnd;
    }
    return 0;
}

int32_t PhasePolicy::lastOver(const MatchPhase::Phase phase) const {

    switch (phase) {

        case MatchPhase::Phase::POWERPLAY: return static_cast<int32_t>(_powerplayEnd) - 1;
        case MatchPhase::Phase::MIDDLE: return static_cast<int32_t>(_middleEnd) - 1;
        case MatchPhase::Phase::DEATH: return -1;
    }
    return -1;
}

QString PhasePolicy::phaseName(const MatchPhase::Phase phase) {

    return _phaseNames.value(phase, QStringLiteral("Unknown Phase"));
}

QVector<MatchPhase::Phase> PhasePolicy::allPhases() {

    return QVector<MatchPhase::Phase> { MatchPhase::Phase::POWERPLAY, MatchPhase::Phase::MIDDLE, MatchPhase::Phase::DEATH };
}

PhaseSplit::PhaseSplit(const MatchPhase::Phase phase):
    _phase(phase), _overs(0), _runs(0), _wickets(0), _fours(0), _sixes(0), _extras(0), _dots(0), _validBalls(0) {}

void PhaseSplit::addOver(const OverSummary & over) {

    ++_overs;
    _runs += over.runs();
    _wickets += over.wickets();
    _fours += over.fours();
    _sixes += over.sixes();
    _extras += over.extras();
    _dots += over.dots();
    _validBalls += over.validBalls();

    return;
}

double PhaseSplit::runRate(const uint8_t ballsPerOver) const {

    return (_validBalls > 0) ? (_runs * static_cast<double>(ballsPerOver) / _validBalls) : 0.0;
}

double PhaseSplit::boundaryPercentage() const {

    return (_validBalls > 0) ? ((_fours + _sixes) * 100.0 / _validBalls) : 0.0;
}

double PhaseSplit::dotPercentage() const {

    return (_validBalls > 0) ? (_dots * 100.0 / _validBalls) : 0.0;
}
