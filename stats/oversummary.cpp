/*******************************************************************************
 Copyright 2023 Daniel Neuwirth
 This program is distributed under the terms of the GNU General Public License.
*******************************************************************************/

#include "stats/oversummary.h"

OverSummary::OverSummary(): OverSummary(0, MatchPhase::Phase::POWERPLAY) {}

OverSummary::OverSummary(const uint16_t number, const MatchPhase::Phase phase):
    _number(number), _phase(phase), _singleBowler(true), _runs(0), _wickets(0), _fours(0), _sixes(0), _extras(0),
    _dots(0), _balls(0), _validBalls(0), _cumulativeRuns(0), _cumulativeWickets(0), _runRate(0.0),
    _cumulativeRunRate(0.0), _maiden(false) {}

void OverSummary::addDelivery(const Delivery & delivery) {

    ++_balls;
    if (delivery.isValid())
        ++_validBalls;
    if (delivery.isDotBall())
        ++_dots;

    _runs += delivery.runs().total();
    _extras += delivery.runs().extras();

    if (delivery.isFour())
        ++_fours;
    if (delivery.isSix())
        ++_sixes;

    return;
}

bool OverSummary::assignBowler(const QString & bowler) {

    if (_bowler.isEmpty()) {

        _bowler = bowler;
        return true;
    }

    if (_bowler != bowler)
        _singleBowler = false;

    return (_bowler == bowler);
}

void OverSummary::finalize(const uint16_t cumulativeRuns, const uint16_t cumulativeWickets,
                           const uint16_t cumulativeValidBalls, const uint8_t ballsPerOver) {

    _cumulativeRuns = cumulativeRuns;
    _cumulativeWickets = cumulativeWickets;

    // rates are defined as 0 if no valid ball has been bowled
    _runRate = (_validBalls > 0) ? (_runs * static_cast<double>(ballsPerOver) / _validBalls) : 0.0;
    _cumulativeRunRate = (cumulativeValidBalls > 0)
        ? (cumulativeRuns * static_cast<double>(ballsPerOver) / cumulativeValidBalls) : 0.0;

    _maiden = (_runs == 0 && _validBalls == ballsPerOver);

    return;
}
