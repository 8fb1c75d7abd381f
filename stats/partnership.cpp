/*******************************************************************************
 Copyright 2023 Daniel Neuwirth
 This program is distributed under the terms of the GNU General Public License.
*******************************************************************************/

#include "stats/partnership.h"

Partnership::Partnership(const QString & striker, const QString & nonStriker, const uint16_t startScore):
    _batters(qMakePair(striker, nonStriker)), _startScore(startScore), _endScore(startScore), _wicketNumber(0),
    _runs(0), _balls(0), _fours(0), _sixes(0), _dots(0) {

    _batterRuns.insert(striker, 0);
    _batterRuns.insert(nonStriker, 0);
}

void Partnership::addDelivery(const Delivery & delivery) {

    const bool valid = delivery.isValid();

    _runs += delivery.runs().total();
    _batterRuns[delivery.striker()] += delivery.runs().batter();

    MatchupFigures & bowler = _bowlers[delivery.bowler()];
    bowler.addRuns(delivery.runs().total());

    if (valid) {

        ++_balls;
        bowler.addBall();
    }
    if (delivery.isDotBall()) {

        ++_dots;
        bowler.addDot();
    }
    if (delivery.isFour()) {

        ++_fours;
        bowler.addFour();
    }
    if (delivery.isSix()) {

        ++_sixes;
        bowler.addSix();
    }

    return;
}

void Partnership::close(const uint16_t endScore, const uint8_t wicketNumber) {

    _endScore = endScore;
    _wicketNumber = wicketNumber;

    return;
}

double Partnership::runRate(const uint8_t ballsPerOver) const {

    return (_balls > 0) ? (_runs * static_cast<double>(ballsPerOver) / _balls) : 0.0;
}

double Partnership::boundaryPercentage() const {

    return (_balls > 0) ? ((_fours + _sixes) * 100.0 / _balls) : 0.0;
}

double Partnership::dotPercentage() const {

    return (_balls > 0) ? (_dots * 100.0 / _balls) : 0.0;
}
