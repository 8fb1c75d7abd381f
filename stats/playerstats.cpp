/*******************************************************************************
 Copyright 2023 Daniel Neuwirth
 This program is distributed under the terms of the GNU General Public License.
*******************************************************************************/

#include "stats/playerstats.h"

BatterStat::BatterStat(const QString & name):
    _name(name), _runs(0), _balls(0), _fours(0), _sixes(0), _dots(0), _dismissals(0), _out(false),
    _howOut(QStringLiteral("not out")), _strikeRate(0.0) {}

// runs off the bat are credited also on no-balls, balls faced only on valid deliveries
void BatterStat::addDelivery(const uint16_t runs, const bool valid, const bool dot, const bool four, const bool six) {

    _runs += runs;

    if (valid)
        ++_balls;
    if (dot)
        ++_dots;
    if (four)
        ++_fours;
    if (six)
        ++_sixes;

    return;
}

void BatterStat::setOut(const QString & description) {

    _out = true;
    _howOut = description;

    return;
}

void BatterStat::finalize() {

    _strikeRate = (_balls > 0) ? (_runs * 100.0 / _balls) : 0.0;
    return;
}

BowlerStat::BowlerStat(const QString & name):
    _name(name), _balls(0), _runs(0), _wickets(0), _maidens(0), _completedOvers(0), _incompleteOverBalls(0),
    _dots(0), _fours(0), _sixes(0), _wides(0), _noBalls(0), _economy(0.0) {}

void BowlerStat::addDelivery(const uint16_t runs, const bool valid, const bool dot, const bool four, const bool six) {

    _runs += runs;

    if (valid)
        ++_balls;
    if (dot)
        ++_dots;
    if (four)
        ++_fours;
    if (six)
        ++_sixes;

    return;
}

// valid balls the bowler delivered in one (finished) over
void BowlerStat::addOverBalls(const uint8_t validBalls, const uint8_t ballsPerOver) {

    if (validBalls >= ballsPerOver)
        ++_completedOvers;
    else
        _incompleteOverBalls += validBalls;

    return;
}

double BowlerStat::oversBowled(const uint8_t ballsPerOver) const {

    if (ballsPerOver == 0)
        return _completedOvers;

    return (_completedOvers + _incompleteOverBalls / static_cast<double>(ballsPerOver));
}

void BowlerStat::finalize(const uint8_t ballsPerOver) {

    const double overs = this->oversBowled(ballsPerOver);

    _economy = (_balls > 0 && overs > 0) ? (_runs / overs) : 0.0;
    return;
}

FielderStat::FielderStat(const QString & name): _name(name), _catches(0), _stumpings(0), _runOuts(0) {}

void FielderStat::addContribution(const Contribution contribution, const QString & position) {

    switch (contribution) {

        case Contribution::CATCH: ++_catches; break;
        case Contribution::STUMPING: ++_stumpings; break;
        case Contribution::RUN_OUT: ++_runOuts; break;
    }

    ++_byPosition[contribution][position];
    return;
}

QMap<QString, uint16_t> FielderStat::byPosition(const Contribution contribution) const {

    return _byPosition.value(contribution);
}
