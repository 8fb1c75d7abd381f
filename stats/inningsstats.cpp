/*******************************************************************************
 Copyright 2023 Daniel Neuwirth
 This program is distributed under the terms of the GNU General Public License.
*******************************************************************************/

#include "stats/inningsstats.h"

InningsStatistics::InningsStatistics(const uint8_t inningsNo, const QString & battingTeam,
                                     const QString & fieldingTeam, const bool superOver):
    _inningsNo(inningsNo), _battingTeam(battingTeam), _fieldingTeam(fieldingTeam), _superOver(superOver) {

    for (auto phase: PhasePolicy::allPhases())
        _phaseSplits.push_back(PhaseSplit(phase));
}

BatterStat InningsStatistics::batter(const QString & name) const {

    return (_batterIndex.contains(name)) ? _batters.at(_batterIndex.value(name)) : BatterStat(name);
}

BowlerStat InningsStatistics::bowler(const QString & name) const {

    return (_bowlerIndex.contains(name)) ? _bowlers.at(_bowlerIndex.value(name)) : BowlerStat(name);
}

FielderStat InningsStatistics::fielder(const QString & name) const {

    return (_fielderIndex.contains(name)) ? _fielders.at(_fielderIndex.value(name)) : FielderStat(name);
}

BatterStat & InningsStatistics::batterEntry(const QString & name) {

    if (!_batterIndex.contains(name)) {

        _batterIndex.insert(name, _batters.size());
        _batters.push_back(BatterStat(name));
    }

    return _batters[_batterIndex.value(name)];
}

BowlerStat & InningsStatistics::bowlerEntry(const QString & name) {

    if (!_bowlerIndex.contains(name)) {

        _bowlerIndex.insert(name, _bowlers.size());
        _bowlers.push_back(BowlerStat(name));
    }

    return _bowlers[_bowlerIndex.value(name)];
}

FielderStat & InningsStatistics::fielderEntry(const QString & name) {

    if (!_fielderIndex.contains(name)) {

        _fielderIndex.insert(name, _fielders.size());
        _fielders.push_back(FielderStat(name));
    }

    return _fielders[_fielderIndex.value(name)];
}

// phase splits are built from finished overs only
void InningsStatistics::addOver(const OverSummary & over) {

    _overs.push_back(over);
    _phaseSplits[static_cast<uint8_t>(over.phase())].addOver(over);

    return;
}

void InningsStatistics::finalize(const uint8_t ballsPerOver) {

    for (auto & batter: _batters)
        batter.finalize();

    for (auto & bowler: _bowlers)
        bowler.finalize(ballsPerOver);

    return;
}

double InningsStatistics::runRate(const uint8_t ballsPerOver) const {

    return (_validBalls > 0) ? (_runs * static_cast<double>(ballsPerOver) / _validBalls) : 0.0;
}

uint16_t InningsStatistics::bowlerWickets() const {

    uint16_t wickets = 0;

    for (const auto & bowler: _bowlers)
        wickets += bowler.wickets();

    return wickets;
}

double InningsStatistics::wicketShare(const QString & name) const {

    const uint16_t total = this->bowlerWickets();
    return (total > 0) ? (this->bowler(name).wickets() * 100.0 / total) : 0.0;
}

uint32_t MatchStatistics::totalRuns() const {

    uint32_t total = 0;
    for (const auto & innings: _innings)
        total += innings.runs();

    return total;
}

uint32_t MatchStatistics::totalWickets() const {

    uint32_t total = 0;
    for (const auto & innings: _innings)
        total += innings.wickets();

    return total;
}

uint32_t MatchStatistics::totalFours() const {

    uint32_t total = 0;
    for (const auto & innings: _innings)
        total += innings.fours();

    return total;
}

uint32_t MatchStatistics::totalSixes() const {

    uint32_t total = 0;
    for (const auto & innings: _innings)
        total += innings.sixes();

    return total;
}

uint32_t MatchStatistics::totalExtras() const {

    uint32_t total = 0;
    for (const auto & innings: _innings)
        total += innings.extrasTotal();

    return total;
}

uint32_t MatchStatistics::totalValidBalls() const {

    uint32_t total = 0;
    for (const auto & innings: _innings)
        total += innings.validBalls();

    return total;
}

QVector<MatchWarning> MatchStatistics::warnings() const {

    QVector<MatchWarning> warnings;

    for (const auto & innings: _innings)
        warnings += innings.warnings();

    return warnings;
}
