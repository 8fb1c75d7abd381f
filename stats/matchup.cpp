/*******************************************************************************
 Copyright 2023 Daniel Neuwirth
 This program is distributed under the terms of the GNU General Public License.
*******************************************************************************/

#include "stats/matchup.h"

double MatchupFigures::strikeRate() const {

    return (_balls > 0) ? (_runs * 100.0 / _balls) : 0.0;
}

double MatchupFigures::runRate(const uint8_t ballsPerOver) const {

    return (_balls > 0) ? (_runs * static_cast<double>(ballsPerOver) / _balls) : 0.0;
}

double MatchupFigures::boundaryPercentage() const {

    return (_balls > 0) ? ((_fours + _sixes) * 100.0 / _balls) : 0.0;
}

double MatchupFigures::dotPercentage() const {

    return (_balls > 0) ? (_dots * 100.0 / _balls) : 0.0;
}

MatchupFigures & MatchupTable::figures(const QString & batter, const QString & bowler) {

    // inserts default (zero) figures if pair is not present yet
    return _table[qMakePair(batter, bowler)];
}

MatchupFigures MatchupTable::figures(const QString & batter, const QString & bowler) const {

    return _table.value(qMakePair(batter, bowler));
}

QVector<MatchupTable::Entry> MatchupTable::vsBowlers(const QString & batter) const {

    QVector<Entry> entries;

    for (auto it = _table.constBegin(); it != _table.constEnd(); ++it)
        if (it.key().first == batter)
            entries.push_back(qMakePair(it.key().second, it.value()));

    return entries;
}

QVector<MatchupTable::Entry> MatchupTable::vsBatters(const QString & bowler) const {

    QVector<Entry> entries;

    for (auto it = _table.constBegin(); it != _table.constEnd(); ++it)
        if (it.key().second == bowler)
            entries.push_back(qMakePair(it.key().first, it.value()));

    return entries;
}
