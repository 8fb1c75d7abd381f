/*******************************************************************************
 Copyright 2023 Daniel Neuwirth
 This program is distributed under the terms of the GNU General Public License.
*******************************************************************************/

#include "match/matchrecord.h"
#include "shared/constants.h"

QStringList Wicket::fielderNames() const {

    QStringList names;
    for (const auto & fielder: _fielders)
        names.append(fielder.name());

    return names;
}

uint16_t DeliveryExtras::sum() const {

    uint16_t total = 0;
    for (auto value: _values.values())
        total += value;

    return total;
}

QString DeliveryExtras::typeName(const Type type) {

    switch (type) {

        case Type::WIDES: return QStringLiteral("wides");
        case Type::NOBALLS: return QStringLiteral("no-balls");
        case Type::BYES: return QStringLiteral("byes");
        case Type::LEGBYES: return QStringLiteral("leg-byes");
        case Type::PENALTY: return QStringLiteral("penalty");
    }
    return QString();
}

// keys of "extras" object in source records
QString DeliveryExtras::recordKey(const Type type) {

    switch (type) {

        case Type::WIDES: return QStringLiteral("wides");
        case Type::NOBALLS: return QStringLiteral("noballs");
        case Type::BYES: return QStringLiteral("byes");
        case Type::LEGBYES: return QStringLiteral("legbyes");
        case Type::PENALTY: return QStringLiteral("penalty");
    }
    return QString();
}

QVector<DeliveryExtras::Type> DeliveryExtras::allTypes() {

    return QVector<Type> { Type::WIDES, Type::NOBALLS, Type::BYES, Type::LEGBYES, Type::PENALTY };
}

bool Delivery::isFour() const {

    return (_runs.batter() == boundaryRuns.Four && !_runs.nonBoundary());
}

bool Delivery::isSix() const {

    return (_runs.batter() == boundaryRuns.Six && !_runs.nonBoundary());
}

QString MatchInfo::opponentOf(const QString & team) const {

    if (team == _teams.first)
        return _teams.second;
    if (team == _teams.second)
        return _teams.first;

    return unknownValue.Value;
}

QString MatchInfo::date() const {

    return (_dates.isEmpty()) ? unknownValue.Value : _dates.first();
}
