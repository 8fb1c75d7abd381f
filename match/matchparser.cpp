/*******************************************************************************
 Copyright 2023 Daniel Neuwirth
 This program is distributed under the terms of the GNU General Public License.
*******************************************************************************/

#include <QJsonDocument>
#include <QJsonParseError>
#include <QStringBuilder>
#include <cmath>
#include <limits>
#include "match/matchparser.h"
#include "shared/constants.h"
#include "shared/error.h"

MatchRecord MatchParser::parse(const QByteArray & json) const {

    QJsonParseError parseError;
    const QJsonDocument document = QJsonDocument::fromJson(json, &parseError);

    if (parseError.error != QJsonParseError::NoError)
        throw MalformedMatchError(QStringLiteral("<document>"), parseError.errorString() %
                                  QStringLiteral(" at offset ") % QString::number(parseError.offset));
    if (!document.isObject())
        throw MalformedMatchError(QStringLiteral("<document>"), QStringLiteral("match record is not an object"));

    return this->parse(document.object());
}

MatchRecord MatchParser::parse(const QJsonObject & root) const {

    MatchRecord record;
    record._info = this->parseInfo(root.value(QStringLiteral("info")), QStringLiteral("info"));

    // without ball-level data no statistics can be produced => innings array is mandatory
    const QJsonArray innings = this->requireArray(root, QStringLiteral("innings"), QString());

    for (int i = 0; i < innings.size(); ++i)
        record._innings.push_back(this->parseInnings(innings.at(i), indexPath(QStringLiteral("innings"), i), record._info));

    return record;
}

MatchInfo MatchParser::parseInfo(const QJsonValue & value, const QString & path) const {

    MatchInfo info;
    info._teams = qMakePair(unknownValue.Value, unknownValue.Value);

    if (value.isUndefined() || value.isNull()) {

        info._venue = info._city = info._eventName = unknownValue.Value;
        info._matchType = info._gender = info._season = unknownValue.Value;
        return info;
    }

    const QJsonObject object = this->requireObject(value, path);

    const QStringList teams = this->readStringList(object, QStringLiteral("teams"), path);
    if (!teams.isEmpty()) {

        if (teams.size() != 2)
            throw MalformedMatchError(fieldPath(path, QStringLiteral("teams")),
                                      QStringLiteral("expected two team names, found ") % QString::number(teams.size()));
        info._teams = qMakePair(teams.at(0), teams.at(1));
    }

    info._dates = this->readStringList(object, QStringLiteral("dates"), path);
    info._venue = this->readString(object, QStringLiteral("venue"), path);
    info._city = this->readString(object, QStringLiteral("city"), path);
    info._matchType = this->readString(object, QStringLiteral("match_type"), path);
    info._gender = this->readString(object, QStringLiteral("gender"), path);
    info._season = this->readString(object, QStringLiteral("season"), path);
    info._oversLimit = this->readNumber(object, QStringLiteral("overs"), path);
    info._playerOfMatch = this->readStringList(object, QStringLiteral("player_of_match"), path);

    const QString eventPath = fieldPath(path, QStringLiteral("event"));
    const QJsonObject event = this->optionalObject(object, QStringLiteral("event"), path);
    info._eventName = this->readString(event, QStringLiteral("name"), eventPath);
    info._eventMatchNumber = this->readNumber(event, QStringLiteral("match_number"), eventPath);

    if (object.contains(QStringLiteral("toss"))) {

        const QString tossPath = fieldPath(path, QStringLiteral("toss"));
        const QJsonObject toss = this->requireObject(object.value(QStringLiteral("toss")), tossPath);
        info._hasToss = true;
        info._toss._winner = this->readString(toss, QStringLiteral("winner"), tossPath);
        info._toss._decision = this->readString(toss, QStringLiteral("decision"), tossPath);
    }

    if (object.contains(QStringLiteral("outcome"))) {

        const QString outcomePath = fieldPath(path, QStringLiteral("outcome"));
        info._hasOutcome = true;
        this->parseOutcome(this->requireObject(object.value(QStringLiteral("outcome")), outcomePath),
                           outcomePath, info._outcome);
    }

    const QString playersPath = fieldPath(path, QStringLiteral("players"));
    const QJsonObject players = this->optionalObject(object, QStringLiteral("players"), path);
    for (auto it = players.constBegin(); it != players.constEnd(); ++it)
        info._players.insert(it.key(), this->readStringList(players, it.key(), playersPath));

    const QString officialsPath = fieldPath(path, QStringLiteral("officials"));
    this->parseOfficials(this->optionalObject(object, QStringLiteral("officials"), path), officialsPath, info._officials);

    return info;
}

void MatchParser::parseOutcome(const QJsonObject & object, const QString & path, Outcome & outcome) const {

    // winner/result fields are optional here; empty text means "not recorded"
    if (object.contains(QStringLiteral("winner")))
        outcome._winner = this->readString(object, QStringLiteral("winner"), path);
    if (object.contains(QStringLiteral("result")))
        outcome._result = this->readString(object, QStringLiteral("result"), path);
    if (object.contains(QStringLiteral("method")))
        outcome._method = this->readString(object, QStringLiteral("method"), path);
    if (object.contains(QStringLiteral("eliminator")))
        outcome._eliminator = this->readString(object, QStringLiteral("eliminator"), path);

    const QString byPath = fieldPath(path, QStringLiteral("by"));
    const QJsonObject by = this->optionalObject(object, QStringLiteral("by"), path);
    for (auto it = by.constBegin(); it != by.constEnd(); ++it)
        outcome._margins.push_back(qMakePair(it.key(), this->toNumber(it.value(), fieldPath(byPath, it.key()))));

    return;
}

void MatchParser::parseOfficials(const QJsonObject & object, const QString & path, Officials & officials) const {

    officials._umpires = this->readStringList(object, QStringLiteral("umpires"), path);
    officials._tvUmpires = this->readStringList(object, QStringLiteral("tv_umpires"), path);
    officials._reserveUmpires = this->readStringList(object, QStringLiteral("reserve_umpires"), path);
    officials._matchReferees = this->readStringList(object, QStringLiteral("match_referees"), path);

    return;
}

Innings MatchParser::parseInnings(const QJsonValue & value, const QString & path, const MatchInfo & info) const {

    const QJsonObject object = this->requireObject(value, path);

    Innings innings;
    innings._team = this->readString(object, QStringLiteral("team"), path);

    const bool teamsKnown = !info.teamList().contains(unknownValue.Value);
    if (teamsKnown && innings._team != unknownValue.Value && !info.teamList().contains(innings._team))
        throw MalformedMatchError(fieldPath(path, QStringLiteral("team")),
                                  QStringLiteral("team '") % innings._team % QStringLiteral("' is not one of the match teams"));

    innings._superOver = this->readFlag(object, QStringLiteral("super_over"), path);

    const QString targetPath = fieldPath(path, QStringLiteral("target"));
    const QJsonObject target = this->optionalObject(object, QStringLiteral("target"), path);
    innings._targetRuns = this->readNumber(target, QStringLiteral("runs"), targetPath);
    innings._targetOvers = this->readDecimal(target, QStringLiteral("overs"), targetPath);

    const QJsonArray overs = this->requireArray(object, QStringLiteral("overs"), path);
    for (int i = 0; i < overs.size(); ++i)
        innings._overs.push_back(this->parseOver(overs.at(i), indexPath(fieldPath(path, QStringLiteral("overs")), i)));

    return innings;
}

Over MatchParser::parseOver(const QJsonValue & value, const QString & path) const {

    const QJsonObject object = this->requireObject(value, path);
    const QString numberPath = fieldPath(path, QStringLiteral("over"));

    if (!object.contains(QStringLiteral("over")))
        throw MalformedMatchError(numberPath, QStringLiteral("over index is missing"));

    Over over;
    over._number = this->toNumber(object.value(QStringLiteral("over")), numberPath);

    const QJsonArray deliveries = this->requireArray(object, QStringLiteral("deliveries"), path);
    for (int i = 0; i < deliveries.size(); ++i)
        over._deliveries.push_back(
            this->parseDelivery(deliveries.at(i), indexPath(fieldPath(path, QStringLiteral("deliveries")), i)));

    return over;
}

Delivery MatchParser::parseDelivery(const QJsonValue & value, const QString & path) const {

    const QJsonObject object = this->requireObject(value, path);

    Delivery delivery;
    delivery._striker = this->readString(object, QStringLiteral("batter"), path);
    delivery._nonStriker = this->readString(object, QStringLiteral("non_striker"), path);
    delivery._bowler = this->readString(object, QStringLiteral("bowler"), path);

    const QString runsPath = fieldPath(path, QStringLiteral("runs"));
    const QJsonObject runs = this->optionalObject(object, QStringLiteral("runs"), path);
    delivery._runs._batter = this->readNumber(runs, QStringLiteral("batter"), runsPath);
    delivery._runs._extras = this->readNumber(runs, QStringLiteral("extras"), runsPath);
    delivery._runs._total = this->readNumber(runs, QStringLiteral("total"), runsPath);
    delivery._runs._nonBoundary = this->readFlag(runs, QStringLiteral("non_boundary"), runsPath);

    // presence of a key (not its value) determines the type of extra
    const QString extrasPath = fieldPath(path, QStringLiteral("extras"));
    const QJsonObject extras = this->optionalObject(object, QStringLiteral("extras"), path);
    for (auto type: DeliveryExtras::allTypes()) {

        const QString key = DeliveryExtras::recordKey(type);
        if (extras.contains(key))
            delivery._extras._values.insert(type, this->toNumber(extras.value(key), fieldPath(extrasPath, key)));
    }

    const QJsonArray wickets = this->optionalArray(object, QStringLiteral("wickets"), path);
    for (int i = 0; i < wickets.size(); ++i)
        delivery._wickets.push_back(
            this->parseWicket(wickets.at(i), indexPath(fieldPath(path, QStringLiteral("wickets")), i)));

    return delivery;
}

Wicket MatchParser::parseWicket(const QJsonValue & value, const QString & path) const {

    const QJsonObject object = this->requireObject(value, path);

    Wicket wicket;
    wicket._playerOut = this->readString(object, QStringLiteral("player_out"), path);
    wicket._kindName = this->readString(object, QStringLiteral("kind"), path);
    wicket._kind = DismissalRules::kindFromName(wicket._kindName);

    const QJsonArray fielders = this->optionalArray(object, QStringLiteral("fielders"), path);
    for (int i = 0; i < fielders.size(); ++i)
        wicket._fielders.push_back(
            this->parseFielder(fielders.at(i), indexPath(fieldPath(path, QStringLiteral("fielders")), i)));

    return wicket;
}

Fielder MatchParser::parseFielder(const QJsonValue & value, const QString & path) const {

    const QJsonObject object = this->requireObject(value, path);

    Fielder fielder;
    fielder._name = this->readString(object, QStringLiteral("name"), path);
    fielder._position = this->readString(object, QStringLiteral("position"), path);
    fielder._substitute = this->readFlag(object, QStringLiteral("substitute"), path);

    return fielder;
}

QJsonObject MatchParser::requireObject(const QJsonValue & value, const QString & path) const {

    if (!value.isObject())
        throw MalformedMatchError(path, (value.isUndefined()) ? QStringLiteral("object is missing")
                                                              : QStringLiteral("object expected"));
    return value.toObject();
}

QJsonArray MatchParser::requireArray(const QJsonObject & object, const QString & key, const QString & path) const {

    const QJsonValue value = object.value(key);

    if (value.isUndefined() || value.isNull())
        throw MalformedMatchError(fieldPath(path, key), QStringLiteral("array is missing"));
    if (!value.isArray())
        throw MalformedMatchError(fieldPath(path, key), QStringLiteral("array expected"));

    return value.toArray();
}

QJsonObject MatchParser::optionalObject(const QJsonObject & object, const QString & key, const QString & path) const {

    const QJsonValue value = object.value(key);

    if (value.isUndefined() || value.isNull())
        return QJsonObject();

    return this->requireObject(value, fieldPath(path, key));
}

QJsonArray MatchParser::optionalArray(const QJsonObject & object, const QString & key, const QString & path) const {

    const QJsonValue value = object.value(key);

    if (value.isUndefined() || value.isNull())
        return QJsonArray();

    return this->requireArray(object, key, path);
}

QString MatchParser::readString(const QJsonObject & object, const QString & key, const QString & path) const {

    const QJsonValue value = object.value(key);

    if (value.isString() && !value.toString().trimmed().isEmpty())
        return value.toString().trimmed();
    // e.g. season given as 2019 instead of "2019"
    if (value.isDouble())
        return QString::number(value.toDouble());
    if (value.isArray() || value.isObject() || value.isBool())
        throw MalformedMatchError(fieldPath(path, key), QStringLiteral("text expected"));

    return unknownValue.Value;
}

QStringList MatchParser::readStringList(const QJsonObject & object, const QString & key, const QString & path) const {

    const QJsonValue value = object.value(key);
    QStringList list;

    if (value.isUndefined() || value.isNull())
        return list;
    if (value.isString())
        return QStringList { value.toString() };
    if (!value.isArray())
        throw MalformedMatchError(fieldPath(path, key), QStringLiteral("list of names expected"));

    const QJsonArray array = value.toArray();
    for (int i = 0; i < array.size(); ++i) {

        if (!array.at(i).isString())
            throw MalformedMatchError(indexPath(fieldPath(path, key), i), QStringLiteral("text expected"));
        list.append(array.at(i).toString());
    }

    return list;
}

uint16_t MatchParser::readNumber(const QJsonObject & object, const QString & key, const QString & path,
                                 const uint16_t defaultValue) const {

    const QJsonValue value = object.value(key);

    if (value.isUndefined() || value.isNull())
        return defaultValue;

    return this->toNumber(value, fieldPath(path, key));
}

uint16_t MatchParser::toNumber(const QJsonValue & value, const QString & path) const {

    if (!value.isDouble())
        throw MalformedMatchError(path, QStringLiteral("number expected"));

    const double number = value.toDouble();
    if (number < 0 || std::floor(number) != number || number > std::numeric_limits<uint16_t>::max())
        throw MalformedMatchError(path, QStringLiteral("non-negative whole number expected, found ") %
                                  QString::number(number));

    return static_cast<uint16_t>(number);
}

double MatchParser::readDecimal(const QJsonObject & object, const QString & key, const QString & path) const {

    const QJsonValue value = object.value(key);

    if (value.isUndefined() || value.isNull())
        return 0;
    if (!value.isDouble() || value.toDouble() < 0)
        throw MalformedMatchError(fieldPath(path, key), QStringLiteral("non-negative number expected"));

    return value.toDouble();
}

bool MatchParser::readFlag(const QJsonObject & object, const QString & key, const QString & path) const {

    const QJsonValue value = object.value(key);

    if (value.isUndefined() || value.isNull())
        return false;
    if (!value.isBool())
        throw MalformedMatchError(fieldPath(path, key), QStringLiteral("true/false expected"));

    return value.toBool();
}

QString MatchParser::fieldPath(const QString & parent, const QString & key) {

    return (parent.isEmpty()) ? key : (parent + QChar('.') + key);
}

QString MatchParser::indexPath(const QString & parent, const int index) {

    return (parent + QChar('[') + QString::number(index) + QChar(']'));
}
