/*******************************************************************************
 Copyright 2023 Daniel Neuwirth
 This program is distributed under the terms of the GNU General Public License.
*******************************************************************************/

#include <QStringBuilder>
#include <QtDebug>
#include "stats/aggregator.h"

MatchStatistics StatisticsAggregator::aggregate(const MatchRecord & record) const {

    MatchStatistics statistics;

    for (int i = 0; i < record.innings().size(); ++i)
        statistics._innings.push_back(this->processInnings(record.info(), record.innings().at(i), i + 1));

    return statistics;
}

InningsStatistics StatisticsAggregator::processInnings(const MatchInfo & info, const Innings & innings,
                                                       const uint8_t inningsNo) const {

    const QString fieldingTeam = info.opponentOf(innings.team());

    InningsStatistics statistics(inningsNo, innings.team(), fieldingTeam, innings.superOver());
    InningsState state(statistics, info.players(innings.team()), info.players(fieldingTeam));

    const QString inningsPath = QStringLiteral("innings[") % QString::number(inningsNo - 1) % QStringLiteral("]");

    for (int i = 0; i < innings.overs().size(); ++i) {

        const Over & over = innings.overs().at(i);
        const QString overPath = inningsPath % QStringLiteral(".overs[") % QString::number(i) % QStringLiteral("]");

        this->openOver(over, overPath, state);

        for (int j = 0; j < over.deliveries().size(); ++j) {

            state.ballNo = static_cast<uint8_t>(j + 1);
            state.path = overPath % QStringLiteral(".deliveries[") % QString::number(j) % QStringLiteral("]");

            this->processDelivery(over.deliveries().at(j), state);
        }

        // deliveries are grouped per over in the record: end of list = end of over
        this->closeOver(state);
    }

    // partnership still open at the end of innings is closed without a wicket
    if (state.partnershipOpen)
        this->closePartnership(state, 0);

    statistics.finalize(_settings.ballsPerOver());

    qDebug() << "innings" << inningsNo << "|" << innings.team() << statistics.runs() << "/" << statistics.wickets()
             << "|" << statistics.overs().size() << "overs |" << statistics.partnerships().size() << "partnerships |"
             << statistics.warnings().size() << "warnings";

    return statistics;
}

void StatisticsAggregator::openOver(const Over & over, const QString & path, InningsState & state) const {

    const int32_t previousOverNo = state.previousOverNo;

    state.over = OverSummary(over.number(), _settings.phasePolicy().phaseOf(over.number()));
    state.overBowlerBalls.clear();
    state.previousOverNo = over.number();
    state.overPath = path;
    state.ballNo = 0;

    if (previousOverNo >= 0 && over.number() <= previousOverNo)
        this->addWarning(state, MatchWarning::WarningType::DELIVERY_WARNING,
                         QStringLiteral("over index ") % QString::number(over.number()) %
                         QStringLiteral(" does not follow over ") % QString::number(previousOverNo),
                         path % QStringLiteral(".over"));

    return;
}

void StatisticsAggregator::processDelivery(const Delivery & delivery, InningsState & state) const {

    InningsStatistics & innings = state.statistics;

    const bool valid = delivery.isValid();
    const bool dot = delivery.isDotBall();
    const bool four = delivery.isFour();
    const bool six = delivery.isSix();

    this->checkDelivery(delivery, state);

    // 1. over counters
    const bool singleBowler = state.over.singleBowler();
    if (!state.over.assignBowler(delivery.bowler()) && singleBowler)
        this->addWarning(state, MatchWarning::WarningType::DELIVERY_WARNING,
                         QStringLiteral("bowler changed within the over (") % state.over.bowler() %
                         QStringLiteral(" -> ") % delivery.bowler() % QStringLiteral(")"),
                         state.path % QStringLiteral(".bowler"));

    state.over.addDelivery(delivery);
    state.overBowlerBalls[delivery.bowler()] += (valid) ? 1 : 0;

    // 2. partnership opens with the current pair at the current score
    if (!state.partnershipOpen) {

        state.partnership = Partnership(delivery.striker(), delivery.nonStriker(), innings._runs);
        state.partnershipOpen = true;
    }

    // 3. runs and boundaries
    state.partnership.addDelivery(delivery);

    innings._runs += delivery.runs().total();
    innings._extras += delivery.runs().extras();
    ++innings._balls;
    innings._fours += (four) ? 1 : 0;
    innings._sixes += (six) ? 1 : 0;

    for (auto type: DeliveryExtras::allTypes())
        if (delivery.extras().has(type))
            innings._extrasBreakdown[type] += delivery.extras().value(type);

    innings.batterEntry(delivery.striker()).addDelivery(delivery.runs().batter(), valid, dot, four, six);
    innings.batterEntry(delivery.nonStriker());

    BowlerStat & bowler = innings.bowlerEntry(delivery.bowler());
    bowler.addDelivery(delivery.runs().total(), valid, dot, four, six);
    if (delivery.extras().has(DeliveryExtras::Type::WIDES))
        bowler.addWide();
    if (delivery.extras().has(DeliveryExtras::Type::NOBALLS))
        bowler.addNoBall();

    // batter-vs-bowler and bowler-vs-batter share one entry
    MatchupFigures & matchup = innings._matchups.figures(delivery.striker(), delivery.bowler());
    matchup.addRuns(delivery.runs().batter());
    if (four)
        matchup.addFour();
    if (six)
        matchup.addSix();

    // 4. balls faced / bowled
    if (valid) {

        ++innings._validBalls;
        matchup.addBall();
    }
    if (dot)
        matchup.addDot();

    // 5. wickets (partnership closes at most once per delivery)
    if (!delivery.hasWickets())
        return;

    const uint16_t wicketsBefore = innings._wickets;

    for (int i = 0; i < delivery.wickets().size(); ++i)
        this->processWicket(delivery.wickets().at(i), delivery,
                            state.path % QStringLiteral(".wickets[") % QString::number(i) % QStringLiteral("]"), state);

    this->closePartnership(state, (innings._wickets > wicketsBefore) ? static_cast<uint8_t>(innings._wickets) : 0);

    return;
}

void StatisticsAggregator::processWicket(const Wicket & wicket, const Delivery & delivery, const QString & path,
                                         InningsState & state) const {

    InningsStatistics & innings = state.statistics;
    const DismissalRule & rule = wicket.rule();

    if (wicket.kind() == DismissalType::Kind::UNKNOWN)
        this->addWarning(state, MatchWarning::WarningType::DELIVERY_WARNING,
                         QStringLiteral("unknown dismissal kind '") % wicket.kindName() % QStringLiteral("'"),
                         path % QStringLiteral(".kind"));

    this->checkPlayer(wicket.playerOut(), state.battingSquad, innings.battingTeam(),
                      path % QStringLiteral(".player_out"), state);

    if (wicket.playerOut() != delivery.striker() && wicket.playerOut() != delivery.nonStriker())
        this->addWarning(state, MatchWarning::WarningType::DELIVERY_WARNING,
                         wicket.playerOut() % QStringLiteral(" was not at the crease"),
                         path % QStringLiteral(".player_out"));

    BatterStat & batter = innings.batterEntry(wicket.playerOut());
    const QString description = DismissalRules::describe(wicket.kind(), delivery.bowler(), wicket.fielderNames());

    if (rule.wicketFalls()) {

        batter.setOut(description);
        ++innings._wickets;
        state.over.addWicket();
    }
    else
        batter.setRetired(description);

    if (rule.creditedToBowler()) {

        batter.addDismissal();
        innings.bowlerEntry(delivery.bowler()).addWicket();
        innings._matchups.figures(wicket.playerOut(), delivery.bowler()).addDismissal();
        state.partnership.addBowlerWicket(delivery.bowler());
    }

    const QVector<Fielder> fielders = wicket.fielders();

    switch (rule.fieldingCredit()) {

        case DismissalType::FieldingCredit::CATCH_FIRST_FIELDER:
            if (fielders.isEmpty())
                this->addWarning(state, MatchWarning::WarningType::DELIVERY_WARNING,
                                 QStringLiteral("catch without a fielder"), path % QStringLiteral(".fielders"));
            else
                innings.fielderEntry(fielders.first().name())
                    .addContribution(FielderStat::Contribution::CATCH, fielders.first().position());
            break;

        case DismissalType::FieldingCredit::STUMPING_ALL_FIELDERS:
            for (const auto & fielder: fielders)
                innings.fielderEntry(fielder.name()).addContribution(FielderStat::Contribution::STUMPING, fielder.position());
            break;

        case DismissalType::FieldingCredit::RUN_OUT_ALL_FIELDERS:
            for (const auto & fielder: fielders)
                innings.fielderEntry(fielder.name()).addContribution(FielderStat::Contribution::RUN_OUT, fielder.position());
            break;

        case DismissalType::FieldingCredit::NONE: break;
    }

    // substitutes are not part of the playing XI
    for (int i = 0; i < fielders.size(); ++i)
        if (!fielders.at(i).substitute())
            this->checkPlayer(fielders.at(i).name(), state.fieldingSquad, innings.fieldingTeam(),
                              path % QStringLiteral(".fielders[") % QString::number(i) % QStringLiteral("].name"), state);

    return;
}

void StatisticsAggregator::closeOver(InningsState & state) const {

    InningsStatistics & innings = state.statistics;
    OverSummary & over = state.over;
    const uint8_t ballsPerOver = _settings.ballsPerOver();

    state.ballNo = 0;

    if (over.validBalls() > ballsPerOver)
        this->addWarning(state, MatchWarning::WarningType::DELIVERY_WARNING,
                         QString::number(over.validBalls()) % QStringLiteral(" valid balls in the over (") %
                         QString::number(ballsPerOver) % QStringLiteral(" expected)"),
                         state.overPath % QStringLiteral(".deliveries"));

    over.finalize(innings._runs, innings._wickets, innings._validBalls, ballsPerOver);

    for (auto it = state.overBowlerBalls.constBegin(); it != state.overBowlerBalls.constEnd(); ++it)
        innings.bowlerEntry(it.key()).addOverBalls(it.value(), ballsPerOver);

    if (over.maiden() && over.singleBowler())
        innings.bowlerEntry(over.bowler()).addMaiden();

    innings.addOver(over);
    return;
}

void StatisticsAggregator::closePartnership(InningsState & state, const uint8_t wicketNumber) const {

    state.partnership.close(state.statistics._runs, wicketNumber);
    state.statistics.addPartnership(state.partnership);
    state.partnershipOpen = false;

    return;
}

void StatisticsAggregator::checkDelivery(const Delivery & delivery, InningsState & state) const {

    const DeliveryRuns & runs = delivery.runs();

    if (runs.total() != runs.batter() + runs.extras())
        this->addWarning(state, MatchWarning::WarningType::DELIVERY_WARNING,
                         QStringLiteral("total of ") % QString::number(runs.total()) %
                         QStringLiteral(" runs differs from batter + extras (") % QString::number(runs.batter()) %
                         QStringLiteral(" + ") % QString::number(runs.extras()) % QStringLiteral(")"),
                         state.path % QStringLiteral(".runs.total"));

    if (delivery.extras().sum() != runs.extras())
        this->addWarning(state, MatchWarning::WarningType::DELIVERY_WARNING,
                         QStringLiteral("extras detail sums to ") % QString::number(delivery.extras().sum()) %
                         QStringLiteral(", runs.extras is ") % QString::number(runs.extras()),
                         state.path % QStringLiteral(".extras"));

    const QString battingTeam = state.statistics.battingTeam();
    const QString fieldingTeam = state.statistics.fieldingTeam();

    this->checkPlayer(delivery.striker(), state.battingSquad, battingTeam, state.path % QStringLiteral(".batter"), state);
    this->checkPlayer(delivery.nonStriker(), state.battingSquad, battingTeam,
                      state.path % QStringLiteral(".non_striker"), state);
    this->checkPlayer(delivery.bowler(), state.fieldingSquad, fieldingTeam, state.path % QStringLiteral(".bowler"), state);

    return;
}

// statistics of unlisted players still accumulate under the recorded name
void StatisticsAggregator::checkPlayer(const QString & name, const QStringList & squad, const QString & team,
                                       const QString & path, InningsState & state) const {

    if (name == _settings.unknownValue())
        this->addWarning(state, MatchWarning::WarningType::UNKNOWN_PLAYER_REFERENCE,
                         QStringLiteral("player name is missing"), path);
    else if (!squad.isEmpty() && !squad.contains(name))
        this->addWarning(state, MatchWarning::WarningType::UNKNOWN_PLAYER_REFERENCE,
                         name % QStringLiteral(" is not listed among players of ") % team, path);

    return;
}

void StatisticsAggregator::addWarning(InningsState & state, const MatchWarning::WarningType type,
                                      const QString & message, const QString & path) const {

    const MatchWarning warning(type, state.statistics.inningsNo(), static_cast<int16_t>(state.over.number()),
                               state.ballNo, path, message);

    qWarning().noquote() << warning.description();
    state.statistics.addWarning(warning);

    return;
}
