/*******************************************************************************
 Copyright 2023 Daniel Neuwirth
 This program is distributed under the terms of the GNU General Public License.
*******************************************************************************/

#include "match/matchparser.h"
#include "settings/settings.h"
#include "shared/constants.h"
#include "stats/aggregator.h"
#include "testsupport.h"

namespace {

    const QString home = QStringLiteral("Kolkata");
    const QString away = QStringLiteral("Chennai");

    QJsonObject squadInfo() {

        QJsonObject info = infoJson(home, away);
        info.insert(QStringLiteral("players"), QJsonObject {
            { home, QJsonArray { QStringLiteral("A"), QStringLiteral("B"), QStringLiteral("C"), QStringLiteral("D") } },
            { away, QJsonArray { QStringLiteral("X"), QStringLiteral("Y"), QStringLiteral("F"), QStringLiteral("G") } } });

        return info;
    }

    QJsonObject ball(const QString & batter, const QString & nonStriker, const QString & bowler, const int runs) {

        return deliveryJson(batter, nonStriker, bowler, runs);
    }

    QJsonObject dot(const QString & batter, const QString & nonStriker, const QString & bowler) {

        return deliveryJson(batter, nonStriker, bowler, 0);
    }

    MatchStatistics aggregateOvers(const QJsonArray & overs, const Settings & settings = Settings()) {

        const MatchRecord record = MatchParser().parse(matchJson(squadInfo(), QJsonArray { inningsJson(home, overs) }));
        return StatisticsAggregator(settings).aggregate(record);
    }

    // 4, dot, caught (dot), 6, dot, dot: 6 valid balls, 10 runs
    void test_single_over_scenario() {

        const QJsonArray deliveries {
            ball(QStringLiteral("A"), QStringLiteral("B"), QStringLiteral("X"), 4),
            dot(QStringLiteral("A"), QStringLiteral("B"), QStringLiteral("X")),
            withWicket(dot(QStringLiteral("A"), QStringLiteral("B"), QStringLiteral("X")),
                       wicketJson(QStringLiteral("A"), QStringLiteral("caught"),
                                  QJsonArray { fielderJson(QStringLiteral("F"), QStringLiteral("long on")) })),
            ball(QStringLiteral("C"), QStringLiteral("B"), QStringLiteral("X"), 6),
            dot(QStringLiteral("C"), QStringLiteral("B"), QStringLiteral("X")),
            dot(QStringLiteral("C"), QStringLiteral("B"), QStringLiteral("X"))
        };

        const MatchStatistics statistics = aggregateOvers(QJsonArray { overJson(0, deliveries) });
        const InningsStatistics & innings = statistics.innings().first();

        check(innings.overs().size() == 1, "one over summary expected");
        const OverSummary & over = innings.overs().first();
        check(over.runs() == 10, "over should concede 10 runs");
        check(over.wickets() == 1, "over should contain 1 wicket");
        check(over.fours() == 1 && over.sixes() == 1, "over should contain one four and one six");
        check(over.dots() == 4, "wicket ball counts as a dot ball");
        check(over.validBalls() == 6 && over.balls() == 6, "six valid balls expected");
        check(!over.maiden(), "over with runs is not a maiden");
        check(over.cumulativeRuns() == 10 && over.cumulativeWickets() == 1, "cumulative score after the over");
        check(nearlyEqual(over.runRate(), 10.0), "this-over run rate");

        check(innings.fielder(QStringLiteral("F")).catches() == 1, "F should be credited with the catch");
        check(innings.fielder(QStringLiteral("F")).byPosition(FielderStat::Contribution::CATCH)
                  .value(QStringLiteral("long on")) == 1, "catch should be recorded by position");

        check(innings.partnerships().size() == 2, "partnership list should have exactly two entries");
        const Partnership & opening = innings.partnerships().at(0);
        check(opening.batters().first == QStringLiteral("A") && opening.batters().second == QStringLiteral("B"),
              "opening partnership is A & B");
        check(opening.runs() == 4 && opening.balls() == 3 && opening.wicketNumber() == 1, "opening partnership figures");
        const Partnership & second = innings.partnerships().at(1);
        check(second.startScore() == 4 && second.endScore() == 10 && !second.endedByWicket(),
              "second partnership closes implicitly at the end of innings");
        check(second.batterRuns(QStringLiteral("C")) == 6, "C scored all runs of the second partnership");

        const BowlerStat bowler = innings.bowler(QStringLiteral("X"));
        check(bowler.wickets() == 1 && bowler.runs() == 10 && bowler.balls() == 6, "bowler figures");
        check(bowler.completedOvers() == 1 && nearlyEqual(bowler.oversBowled(6), 1.0), "one completed over");
        check(nearlyEqual(bowler.economy(), 10.0), "economy is runs per over");

        const BatterStat batter = innings.batter(QStringLiteral("A"));
        check(batter.runs() == 4 && batter.balls() == 3 && batter.isOut(), "A scored 4 off 3 balls and is out");
        check(batter.howOut() == QStringLiteral("c F b X"), "dismissal description");
        check(nearlyEqual(batter.strikeRate(), 400.0 / 3.0), "strike rate is runs*100/balls");
        check(innings.matchups().figures(QStringLiteral("A"), QStringLiteral("X")).dismissals() == 1,
              "dismissal should be recorded against the bowler");

        check(innings.runs() == 10 && innings.wickets() == 1, "innings total 10/1");
        check(statistics.warnings().isEmpty(), "consistent record should produce no warnings");
    }

    void test_conservation_and_valid_balls() {

        const QJsonArray first {
            ball(QStringLiteral("A"), QStringLiteral("B"), QStringLiteral("X"), 1),
            ball(QStringLiteral("B"), QStringLiteral("A"), QStringLiteral("X"), 4),
            deliveryJson(QStringLiteral("B"), QStringLiteral("A"), QStringLiteral("X"), 0, 1, QStringLiteral("wides")),
            deliveryJson(QStringLiteral("B"), QStringLiteral("A"), QStringLiteral("X"), 0, 1, QStringLiteral("noballs")),
            dot(QStringLiteral("B"), QStringLiteral("A"), QStringLiteral("X")),
            ball(QStringLiteral("B"), QStringLiteral("A"), QStringLiteral("X"), 2),
            deliveryJson(QStringLiteral("B"), QStringLiteral("A"), QStringLiteral("X"), 0, 4, QStringLiteral("legbyes")),
            ball(QStringLiteral("A"), QStringLiteral("B"), QStringLiteral("X"), 6)
        };
        const QJsonArray second {
            ball(QStringLiteral("B"), QStringLiteral("A"), QStringLiteral("Y"), 3),
            dot(QStringLiteral("A"), QStringLiteral("B"), QStringLiteral("Y")),
            dot(QStringLiteral("A"), QStringLiteral("B"), QStringLiteral("Y")),
            ball(QStringLiteral("A"), QStringLiteral("B"), QStringLiteral("Y"), 1),
            dot(QStringLiteral("B"), QStringLiteral("A"), QStringLiteral("Y"))
        };

        // no-ball hit for four: runs go to the batter, ball is not counted
        QJsonObject noBallFour = deliveryJson(QStringLiteral("B"), QStringLiteral("A"), QStringLiteral("Y"), 4, 1,
                                              QStringLiteral("noballs"));
        QJsonArray secondWithNoBall = second;
        secondWithNoBall.insert(1, noBallFour);

        const MatchStatistics statistics = aggregateOvers(QJsonArray { overJson(0, first), overJson(1, secondWithNoBall) });
        const InningsStatistics & innings = statistics.innings().first();

        uint16_t validBalls = 0;
        for (const auto & over: innings.overs())
            validBalls += over.validBalls();
        check(validBalls == 6 + 5, "valid balls of over summaries should equal non-wide/non-no-ball deliveries");
        check(innings.validBalls() == validBalls, "innings valid balls should match over summaries");

        for (const auto & batter: innings.batters()) {

            uint16_t runs = 0;
            uint16_t balls = 0;

            for (const auto & entry: innings.matchups().vsBowlers(batter.name())) {

                runs += entry.second.runs();
                balls += entry.second.balls();
            }

            check(runs == batter.runs(), "batter runs should equal the sum of runs against all bowlers");
            check(balls == batter.balls(), "balls faced should equal the sum of balls against all bowlers");
        }

        check(innings.batter(QStringLiteral("B")).runs() == 4 + 2 + 3 + 4, "no-ball hit should be credited to the batter");
        check(innings.batter(QStringLiteral("B")).fours() == 2, "four off a no-ball is a boundary");

        // bowler-vs-batter view mirrors batter-vs-bowler entries
        for (const auto & entry: innings.matchups().vsBatters(QStringLiteral("Y")))
            check(entry.second.runs() == innings.matchups().figures(entry.first, QStringLiteral("Y")).runs(),
                  "bowler-vs-batter view should mirror batter-vs-bowler");

        check(innings.extras(DeliveryExtras::Type::LEGBYES) == 4, "leg-byes breakdown");
        check(innings.extras(DeliveryExtras::Type::NOBALLS) == 2, "no-balls breakdown");
        check(innings.extrasTotal() == 1 + 1 + 4 + 1, "extras total");

        const BowlerStat x = innings.bowler(QStringLiteral("X"));
        check(x.wides() == 1 && x.noBalls() == 1, "wides and no-balls should be counted for the bowler");
        check(x.runs() == 1 + 4 + 1 + 1 + 2 + 4 + 6, "bowler concedes total runs of the deliveries");

        // Y bowled five valid balls only
        const BowlerStat y = innings.bowler(QStringLiteral("Y"));
        check(y.completedOvers() == 0 && y.incompleteOverBalls() == 5, "incomplete over");
        check(nearlyEqual(y.oversBowled(6), 5.0 / 6.0), "overs bowled should be fractional and unrounded");
        check(nearlyEqual(y.economy(), y.runs() / (5.0 / 6.0)), "economy should be runs/overs");
    }

    void test_maiden_flag() {

        QJsonArray maiden;
        for (int i = 0; i < 6; ++i)
            maiden.append(dot(QStringLiteral("A"), QStringLiteral("B"), QStringLiteral("X")));

        QJsonArray withWide = maiden;
        withWide.append(deliveryJson(QStringLiteral("A"), QStringLiteral("B"), QStringLiteral("Y"), 0, 1,
                                     QStringLiteral("wides")));

        QJsonArray shortOver;
        for (int i = 0; i < 5; ++i)
            shortOver.append(dot(QStringLiteral("B"), QStringLiteral("A"), QStringLiteral("X")));

        // wicket balls do not spoil a maiden
        QJsonArray wicketMaiden = maiden;
        wicketMaiden.replace(5, withWicket(dot(QStringLiteral("A"), QStringLiteral("B"), QStringLiteral("Y")),
                                           wicketJson(QStringLiteral("A"), QStringLiteral("bowled"))));
        for (int i = 0; i < wicketMaiden.size(); ++i) {

            QJsonObject delivery = wicketMaiden.at(i).toObject();
            delivery.insert(QStringLiteral("bowler"), QStringLiteral("Y"));
            wicketMaiden.replace(i, delivery);
        }

        const MatchStatistics statistics = aggregateOvers(QJsonArray {
            overJson(0, maiden), overJson(1, withWide), overJson(2, wicketMaiden), overJson(3, shortOver) });
        const InningsStatistics & innings = statistics.innings().first();

        check(innings.overs().at(0).maiden(), "six dot balls make a maiden");
        check(!innings.overs().at(1).maiden(), "a wide spoils the maiden");
        check(innings.overs().at(2).maiden(), "a wicket maiden is a maiden");
        check(!innings.overs().at(3).maiden(), "five balls are not a maiden");

        for (const auto & over: innings.overs())
            check(over.maiden() == (over.runs() == 0 && over.validBalls() == 6), "maiden iff no runs off six valid balls");

        check(innings.bowler(QStringLiteral("X")).maidens() == 1, "X bowled one maiden");
        check(innings.bowler(QStringLiteral("Y")).maidens() == 1, "Y bowled one maiden");
        check(innings.bowler(QStringLiteral("Y")).wickets() == 1, "bowled counts for the bowler");

        // over 1 was started by X and finished by Y
        bool bowlerChangeWarning = false;
        for (const auto & warning: statistics.warnings())
            if (warning.type() == MatchWarning::WarningType::DELIVERY_WARNING && warning.overNo() == 1)
                bowlerChangeWarning = true;
        check(bowlerChangeWarning, "bowler change within an over should be reported");
    }

    void test_partnership_count() {

        const QJsonArray deliveries {
            ball(QStringLiteral("A"), QStringLiteral("B"), QStringLiteral("X"), 1),
            withWicket(dot(QStringLiteral("B"), QStringLiteral("A"), QStringLiteral("X")),
                       wicketJson(QStringLiteral("B"), QStringLiteral("lbw"))),
            ball(QStringLiteral("C"), QStringLiteral("A"), QStringLiteral("X"), 2),
            withWicket(dot(QStringLiteral("C"), QStringLiteral("A"), QStringLiteral("X")),
                       wicketJson(QStringLiteral("C"), QStringLiteral("stumped"), QJsonArray { fielderJson(QStringLiteral("G")) })),
            ball(QStringLiteral("D"), QStringLiteral("A"), QStringLiteral("X"), 1),
            dot(QStringLiteral("A"), QStringLiteral("D"), QStringLiteral("X"))
        };

        const MatchStatistics statistics = aggregateOvers(QJsonArray { overJson(0, deliveries) });
        const InningsStatistics & innings = statistics.innings().first();

        check(innings.wickets() == 2, "two wickets fell");
        check(innings.partnerships().size() == innings.wickets() + 1, "partnerships = wickets + 1");
        check(innings.partnerships().at(1).wicketNumber() == 2, "second partnership ended by the second wicket");
        check(innings.fielder(QStringLiteral("G")).stumpings() == 1, "stumping credited to the keeper");

        uint16_t runs = 0;
        for (const auto & partnership: innings.partnerships())
            runs += partnership.runs();
        check(runs == innings.runs(), "partnership runs should add up to the innings total");
    }

    void test_fielding_credit_rules() {

        const QJsonArray deliveries {
            withWicket(ball(QStringLiteral("A"), QStringLiteral("B"), QStringLiteral("X"), 1),
                       wicketJson(QStringLiteral("B"), QStringLiteral("run out"),
                                  QJsonArray { fielderJson(QStringLiteral("F"), QStringLiteral("cover")),
                                               fielderJson(QStringLiteral("G"), QStringLiteral("wicketkeeper")) })),
            withWicket(dot(QStringLiteral("A"), QStringLiteral("C"), QStringLiteral("X")),
                       wicketJson(QStringLiteral("A"), QStringLiteral("caught"),
                                  QJsonArray { fielderJson(QStringLiteral("F"), QStringLiteral("slip")),
                                               fielderJson(QStringLiteral("G"), QStringLiteral("gully")) })),
            withWicket(dot(QStringLiteral("C"), QStringLiteral("D"), QStringLiteral("X")),
                       wicketJson(QStringLiteral("C"), QStringLiteral("retired hurt")))
        };

        const MatchStatistics statistics = aggregateOvers(QJsonArray { overJson(0, deliveries) });
        const InningsStatistics & innings = statistics.innings().first();

        check(innings.fielder(QStringLiteral("F")).runOuts() == 1, "run out credits the first fielder");
        check(innings.fielder(QStringLiteral("G")).runOuts() == 1, "run out credits every listed fielder");
        check(innings.fielder(QStringLiteral("F")).catches() == 1, "catch credits the first fielder");
        check(innings.fielder(QStringLiteral("G")).catches() == 0, "catch does not credit other fielders");

        const BowlerStat bowler = innings.bowler(QStringLiteral("X"));
        check(bowler.wickets() == 1, "only the catch counts for the bowler");
        check(innings.batter(QStringLiteral("B")).dismissals() == 0, "run out is not a dismissal by the bowler");
        check(innings.batter(QStringLiteral("B")).isOut(), "run out batter is out");

        check(innings.wickets() == 2, "retired hurt is not a fallen wicket");
        check(!innings.batter(QStringLiteral("C")).isOut(), "retired hurt batter is not out");
        check(innings.partnerships().size() == 3, "every delivery with a wicket entry closes the partnership");
        check(!innings.partnerships().at(2).endedByWicket(), "retirement does not end a partnership by a wicket");
        check(nearlyEqual(innings.wicketShare(QStringLiteral("X")), 100.0), "X took all bowler-credited wickets");
    }

    void test_warnings_do_not_abort() {

        QJsonObject inconsistent = ball(QStringLiteral("A"), QStringLiteral("B"), QStringLiteral("X"), 2);
        QJsonObject runs = inconsistent.value(QStringLiteral("runs")).toObject();
        runs.insert(QStringLiteral("total"), 5);
        inconsistent.insert(QStringLiteral("runs"), runs);

        QJsonObject noBowler = ball(QStringLiteral("B"), QStringLiteral("A"), QStringLiteral("X"), 1);
        noBowler.remove(QStringLiteral("bowler"));

        const QJsonArray deliveries {
            ball(QStringLiteral("Z"), QStringLiteral("A"), QStringLiteral("X"), 1),
            inconsistent,
            noBowler,
            withWicket(dot(QStringLiteral("A"), QStringLiteral("B"), QStringLiteral("X")),
                       wicketJson(QStringLiteral("A"), QStringLiteral("caught"))),
            ball(QStringLiteral("B"), QStringLiteral("C"), QStringLiteral("X"), 4)
        };

        // over indices out of order
        const MatchStatistics statistics = aggregateOvers(QJsonArray {
            overJson(3, deliveries), overJson(2, QJsonArray { dot(QStringLiteral("C"), QStringLiteral("B"), QStringLiteral("Y")) }) });
        const InningsStatistics & innings = statistics.innings().first();

        int unknownPlayers = 0;
        int deliveryWarnings = 0;
        for (const auto & warning: innings.warnings()) {

            if (warning.type() == MatchWarning::WarningType::UNKNOWN_PLAYER_REFERENCE)
                ++unknownPlayers;
            else
                ++deliveryWarnings;
        }

        check(unknownPlayers == 2, "unlisted batter and missing bowler should be reported");
        // inconsistent total, bowler change, catch without fielder, over order
        check(deliveryWarnings == 4, "delivery anomalies should be reported");
        check(innings.warnings().at(0).fieldPath() == QStringLiteral("innings[0].overs[0].deliveries[0].batter"),
              "warning should carry the field path");
        check(innings.warnings().at(0).overNo() == 3 && innings.warnings().at(0).ballNo() == 1,
              "warning should carry over and ball");

        check(innings.batter(QStringLiteral("Z")).runs() == 1, "unlisted batter still accumulates statistics");
        check(innings.bowler(unknownValue.Value).runs() == 1, "missing bowler goes to the Unknown bucket");
        check(innings.batter(QStringLiteral("B")).runs() == 1 + 4, "processing continues after warnings");
        check(innings.overs().size() == 2, "all overs processed");
        check(statistics.warnings().size() == innings.warnings().size(), "match warnings list all innings warnings");

        // extras detail off, dismissed player away from the crease, seven valid balls in one over
        QJsonObject legByes = deliveryJson(QStringLiteral("A"), QStringLiteral("B"), QStringLiteral("X"), 0, 1,
                                           QStringLiteral("legbyes"));
        legByes.insert(QStringLiteral("extras"), QJsonObject { { QStringLiteral("legbyes"), 2 } });

        QJsonArray longOver {
            legByes,
            withWicket(dot(QStringLiteral("A"), QStringLiteral("B"), QStringLiteral("X")),
                       wicketJson(QStringLiteral("C"), QStringLiteral("bowled")))
        };
        for (int i = 0; i < 4; ++i)
            longOver.append(dot(QStringLiteral("A"), QStringLiteral("B"), QStringLiteral("X")));
        longOver.append(ball(QStringLiteral("A"), QStringLiteral("B"), QStringLiteral("X"), 2));

        const MatchStatistics anomalies = aggregateOvers(QJsonArray { overJson(0, longOver) });
        const InningsStatistics & anomalous = anomalies.innings().first();

        check(anomalous.warnings().size() == 3, "three delivery anomalies expected");
        for (const auto & warning: anomalous.warnings())
            check(warning.type() == MatchWarning::WarningType::DELIVERY_WARNING, "anomalies are delivery warnings");

        check(anomalous.warnings().at(0).fieldPath() == QStringLiteral("innings[0].overs[0].deliveries[0].extras"),
              "extras detail mismatch should point at the extras");
        check(anomalous.warnings().at(1).fieldPath() ==
              QStringLiteral("innings[0].overs[0].deliveries[1].wickets[0].player_out"),
              "dismissal of a player away from the crease should point at player_out");
        check(anomalous.warnings().at(1).ballNo() == 2, "crease warning carries the ball number");
        check(anomalous.warnings().at(2).fieldPath() == QStringLiteral("innings[0].overs[0].deliveries"),
              "over with too many valid balls should point at its deliveries");

        check(anomalous.batter(QStringLiteral("C")).isOut(), "dismissal is still recorded");
        check(anomalous.batter(QStringLiteral("A")).runs() == 2 && anomalous.batter(QStringLiteral("A")).balls() == 7,
              "deliveries after the anomalies are processed");
        check(anomalous.validBalls() == 7 && anomalous.overs().first().validBalls() == 7, "all valid balls counted");
        check(anomalous.extras(DeliveryExtras::Type::LEGBYES) == 2 && anomalous.extrasTotal() == 1,
              "extras breakdown and runs.extras are kept as recorded");
    }

    void test_unrecognized_and_not_out_dismissals() {

        const QJsonArray deliveries {
            withWicket(dot(QStringLiteral("A"), QStringLiteral("B"), QStringLiteral("X")),
                       wicketJson(QStringLiteral("A"), QStringLiteral("hit the ball"))),
            withWicket(dot(QStringLiteral("C"), QStringLiteral("B"), QStringLiteral("X")),
                       wicketJson(QStringLiteral("C"), QStringLiteral("retired not out"))),
            ball(QStringLiteral("D"), QStringLiteral("B"), QStringLiteral("X"), 1)
        };

        const MatchStatistics statistics = aggregateOvers(QJsonArray { overJson(0, deliveries) });
        const InningsStatistics & innings = statistics.innings().first();

        check(innings.bowler(QStringLiteral("X")).wickets() == 1, "unrecognized kind counts as the bowler's wicket");
        check(innings.batter(QStringLiteral("A")).isOut() && innings.batter(QStringLiteral("A")).dismissals() == 1,
              "batter dismissed by an unrecognized kind is out");
        check(innings.matchups().figures(QStringLiteral("A"), QStringLiteral("X")).dismissals() == 1,
              "unrecognized kind is recorded against the bowler");

        check(!innings.batter(QStringLiteral("C")).isOut(), "retired not out batter is not out");
        check(innings.batter(QStringLiteral("C")).howOut() == QStringLiteral("retired not out"), "retirement description");
        check(innings.wickets() == 1, "retired not out is not a fallen wicket");

        check(innings.warnings().size() == 1, "only the unrecognized kind is reported");
        check(innings.warnings().first().fieldPath() == QStringLiteral("innings[0].overs[0].deliveries[0].wickets[0].kind"),
              "unknown kind warning points at the kind");
    }

    void test_phase_splits_follow_policy() {

        Settings settings;
        settings.setPhasePolicy(PhasePolicy(2, 4));

        QJsonArray overs;
        for (int i = 0; i < 5; ++i) {

            QJsonArray deliveries;
            for (int j = 0; j < 6; ++j)
                deliveries.append(ball(QStringLiteral("A"), QStringLiteral("B"), QStringLiteral("X"), (j == i) ? 4 : 0));
            overs.append(overJson(i, deliveries));
        }

        const MatchStatistics statistics = aggregateOvers(overs, settings);
        const InningsStatistics & innings = statistics.innings().first();

        check(innings.phaseSplit(MatchPhase::Phase::POWERPLAY).overs() == 2, "powerplay covers overs 0-1");
        check(innings.phaseSplit(MatchPhase::Phase::MIDDLE).overs() == 2, "middle covers overs 2-3");
        check(innings.phaseSplit(MatchPhase::Phase::DEATH).overs() == 1, "death covers over 4");

        for (auto phase: PhasePolicy::allPhases()) {

            uint16_t runs = 0;
            uint16_t fours = 0;
            uint16_t validBalls = 0;

            for (const auto & over: innings.overs()) {

                if (over.phase() != phase)
                    continue;
                runs += over.runs();
                fours += over.fours();
                validBalls += over.validBalls();
            }

            const PhaseSplit & split = innings.phaseSplit(phase);
            check(split.runs() == runs && split.fours() == fours && split.validBalls() == validBalls,
                  "phase split should equal the sums of its over summaries");
        }

        check(nearlyEqual(innings.phaseSplit(MatchPhase::Phase::POWERPLAY).runRate(6), 4.0), "powerplay run rate");
    }

    void test_zero_denominators() {

        const QJsonArray deliveries {
            deliveryJson(QStringLiteral("A"), QStringLiteral("B"), QStringLiteral("Y"), 0, 1, QStringLiteral("wides")),
            ball(QStringLiteral("A"), QStringLiteral("B"), QStringLiteral("X"), 1)
        };

        const MatchStatistics statistics = aggregateOvers(QJsonArray { overJson(0, deliveries) });
        const InningsStatistics & innings = statistics.innings().first();

        check(innings.batter(QStringLiteral("B")).balls() == 0, "non-striker faced no ball");
        check(innings.batter(QStringLiteral("B")).strikeRate() == 0.0, "strike rate is 0 without balls faced");
        check(innings.bowler(QStringLiteral("Y")).economy() == 0.0, "economy is 0 without valid balls");
        check(innings.bowler(QStringLiteral("Y")).runs() == 1, "wide runs are conceded by the bowler");

        const MatchStatistics empty = aggregateOvers(QJsonArray());
        check(empty.innings().first().runRate(6) == 0.0, "run rate of an empty innings is 0");
        check(empty.innings().first().partnerships().isEmpty(), "empty innings has no partnership");
    }
}

int main() {

    test_single_over_scenario();
    test_conservation_and_valid_balls();
    test_maiden_flag();
    test_partnership_count();
    test_fielding_credit_rules();
    test_warnings_do_not_abort();
    test_unrecognized_and_not_out_dismissals();
    test_phase_splits_follow_policy();
    test_zero_denominators();

    return 0;
}
