/*******************************************************************************
 Copyright 2023 Daniel Neuwirth
 This program is distributed under the terms of the GNU General Public License.
*******************************************************************************/

#include <QJsonDocument>
#include "match/dismissal.h"
#include "match/matchparser.h"
#include "shared/constants.h"
#include "shared/error.h"
#include "testsupport.h"

namespace {

    void expectMalformed(const QJsonObject & json, const QString & path, const char * message) {

        try {

            MatchParser().parse(json);
        }
        catch (MalformedMatchError & e) {

            check(e.fieldPath() == path, message);
            return;
        }

        check(false, message);
        return;
    }

    QJsonObject sampleMatch() {

        QJsonObject info = infoJson(QStringLiteral("Kolkata"), QStringLiteral("Chennai"));
        info.insert(QStringLiteral("toss"), QJsonObject { { QStringLiteral("winner"), QStringLiteral("Chennai") },
                                                          { QStringLiteral("decision"), QStringLiteral("field") } });
        info.insert(QStringLiteral("players"), QJsonObject {
            { QStringLiteral("Kolkata"), QJsonArray { QStringLiteral("A"), QStringLiteral("B"), QStringLiteral("C") } },
            { QStringLiteral("Chennai"), QJsonArray { QStringLiteral("X"), QStringLiteral("F") } } });
        info.insert(QStringLiteral("outcome"), QJsonObject {
            { QStringLiteral("winner"), QStringLiteral("Chennai") },
            { QStringLiteral("by"), QJsonObject { { QStringLiteral("wickets"), 5 } } } });

        const QJsonArray deliveries {
            deliveryJson(QStringLiteral("A"), QStringLiteral("B"), QStringLiteral("X"), 4),
            deliveryJson(QStringLiteral("A"), QStringLiteral("B"), QStringLiteral("X"), 0, 1, QStringLiteral("wides")),
            withWicket(deliveryJson(QStringLiteral("A"), QStringLiteral("B"), QStringLiteral("X"), 0),
                       wicketJson(QStringLiteral("A"), QStringLiteral("caught"),
                                  QJsonArray { fielderJson(QStringLiteral("F"), QStringLiteral("slip")) }))
        };

        return matchJson(info, QJsonArray { inningsJson(QStringLiteral("Kolkata"), QJsonArray { overJson(0, deliveries) }) });
    }

    QJsonObject firstOver(const QJsonObject & match) {

        return match.value(QStringLiteral("innings")).toArray().at(0).toObject()
                    .value(QStringLiteral("overs")).toArray().at(0).toObject();
    }

    QJsonObject replaceFirstOver(const QJsonObject & match, const QJsonObject & over) {

        QJsonObject innings = match.value(QStringLiteral("innings")).toArray().at(0).toObject();
        innings.insert(QStringLiteral("overs"), QJsonArray { over });

        QJsonObject result = match;
        result.insert(QStringLiteral("innings"), QJsonArray { innings });
        return result;
    }

    void test_valid_match_is_normalized() {

        const MatchRecord record = MatchParser().parse(sampleMatch());

        check(record.info().teams().first == QStringLiteral("Kolkata"), "first team should be read");
        check(record.info().date() == QStringLiteral("2023-04-02"), "first date should be the match date");
        check(record.info().hasToss() && record.info().toss().decision() == QStringLiteral("field"), "toss should be read");
        check(record.info().players(QStringLiteral("Kolkata")).size() == 3, "playing XI should be read per team");
        check(record.info().outcome().margins().size() == 1 && record.info().outcome().margins().first().second == 5,
              "outcome margin should be read");
        check(record.info().city() == unknownValue.Value, "absent city should default to Unknown");

        check(record.innings().size() == 1, "one innings expected");
        const Over & over = record.innings().first().overs().first();
        check(over.number() == 0 && over.deliveries().size() == 3, "over with three deliveries expected");

        const Delivery & wide = over.deliveries().at(1);
        check(!wide.isValid() && wide.extras().value(DeliveryExtras::Type::WIDES) == 1, "wide should be an invalid ball");

        const Delivery & wicketBall = over.deliveries().at(2);
        check(wicketBall.hasWickets(), "wicket should be attached to the delivery");
        check(wicketBall.wickets().first().kind() == DismissalType::Kind::CAUGHT, "dismissal kind should be caught");
        check(wicketBall.wickets().first().fielders().first().position() == QStringLiteral("slip"),
              "fielder position should be read");
        check(wicketBall.isDotBall(), "wicket without runs off a valid ball is a dot ball");
        check(over.deliveries().first().isFour(), "four off the bat should be a boundary");
    }

    void test_json_from_bytes() {

        const QByteArray bytes = QJsonDocument(sampleMatch()).toJson();
        check(MatchParser().parse(bytes).innings().size() == 1, "serialized match should parse");

        try {

            MatchParser().parse(QByteArray("{ \"innings\": [ "));
            check(false, "truncated JSON should be fatal");
        }
        catch (MalformedMatchError & e) {

            check(e.fieldPath() == QStringLiteral("<document>"), "syntax error should be reported for the document");
        }
    }

    void test_missing_structure_is_fatal() {

        QJsonObject noInnings = sampleMatch();
        noInnings.remove(QStringLiteral("innings"));
        expectMalformed(noInnings, QStringLiteral("innings"), "missing innings should be fatal");

        QJsonObject noOvers = sampleMatch();
        noOvers.insert(QStringLiteral("innings"), QJsonArray { QJsonObject { { QStringLiteral("team"), QStringLiteral("Kolkata") } } });
        expectMalformed(noOvers, QStringLiteral("innings[0].overs"), "missing overs should be fatal");

        QJsonObject over = firstOver(sampleMatch());
        over.remove(QStringLiteral("deliveries"));
        expectMalformed(replaceFirstOver(sampleMatch(), over), QStringLiteral("innings[0].overs[0].deliveries"),
                        "missing deliveries should be fatal");

        over = firstOver(sampleMatch());
        over.remove(QStringLiteral("over"));
        expectMalformed(replaceFirstOver(sampleMatch(), over), QStringLiteral("innings[0].overs[0].over"),
                        "missing over index should be fatal");

        over = firstOver(sampleMatch());
        over.insert(QStringLiteral("over"), QStringLiteral("first"));
        expectMalformed(replaceFirstOver(sampleMatch(), over), QStringLiteral("innings[0].overs[0].over"),
                        "non-numeric over index should be fatal");
    }

    void test_non_numeric_runs_are_fatal() {

        QJsonObject over = firstOver(sampleMatch());
        QJsonArray deliveries = over.value(QStringLiteral("deliveries")).toArray();
        QJsonObject delivery = deliveries.at(0).toObject();
        QJsonObject runs = delivery.value(QStringLiteral("runs")).toObject();

        runs.insert(QStringLiteral("total"), QStringLiteral("four"));
        delivery.insert(QStringLiteral("runs"), runs);
        deliveries.replace(0, delivery);
        over.insert(QStringLiteral("deliveries"), deliveries);

        expectMalformed(replaceFirstOver(sampleMatch(), over), QStringLiteral("innings[0].overs[0].deliveries[0].runs.total"),
                        "non-numeric total should be fatal with its path");
    }

    void test_innings_team_must_belong_to_match() {

        QJsonObject match = sampleMatch();
        QJsonObject innings = match.value(QStringLiteral("innings")).toArray().at(0).toObject();
        innings.insert(QStringLiteral("team"), QStringLiteral("Mumbai"));
        match.insert(QStringLiteral("innings"), QJsonArray { innings });

        expectMalformed(match, QStringLiteral("innings[0].team"), "unknown innings team should be fatal");
    }

    void test_absent_info_defaults_to_unknown() {

        QJsonObject match = sampleMatch();
        match.remove(QStringLiteral("info"));

        // teams are unknown, so the innings team cannot be checked
        const MatchRecord record = MatchParser().parse(match);

        check(record.info().venue() == unknownValue.Value, "venue should default to Unknown");
        check(record.info().date() == unknownValue.Value, "date should default to Unknown");
        check(record.info().teams().first == unknownValue.Value, "teams should default to Unknown");
        check(record.info().eventName() == unknownValue.Value, "event should default to Unknown");
        check(!record.info().hasToss() && !record.info().hasOutcome(), "toss and outcome should be absent");
        check(record.innings().size() == 1, "innings should still be parsed");
    }

    void test_dismissal_rules_table() {

        using DismissalType::Kind;

        check(DismissalRules::kindFromName(QStringLiteral("Run Out")) == Kind::RUN_OUT, "kind lookup should ignore case");
        check(DismissalRules::kindFromName(QStringLiteral("bowled out by rain")) == Kind::UNKNOWN,
              "unrecognized kind should map to unknown");

        check(!DismissalRules::rule(Kind::RUN_OUT).creditedToBowler(), "run out is not a bowler's wicket");
        check(!DismissalRules::rule(Kind::RETIRED_HURT).creditedToBowler(), "retired hurt is not a bowler's wicket");
        check(!DismissalRules::rule(Kind::RETIRED_HURT).wicketFalls(), "retired hurt does not count as a fallen wicket");
        check(DismissalRules::kindFromName(QStringLiteral("retired not out")) == Kind::RETIRED_NOT_OUT,
              "retired not out is a known kind");
        check(!DismissalRules::rule(Kind::RETIRED_NOT_OUT).wicketFalls() &&
              !DismissalRules::rule(Kind::RETIRED_NOT_OUT).creditedToBowler(), "retired not out is neither a wicket nor a bowler's");
        check(DismissalRules::rule(Kind::UNKNOWN).creditedToBowler(), "unrecognized kinds count for the bowler");
        check(DismissalRules::rule(Kind::STUMPED).creditedToBowler(), "stumping is a bowler's wicket");
        check(DismissalRules::rule(Kind::CAUGHT).fieldingCredit() == DismissalType::FieldingCredit::CATCH_FIRST_FIELDER,
              "catch should credit the first fielder");

        check(DismissalRules::describe(Kind::CAUGHT, QStringLiteral("X"), QStringList { QStringLiteral("F") }) ==
              QStringLiteral("c F b X"), "caught description");
        check(DismissalRules::describe(Kind::RUN_OUT, QStringLiteral("X"),
                                       QStringList { QStringLiteral("F"), QStringLiteral("G") }) ==
              QStringLiteral("run out (F/G)"), "run out description");
        check(DismissalRules::describe(Kind::LBW, QStringLiteral("X"), QStringList()) == QStringLiteral("lbw b X"),
              "lbw description");
    }
}

int main() {

    test_valid_match_is_normalized();
    test_json_from_bytes();
    test_missing_structure_is_fatal();
    test_non_numeric_runs_are_fatal();
    test_innings_team_must_belong_to_match();
    test_absent_info_defaults_to_unknown();
    test_dismissal_rules_table();

    return 0;
}
