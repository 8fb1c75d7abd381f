/*******************************************************************************
 Copyright 2023 Daniel Neuwirth
 This program is distributed under the terms of the GNU General Public License.
*******************************************************************************/

#include <QStringBuilder>
#include "match/dismissal.h"

using DismissalType::Kind;
using DismissalType::FieldingCredit;

// run outs and retirements without dismissal are not counted toward bowler's wickets
const QMap<Kind, DismissalRule> DismissalRules::_rules {

    { Kind::BOWLED, DismissalRule(Kind::BOWLED, QStringLiteral("bowled"), QStringLiteral("b"),
                                  true, true, FieldingCredit::NONE) },
    { Kind::CAUGHT, DismissalRule(Kind::CAUGHT, QStringLiteral("caught"), QStringLiteral("c"),
                                  true, true, FieldingCredit::CATCH_FIRST_FIELDER) },
    { Kind::CAUGHT_AND_BOWLED, DismissalRule(Kind::CAUGHT_AND_BOWLED, QStringLiteral("caught and bowled"),
                                             QStringLiteral("c & b"), true, true, FieldingCredit::NONE) },
    { Kind::LBW, DismissalRule(Kind::LBW, QStringLiteral("lbw"), QStringLiteral("lbw"),
                               true, true, FieldingCredit::NONE) },
    { Kind::STUMPED, DismissalRule(Kind::STUMPED, QStringLiteral("stumped"), QStringLiteral("st"),
                                   true, true, FieldingCredit::STUMPING_ALL_FIELDERS) },
    { Kind::RUN_OUT, DismissalRule(Kind::RUN_OUT, QStringLiteral("run out"), QStringLiteral("run out"),
                                   false, true, FieldingCredit::RUN_OUT_ALL_FIELDERS) },
    { Kind::HIT_WICKET, DismissalRule(Kind::HIT_WICKET, QStringLiteral("hit wicket"), QStringLiteral("hit wicket"),
                                      true, true, FieldingCredit::NONE) },
    { Kind::RETIRED_HURT, DismissalRule(Kind::RETIRED_HURT, QStringLiteral("retired hurt"),
                                        QStringLiteral("retired hurt"), false, false, FieldingCredit::NONE) },
    { Kind::RETIRED_NOT_OUT, DismissalRule(Kind::RETIRED_NOT_OUT, QStringLiteral("retired not out"),
                                           QStringLiteral("retired not out"), false, false, FieldingCredit::NONE) },
    { Kind::RETIRED_OUT, DismissalRule(Kind::RETIRED_OUT, QStringLiteral("retired out"), QStringLiteral("retired out"),
                                       true, true, FieldingCredit::NONE) },
    { Kind::OBSTRUCTING_THE_FIELD, DismissalRule(Kind::OBSTRUCTING_THE_FIELD, QStringLiteral("obstructing the field"),
                                                 QStringLiteral("obstructing the field"), true, true, FieldingCredit::NONE) },
    { Kind::HIT_THE_BALL_TWICE, DismissalRule(Kind::HIT_THE_BALL_TWICE, QStringLiteral("hit the ball twice"),
                                              QStringLiteral("hit the ball twice"), true, true, FieldingCredit::NONE) },
    { Kind::HANDLED_THE_BALL, DismissalRule(Kind::HANDLED_THE_BALL, QStringLiteral("handled the ball"),
                                            QStringLiteral("handled the ball"), true, true, FieldingCredit::NONE) },
    { Kind::TIMED_OUT, DismissalRule(Kind::TIMED_OUT, QStringLiteral("timed out"), QStringLiteral("timed out"),
                                     true, true, FieldingCredit::NONE) }
};

// unrecognized kinds count as bowler's wickets like every kind not excluded above
const DismissalRule DismissalRules::_unknownRule(Kind::UNKNOWN, QStringLiteral("unknown"), QStringLiteral("out"),
                                                 true, true, FieldingCredit::NONE);

Kind DismissalRules::kindFromName(const QString & name) {

    const QString normalized = name.trimmed().toLower();

    for (auto it = _rules.constBegin(); it != _rules.constEnd(); ++it)
        if (it.value().name() == normalized)
            return it.key();

    return Kind::UNKNOWN;
}

const DismissalRule & DismissalRules::rule(const Kind kind) {

    const auto it = _rules.constFind(kind);
    return ((it != _rules.constEnd()) ? it.value() : _unknownRule);
}

QString DismissalRules::describe(const Kind kind, const QString & bowler, const QStringList & fielders) {

    const DismissalRule & dismissal = DismissalRules::rule(kind);
    const QString fielder = (fielders.isEmpty()) ? QStringLiteral("?") : fielders.first();
    QString description = dismissal.abbr();

    switch (kind) {

        case Kind::CAUGHT:
        case Kind::STUMPED:
            description = dismissal.abbr() % QChar(32) % fielder % QStringLiteral(" b ") % bowler;
            break;
        case Kind::RUN_OUT:
            if (!fielders.isEmpty())
                description = dismissal.abbr() % QStringLiteral(" (") % fielders.join('/') % QChar(')');
            break;
        case Kind::BOWLED:
            description = QStringLiteral("b ") % bowler;
            break;
        case Kind::CAUGHT_AND_BOWLED:
        case Kind::LBW:
        case Kind::HIT_WICKET:
            description = dismissal.abbr() % QStringLiteral(" b ") % bowler;
            break;
        default: ;
    }

    return description;
}
