/*******************************************************************************
 Copyright 2023 Daniel Neuwirth
 This program is distributed under the terms of the GNU General Public License.
*******************************************************************************/

#ifndef DISMISSAL_H
#define DISMISSAL_H

#include <QMap>
#include <QString>
#include <QStringList>
#include <cstdint>

namespace DismissalType {

    enum class Kind: uint8_t {
        BOWLED, CAUGHT, CAUGHT_AND_BOWLED, LBW, STUMPED, RUN_OUT, HIT_WICKET, RETIRED_HURT, RETIRED_NOT_OUT, RETIRED_OUT,
        OBSTRUCTING_THE_FIELD, HIT_THE_BALL_TWICE, HANDLED_THE_BALL, TIMED_OUT, UNKNOWN
    };

    enum class FieldingCredit: uint8_t {
        NONE,
        CATCH_FIRST_FIELDER,    // only the first listed fielder is credited
        STUMPING_ALL_FIELDERS,
        RUN_OUT_ALL_FIELDERS    // every listed fielder is credited
    };
}

class DismissalRule {

    public:
        DismissalRule(): _kind(DismissalType::Kind::UNKNOWN), _creditedToBowler(false), _wicketFalls(true),
            _fieldingCredit(DismissalType::FieldingCredit::NONE) {}
        DismissalRule(const DismissalType::Kind kind, const QString & name, const QString & abbr,
                      const bool creditedToBowler, const bool wicketFalls, const DismissalType::FieldingCredit credit):
            _kind(kind), _name(name), _abbr(abbr), _creditedToBowler(creditedToBowler), _wicketFalls(wicketFalls),
            _fieldingCredit(credit) {}
        ~DismissalRule() {}

        inline DismissalType::Kind kind() const { return _kind; }
        inline QString name() const { return _name; }
        inline QString abbr() const { return _abbr; }
        inline bool creditedToBowler() const { return _creditedToBowler; }
        inline bool wicketFalls() const { return _wicketFalls; }
        inline DismissalType::FieldingCredit fieldingCredit() const { return _fieldingCredit; }

    private:
        DismissalType::Kind _kind;
        QString _name;          // as used in source records ("run out")
        QString _abbr;          // scorecard abbreviation ("c", "st", "lbw")
        bool _creditedToBowler;
        bool _wicketFalls;      // false = batter is not out (retired hurt, retired not out)
        DismissalType::FieldingCredit _fieldingCredit;
};

class DismissalRules {

    public:
        static DismissalType::Kind kindFromName(const QString &);
        static const DismissalRule & rule(const DismissalType::Kind);

        // scorecard description, e.g. "c Smith b Jones", "run out (Smith)"
        static QString describe(const DismissalType::Kind, const QString &, const QStringList &);

    private:
        static const QMap<DismissalType::Kind, DismissalRule> _rules;
        static const DismissalRule _unknownRule;
};

#endif // DISMISSAL_H
