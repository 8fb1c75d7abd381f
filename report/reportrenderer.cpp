/*******************************************************************************
 Copyright 2023 Daniel Neuwirth
 This program is distributed under the terms of the GNU General Public License.
*******************************************************************************/

#include <QStringBuilder>
#include "report/reportrenderer.h"
#include "shared/constants.h"
#include "shared/texts.h"

namespace {

    inline QString line(const QString & label, const QString & value) { return (label % QStringLiteral(": ") % value); }

    inline bool isKnown(const QString & value) { return (!value.isEmpty() && value != unknownValue.Value); }

    // "3 fours, 1 six"
    QString boundaries(const uint16_t fours, const uint16_t sixes) {

        return (string_functions.countWithNoun(fours, QStringLiteral("four")) % QStringLiteral(", ") %
                string_functions.countWithNoun(sixes, QStringLiteral("six"), QStringLiteral("es")));
    }

    QString positionBreakdown(const QMap<QString, uint16_t> & positions, const QString & preposition) {

        QStringList details;
        for (auto it = positions.constBegin(); it != positions.constEnd(); ++it)
            details.append(QString::number(it.value()) % QChar(32) % preposition % QChar(32) % it.key());

        return details.join(QStringLiteral(", "));
    }
}

QStringList ReportRenderer::sections(const MatchRecord & record, const MatchStatistics & statistics) const {

    const MatchInfo & info = record.info();

    QStringList sections { this->header(info), this->playingEleven(info), this->toss(info),
                           this->officials(info), this->playerOfMatch(info) };

    for (int i = 0; i < statistics.innings().size() && i < record.innings().size(); ++i) {

        const InningsStatistics & innings = statistics.innings().at(i);

        sections << this->inningsSummary(record.innings().at(i), innings) << this->overByOver(innings)
                 << this->phaseAnalysis(innings) << this->partnershipAnalysis(innings)
                 << this->matchupAnalysis(innings) << this->battingStatistics(innings)
                 << this->bowlingStatistics(innings) << this->wicketAnalysis(innings)
                 << this->fieldingAnalysis(innings);
    }

    sections << this->matchSummary(statistics) << this->result(info);

    sections.removeAll(QString());
    return sections;
}

QString ReportRenderer::render(const MatchRecord & record, const MatchStatistics & statistics) const {

    return this->sections(record, statistics).join(QStringLiteral("\n\n"));
}

QString ReportRenderer::header(const MatchInfo & info) const {

    QStringList lines;

    lines << (QStringLiteral("Match Analysis: ") % info.teams().first % QStringLiteral(" vs ") % info.teams().second);

    // unknown details are left out
    if (isKnown(info.date()))
        lines << line(QStringLiteral("Date"), info.date());
    if (isKnown(info.venue()))
        lines << line(QStringLiteral("Venue"), info.venue());
    if (isKnown(info.city()))
        lines << line(QStringLiteral("City"), info.city());

    if (isKnown(info.eventName())) {

        QString event = info.eventName();
        if (info.eventMatchNumber() > 0)
            event += string_functions.wrapInBrackets(QStringLiteral("Match ") % QString::number(info.eventMatchNumber()));
        lines << line(QStringLiteral("Event"), event);
    }

    if (isKnown(info.matchType()))
        lines << line(QStringLiteral("Match Type"), info.matchType());
    if (isKnown(info.gender()))
        lines << line(QStringLiteral("Gender"), info.gender());
    if (isKnown(info.season()))
        lines << line(QStringLiteral("Season"), info.season());

    if (info.oversLimit() > 0)
        lines << line(QStringLiteral("Overs per Innings"), QString::number(info.oversLimit()));

    return lines.join('\n');
}

QString ReportRenderer::playingEleven(const MatchInfo & info) const {

    QStringList lines;

    for (const auto & team: info.teamList()) {

        if (!info.hasPlayers(team))
            continue;

        if (!lines.isEmpty())
            lines << QString();

        lines << (team % QStringLiteral(" Playing XI:"));
        for (const auto & player: info.players(team))
            lines << (QStringLiteral("- ") % player);
    }

    return lines.join('\n');
}

QString ReportRenderer::toss(const MatchInfo & info) const {

    if (!info.hasToss())
        return QString();

    return (QStringLiteral("Toss: ") % info.toss().winner() % QStringLiteral(" won and chose to ") %
            info.toss().decision());
}

QString ReportRenderer::officials(const MatchInfo & info) const {

    const Officials & officials = info.officials();
    QStringList lines;

    if (!officials.umpires().isEmpty())
        lines << line(QStringLiteral("Umpires"), officials.umpires().join(QStringLiteral(", ")));
    if (!officials.tvUmpires().isEmpty())
        lines << line(QStringLiteral("TV Umpires"), officials.tvUmpires().join(QStringLiteral(", ")));
    if (!officials.reserveUmpires().isEmpty())
        lines << line(QStringLiteral("Reserve Umpires"), officials.reserveUmpires().join(QStringLiteral(", ")));
    if (!officials.matchReferees().isEmpty())
        lines << line(QStringLiteral("Match Referees"), officials.matchReferees().join(QStringLiteral(", ")));

    return lines.join('\n');
}

QString ReportRenderer::playerOfMatch(const MatchInfo & info) const {

    if (info.playerOfMatch().isEmpty())
        return QString();

    return line(QStringLiteral("Player of the Match"), info.playerOfMatch().join(QStringLiteral(", ")));
}

QString ReportRenderer::inningsSummary(const Innings & innings, const InningsStatistics & statistics) const {

    const uint8_t ballsPerOver = _settings.ballsPerOver();
    QStringList lines;

    QString title = QStringLiteral("Innings ") % QString::number(statistics.inningsNo()) % QStringLiteral(": ") %
                    statistics.battingTeam();
    if (statistics.superOver())
        title += string_functions.wrapInBrackets(QStringLiteral("Super Over"));
    lines << title;

    lines << line(QStringLiteral("Total Score"), QString::number(statistics.runs()) % QChar('/') %
                  QString::number(statistics.wickets()) % string_functions.wrapInBrackets(
                  string_functions.oversNotation(statistics.validBalls(), ballsPerOver) % QStringLiteral(" overs")));
    lines << line(QStringLiteral("Run Rate"), string_functions.rate(statistics.runRate(ballsPerOver)));

    QStringList extras;
    for (auto type: DeliveryExtras::allTypes())
        if (statistics.extras(type) > 0)
            extras << (DeliveryExtras::typeName(type) % QChar(32) % QString::number(statistics.extras(type)));

    QString extrasLine = QString::number(statistics.extrasTotal());
    if (!extras.isEmpty())
        extrasLine += string_functions.wrapInBrackets(extras.join(QStringLiteral(", ")));
    lines << line(QStringLiteral("Extras"), extrasLine);

    if (innings.hasTarget()) {

        QString target = QString::number(innings.targetRuns()) % QStringLiteral(" runs");
        if (innings.targetOvers() > 0)
            target += QStringLiteral(" in ") % QString::number(innings.targetOvers()) % QStringLiteral(" overs");
        lines << line(QStringLiteral("Target"), target);
    }

    return lines.join('\n');
}

QString ReportRenderer::overByOver(const InningsStatistics & statistics) const {

    if (statistics.overs().isEmpty())
        return QString();

    QStringList lines { QStringLiteral("Detailed Over-by-Over Analysis:") };

    for (const auto & over: statistics.overs()) {

        QString text = QStringLiteral("Over ") % QString::number(over.number() + 1);
        if (!over.bowler().isEmpty())
            text += string_functions.wrapInBrackets(over.bowler());

        text += QStringLiteral(": ") % string_functions.countWithNoun(over.runs(), QStringLiteral("run")) %
                string_functions.wrapInBrackets(QString::number(over.extras()) % QStringLiteral(" extras")) %
                QStringLiteral(", ") % string_functions.countWithNoun(over.wickets(), QStringLiteral("wicket")) %
                QStringLiteral(", ") % boundaries(over.fours(), over.sixes()) %
                QStringLiteral(" | Score: ") % QString::number(over.cumulativeRuns()) % QChar('/') %
                QString::number(over.cumulativeWickets()) %
                QStringLiteral(" (Over RR: ") % string_functions.rate(over.runRate()) %
                QStringLiteral(", Match RR: ") % string_functions.rate(over.cumulativeRunRate()) % QChar(')');

        if (over.maiden())
            text += QStringLiteral(" - maiden");

        lines << text;
    }

    return lines.join('\n');
}

QString ReportRenderer::phaseRange(const MatchPhase::Phase phase) const {

    const PhasePolicy & policy = _settings.phasePolicy();

    // overs are displayed 1-indexed
    const QString first = QString::number(policy.firstOver(phase) + 1);
    const int32_t last = policy.lastOver(phase);

    if (last < 0)
        return (QStringLiteral("overs ") % first % QChar('+'));

    return (QStringLiteral("overs ") % first % QChar('-') % QString::number(last + 1));
}

QString ReportRenderer::phaseAnalysis(const InningsStatistics & statistics) const {

    QStringList lines { QStringLiteral("Phase Analysis:") };

    for (auto phase: PhasePolicy::allPhases()) {

        const PhaseSplit & split = statistics.phaseSplit(phase);
        if (split.isEmpty())
            continue;

        lines << (PhasePolicy::phaseName(phase) % string_functions.wrapInBrackets(this->phaseRange(phase)) %
                  QStringLiteral(": Runs: ") % QString::number(split.runs()) %
                  QStringLiteral(", Wickets: ") % QString::number(split.wickets()) %
                  QStringLiteral(", Run Rate: ") % string_functions.rate(split.runRate(_settings.ballsPerOver())) %
                  QStringLiteral(", Boundaries: ") % boundaries(split.fours(), split.sixes()) %
                  string_functions.wrapInBrackets(string_functions.percentage(split.boundaryPercentage()) % QChar('%')) %
                  QStringLiteral(", Dots: ") % QString::number(split.dots()) %
                  string_functions.wrapInBrackets(string_functions.percentage(split.dotPercentage()) % QChar('%')) %
                  QStringLiteral(", Extras: ") % QString::number(split.extras()));
    }

    if (lines.size() == 1)
        return QString();

    return lines.join('\n');
}

QString ReportRenderer::partnershipAnalysis(const InningsStatistics & statistics) const {

    if (statistics.partnerships().isEmpty())
        return QString();

    const uint8_t ballsPerOver = _settings.ballsPerOver();
    QStringList lines { QStringLiteral("Partnership Analysis:") };

    for (int i = 0; i < statistics.partnerships().size(); ++i) {

        const Partnership & partnership = statistics.partnerships().at(i);
        const QString first = partnership.batters().first;
        const QString second = partnership.batters().second;

        QString ending = QStringLiteral("not broken by a wicket");
        if (partnership.endedByWicket())
            ending = QStringLiteral("ended by wicket ") % QString::number(partnership.wicketNumber());

        lines << QString();
        lines << (QString::number(i + 1) % QStringLiteral(". ") % first % QStringLiteral(" & ") % second);
        lines << (QStringLiteral("Runs: ") % QString::number(partnership.runs()) % QStringLiteral(" (") %
                  string_functions.countWithNoun(partnership.balls(), QStringLiteral("ball")) %
                  QStringLiteral(", RR: ") % string_functions.rate(partnership.runRate(ballsPerOver)) % QChar(')'));
        lines << (QStringLiteral("Score: ") % QString::number(partnership.startScore()) % QStringLiteral(" to ") %
                  QString::number(partnership.endScore()) % QStringLiteral(", ") % ending);
        lines << (QStringLiteral("Contribution: ") % first % QChar(32) % QString::number(partnership.batterRuns(first)) %
                  QStringLiteral(", ") % second % QChar(32) % QString::number(partnership.batterRuns(second)));
        lines << (QStringLiteral("Boundaries: ") % boundaries(partnership.fours(), partnership.sixes()) %
                  string_functions.wrapInBrackets(string_functions.percentage(partnership.boundaryPercentage()) %
                                                  QStringLiteral("% boundary rate")));
        lines << (QStringLiteral("Dot Balls: ") % QString::number(partnership.dots()) %
                  string_functions.wrapInBrackets(string_functions.percentage(partnership.dotPercentage()) % QChar('%')));

        // per-bowler breakdown only for significant partnerships
        if (partnership.runs() < _settings.partnershipFloor())
            continue;

        lines << QStringLiteral("vs Bowlers:");

        const QMap<QString, MatchupFigures> bowlers = partnership.bowlers();
        for (auto it = bowlers.constBegin(); it != bowlers.constEnd(); ++it) {

            const MatchupFigures & figures = it.value();
            if (figures.balls() == 0)
                continue;

            lines << (QStringLiteral("  ") % it.key() % QStringLiteral(": ") % QString::number(figures.runs()) %
                      QChar('/') % string_functions.countWithNoun(figures.balls(), QStringLiteral("ball")) %
                      QStringLiteral(" (RR: ") % string_functions.rate(figures.runRate(ballsPerOver)) %
                      QStringLiteral(", Boundaries: ") % QString::number(figures.fours()) % QStringLiteral("x4 ") %
                      QString::number(figures.sixes()) % QStringLiteral("x6, Dots: ") %
                      QString::number(figures.dots()) % QChar(')'));
        }
    }

    return lines.join('\n');
}

QString ReportRenderer::matchupAnalysis(const InningsStatistics & statistics) const {

    QStringList lines { QStringLiteral("Batter vs Bowler Analysis:") };

    for (const auto & batter: statistics.batters()) {

        QStringList entries;

        for (const auto & entry: statistics.matchups().vsBowlers(batter.name())) {

            const MatchupFigures & figures = entry.second;
            if (figures.balls() == 0)
                continue;

            QString text = QStringLiteral("  ") % entry.first % QStringLiteral(": ") %
                string_functions.countWithNoun(figures.runs(), QStringLiteral("run")) % QStringLiteral(" (") %
                string_functions.countWithNoun(figures.balls(), QStringLiteral("ball")) %
                QStringLiteral(", SR: ") % string_functions.rate(figures.strikeRate()) %
                QStringLiteral(", Boundaries: ") % QString::number(figures.fours()) % QStringLiteral("x4 ") %
                QString::number(figures.sixes()) % QStringLiteral("x6") %
                string_functions.wrapInBrackets(string_functions.percentage(figures.boundaryPercentage()) % QChar('%')) %
                QStringLiteral(", Dots: ") % QString::number(figures.dots()) %
                string_functions.wrapInBrackets(string_functions.percentage(figures.dotPercentage()) % QChar('%'));

            if (figures.dismissals() > 0)
                text += QStringLiteral(", Dismissed ") % string_functions.countWithNoun(figures.dismissals(), QStringLiteral("time"));

            entries << (text % QChar(')'));
        }

        if (entries.isEmpty())
            continue;

        lines << QString() << (batter.name() % QStringLiteral(" against:")) << entries;
    }

    if (lines.size() == 1)
        return QString();

    return lines.join('\n');
}

QString ReportRenderer::battingStatistics(const InningsStatistics & statistics) const {

    if (statistics.batters().isEmpty())
        return QString();

    QStringList lines { QStringLiteral("Batting Statistics:") };

    for (const auto & batter: statistics.batters())
        lines << (batter.name() % QStringLiteral(": ") % string_functions.countWithNoun(batter.runs(), QStringLiteral("run")) %
                  QStringLiteral(" (") % string_functions.countWithNoun(batter.balls(), QStringLiteral("ball")) %
                  QStringLiteral(", ") % boundaries(batter.fours(), batter.sixes()) %
                  QStringLiteral(", SR: ") % string_functions.rate(batter.strikeRate()) %
                  QStringLiteral(") - ") % batter.howOut());

    return lines.join('\n');
}

QString ReportRenderer::bowlingStatistics(const InningsStatistics & statistics) const {

    if (statistics.bowlers().isEmpty())
        return QString();

    const uint8_t ballsPerOver = _settings.ballsPerOver();
    QStringList lines { QStringLiteral("Bowling Statistics:") };

    for (const auto & bowler: statistics.bowlers()) {

        QString text = bowler.name() % QStringLiteral(": ") % QString::number(bowler.wickets()) % QChar('/') %
            QString::number(bowler.runs()) % QStringLiteral(" (") %
            string_functions.oversNotation(
                static_cast<uint16_t>(bowler.completedOvers() * ballsPerOver + bowler.incompleteOverBalls()), ballsPerOver) % QStringLiteral(" overs, ") %
            string_functions.countWithNoun(bowler.maidens(), QStringLiteral("maiden")) %
            QStringLiteral(", Econ: ") % string_functions.rate(bowler.economy()) %
            QStringLiteral(", Dots: ") % QString::number(bowler.dots());

        if (bowler.wides() > 0)
            text += QStringLiteral(", Wides: ") % QString::number(bowler.wides());
        if (bowler.noBalls() > 0)
            text += QStringLiteral(", No-balls: ") % QString::number(bowler.noBalls());

        lines << (text % QChar(')'));
    }

    return lines.join('\n');
}

QString ReportRenderer::wicketAnalysis(const InningsStatistics & statistics) const {

    if (statistics.bowlerWickets() == 0)
        return QString();

    QStringList lines { QStringLiteral("Wicket Analysis:") };

    for (const auto & bowler: statistics.bowlers())
        if (bowler.wickets() > 0)
            lines << (bowler.name() % QStringLiteral(": ") % QString::number(bowler.wickets()) %
                      string_functions.wrapInBrackets(
                          string_functions.percentage(statistics.wicketShare(bowler.name())) % QChar('%')));

    return lines.join('\n');
}

QString ReportRenderer::fieldingAnalysis(const InningsStatistics & statistics) const {

    QStringList lines { QStringLiteral("Fielding Analysis:") };

    for (const auto & fielder: statistics.fielders()) {

        if (fielder.total() == 0)
            continue;

        QStringList contributions;

        if (fielder.catches() > 0)
            contributions << (string_functions.countWithNoun(fielder.catches(), QStringLiteral("catch"), QStringLiteral("es")) %
                              string_functions.wrapInBrackets(positionBreakdown(
                                  fielder.byPosition(FielderStat::Contribution::CATCH), QStringLiteral("at"))));
        if (fielder.stumpings() > 0)
            contributions << string_functions.countWithNoun(fielder.stumpings(), QStringLiteral("stumping"));
        if (fielder.runOuts() > 0)
            contributions << (string_functions.countWithNoun(fielder.runOuts(), QStringLiteral("run out")) %
                              string_functions.wrapInBrackets(positionBreakdown(
                                  fielder.byPosition(FielderStat::Contribution::RUN_OUT), QStringLiteral("from"))));

        lines << (fielder.name() % QStringLiteral(": ") % contributions.join(QStringLiteral(", ")));
    }

    if (lines.size() == 1)
        return QString();

    return lines.join('\n');
}

QString ReportRenderer::matchSummary(const MatchStatistics & statistics) const {

    QStringList lines { QStringLiteral("Match Summary:") };

    lines << line(QStringLiteral("Total Runs Scored"), QString::number(statistics.totalRuns()));
    lines << line(QStringLiteral("Total Wickets"), QString::number(statistics.totalWickets()));
    lines << line(QStringLiteral("Total Boundaries"), QString::number(statistics.totalFours()) % QStringLiteral(" fours, ") %
                  QString::number(statistics.totalSixes()) % QStringLiteral(" sixes"));
    lines << line(QStringLiteral("Total Extras"), QString::number(statistics.totalExtras()));
    lines << line(QStringLiteral("Total Balls"), QString::number(statistics.totalValidBalls()));

    return lines.join('\n');
}

QString ReportRenderer::result(const MatchInfo & info) const {

    if (!info.hasOutcome())
        return QString();

    const Outcome & outcome = info.outcome();
    QStringList lines;

    if (outcome.hasWinner()) {

        lines << (QStringLiteral("Result: ") % outcome.winner() % QStringLiteral(" won"));

        QStringList margins;
        for (const auto & margin: outcome.margins())
            margins << (QStringLiteral("by ") % QString::number(margin.second) % QChar(32) % margin.first);
        if (!margins.isEmpty())
            lines << line(QStringLiteral("Margin"), margins.join(QStringLiteral(", ")));

        if (!outcome.method().isEmpty())
            lines << line(QStringLiteral("Method"), outcome.method());
    }
    else if (!outcome.result().isEmpty()) {

        lines << line(QStringLiteral("Result"), outcome.result());

        if (!outcome.eliminator().isEmpty())
            lines << line(QStringLiteral("Super Over Winner"), outcome.eliminator());
    }

    return lines.join('\n');
}
