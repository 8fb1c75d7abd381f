/*******************************************************************************
 Copyright 2023 Daniel Neuwirth
 This program is distributed under the terms of the GNU General Public License.
*******************************************************************************/

#ifndef REPORTRENDERER_H
#define REPORTRENDERER_H

#include <QString>
#include <QStringList>
#include "match/matchrecord.h"
#include "settings/settings.h"
#include "stats/inningsstats.h"

// Formats a match record and its statistics into ordered text sections.
// Nothing is computed here; a section without data is left out.
class ReportRenderer {

    public:
        explicit ReportRenderer(const Settings & settings): _settings(settings) {}
        ~ReportRenderer() {}

        QStringList sections(const MatchRecord &, const MatchStatistics &) const;
        // sections separated by an empty line
        QString render(const MatchRecord &, const MatchStatistics &) const;

        QString header(const MatchInfo &) const;
        QString playingEleven(const MatchInfo &) const;
        QString toss(const MatchInfo &) const;
        QString officials(const MatchInfo &) const;
        QString playerOfMatch(const MatchInfo &) const;

        QString inningsSummary(const Innings &, const InningsStatistics &) const;
        QString overByOver(const InningsStatistics &) const;
        QString phaseAnalysis(const InningsStatistics &) const;
        QString partnershipAnalysis(const InningsStatistics &) const;
        QString matchupAnalysis(const InningsStatistics &) const;
        QString battingStatistics(const InningsStatistics &) const;
        QString bowlingStatistics(const InningsStatistics &) const;
        QString wicketAnalysis(const InningsStatistics &) const;
        QString fieldingAnalysis(const InningsStatistics &) const;

        QString matchSummary(const MatchStatistics &) const;
        QString result(const MatchInfo &) const;

    private:
        QString phaseRange(const MatchPhase::Phase) const;

        const Settings _settings;
};

#endif // REPORTRENDERER_H
