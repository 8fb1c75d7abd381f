/*******************************************************************************
 Copyright 2023 Daniel Neuwirth
 This program is distributed under the terms of the GNU General Public License.
*******************************************************************************/

#ifndef MATCHRECORD_H
#define MATCHRECORD_H

#include <QMap>
#include <QPair>
#include <QString>
#include <QStringList>
#include <QVector>
#include <cstdint>
#include "match/dismissal.h"

// all record classes are immutable; values are assigned by MatchParser only

class Fielder {

    friend class MatchParser;

    public:
        Fielder(): _substitute(false) {}
        ~Fielder() {}

        inline QString name() const { return _name; }
        inline QString position() const { return _position; }
        inline bool substitute() const { return _substitute; }

    private:
        QString _name;
        QString _position;
        bool _substitute;
};

class Wicket {

    friend class MatchParser;

    public:
        Wicket(): _kind(DismissalType::Kind::UNKNOWN) {}
        ~Wicket() {}

        inline QString playerOut() const { return _playerOut; }
        inline DismissalType::Kind kind() const { return _kind; }
        inline QString kindName() const { return _kindName; }
        inline QVector<Fielder> fielders() const { return _fielders; }

        inline const DismissalRule & rule() const { return DismissalRules::rule(_kind); }
        QStringList fielderNames() const;

    private:
        QString _playerOut;
        DismissalType::Kind _kind;
        QString _kindName;      // text as found in the record
        QVector<Fielder> _fielders;
};

class DeliveryRuns {

    friend class MatchParser;

    public:
        DeliveryRuns(): _batter(0), _extras(0), _total(0), _nonBoundary(false) {}
        ~DeliveryRuns() {}

        inline uint16_t batter() const { return _batter; }
        inline uint16_t extras() const { return _extras; }
        inline uint16_t total() const { return _total; }
        // four/six runs completed by running (not a boundary)
        inline bool nonBoundary() const { return _nonBoundary; }

    private:
        uint16_t _batter;
        uint16_t _extras;
        uint16_t _total;
        bool _nonBoundary;
};

class DeliveryExtras {

    friend class MatchParser;

    public:
        // do not change the order; it is used for listing extras in reports
        enum class Type: uint8_t { WIDES = 0, NOBALLS = 1, BYES = 2, LEGBYES = 3, PENALTY = 4 };

        DeliveryExtras() {}
        ~DeliveryExtras() {}

        inline bool has(const Type type) const { return _values.contains(type); }
        inline uint16_t value(const Type type) const { return _values.value(type, 0); }
        uint16_t sum() const;

        static QString typeName(const Type);
        static QString recordKey(const Type);
        static QVector<Type> allTypes();

    private:
        QMap<Type, uint16_t> _values;
};

class Delivery {

    friend class MatchParser;

    public:
        Delivery() {}
        ~Delivery() {}

        inline QString striker() const { return _striker; }
        inline QString nonStriker() const { return _nonStriker; }
        inline QString bowler() const { return _bowler; }
        inline const DeliveryRuns & runs() const { return _runs; }
        inline const DeliveryExtras & extras() const { return _extras; }
        inline const QVector<Wicket> & wickets() const { return _wickets; }

        // wides and no-balls do not count toward the over (and rate denominators)
        inline bool isValid() const
            { return !(_extras.has(DeliveryExtras::Type::WIDES) || _extras.has(DeliveryExtras::Type::NOBALLS)); }
        inline bool isDotBall() const { return (this->isValid() && _runs.total() == 0); }
        bool isFour() const;
        bool isSix() const;
        inline bool hasWickets() const { return !_wickets.isEmpty(); }

    private:
        QString _striker;
        QString _nonStriker;
        QString _bowler;
        DeliveryRuns _runs;
        DeliveryExtras _extras;
        QVector<Wicket> _wickets;
};

class Over {

    friend class MatchParser;

    public:
        Over(): _number(0) {}
        ~Over() {}

        inline uint16_t number() const { return _number; }
        inline const QVector<Delivery> & deliveries() const { return _deliveries; }

    private:
        uint16_t _number;   // 0-indexed
        QVector<Delivery> _deliveries;
};

class Innings {

    friend class MatchParser;

    public:
        Innings(): _superOver(false), _targetRuns(0), _targetOvers(0) {}
        ~Innings() {}

        inline QString team() const { return _team; }
        inline const QVector<Over> & overs() const { return _overs; }
        inline bool superOver() const { return _superOver; }

        inline bool hasTarget() const { return (_targetRuns > 0); }
        inline uint16_t targetRuns() const { return _targetRuns; }
        inline double targetOvers() const { return _targetOvers; }

    private:
        QString _team;
        QVector<Over> _overs;
        bool _superOver;
        uint16_t _targetRuns;
        double _targetOvers;    // may be fractional after interruptions
};

class Toss {

    friend class MatchParser;

    public:
        Toss() {}
        ~Toss() {}

        inline QString winner() const { return _winner; }
        inline QString decision() const { return _decision; }

    private:
        QString _winner;
        QString _decision;
};

class Outcome {

    friend class MatchParser;

    public:
        Outcome() {}
        ~Outcome() {}

        inline QString winner() const { return _winner; }
        // ordered as found in the record, e.g. ("wickets", 5)
        inline QVector<QPair<QString, uint16_t>> margins() const { return _margins; }
        inline QString method() const { return _method; }
        inline QString result() const { return _result; }
        inline QString eliminator() const { return _eliminator; }

        inline bool hasWinner() const { return !_winner.isEmpty(); }

    private:
        QString _winner;
        QVector<QPair<QString, uint16_t>> _margins;
        QString _method;
        QString _result;
        QString _eliminator;
};

class Officials {

    friend class MatchParser;

    public:
        Officials() {}
        ~Officials() {}

        inline QStringList umpires() const { return _umpires; }
        inline QStringList tvUmpires() const { return _tvUmpires; }
        inline QStringList reserveUmpires() const { return _reserveUmpires; }
        inline QStringList matchReferees() const { return _matchReferees; }

        inline bool isEmpty() const
            { return (_umpires.isEmpty() && _tvUmpires.isEmpty() && _reserveUmpires.isEmpty() && _matchReferees.isEmpty()); }

    private:
        QStringList _umpires;
        QStringList _tvUmpires;
        QStringList _reserveUmpires;
        QStringList _matchReferees;
};

class MatchInfo {

    friend class MatchParser;

    public:
        MatchInfo(): _eventMatchNumber(0), _oversLimit(0), _hasToss(false), _hasOutcome(false) {}
        ~MatchInfo() {}

        inline QPair<QString, QString> teams() const { return _teams; }
        inline QStringList teamList() const { return QStringList { _teams.first, _teams.second }; }
        QString opponentOf(const QString &) const;

        inline QStringList dates() const { return _dates; }
        QString date() const;

        inline QString venue() const { return _venue; }
        inline QString city() const { return _city; }
        inline QString eventName() const { return _eventName; }
        inline uint16_t eventMatchNumber() const { return _eventMatchNumber; }
        inline QString matchType() const { return _matchType; }
        inline QString gender() const { return _gender; }
        inline QString season() const { return _season; }
        inline uint16_t oversLimit() const { return _oversLimit; }

        inline bool hasToss() const { return _hasToss; }
        inline const Toss & toss() const { return _toss; }
        inline bool hasOutcome() const { return _hasOutcome; }
        inline const Outcome & outcome() const { return _outcome; }

        inline QStringList players(const QString & team) const { return _players.value(team); }
        inline bool hasPlayers(const QString & team) const { return !_players.value(team).isEmpty(); }
        inline const Officials & officials() const { return _officials; }
        inline QStringList playerOfMatch() const { return _playerOfMatch; }

    private:
        QPair<QString, QString> _teams;
        QStringList _dates;
        QString _venue;
        QString _city;
        QString _eventName;
        uint16_t _eventMatchNumber;
        QString _matchType;
        QString _gender;
        QString _season;
        uint16_t _oversLimit;

        bool _hasToss;
        Toss _toss;
        bool _hasOutcome;
        Outcome _outcome;

        QMap<QString, QStringList> _players;
        Officials _officials;
        QStringList _playerOfMatch;
};

class MatchRecord {

    friend class MatchParser;

    public:
        MatchRecord() {}
        ~MatchRecord() {}

        inline const MatchInfo & info() const { return _info; }
        inline const QVector<Innings> & innings() const { return _innings; }

    private:
        MatchInfo _info;
        QVector<Innings> _innings;
};

#endif // MATCHRECORD_H
