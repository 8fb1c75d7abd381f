/*******************************************************************************
 Copyright 2023 Daniel Neuwirth
 This program is distributed under the terms of the GNU General Public License.
*******************************************************************************/

#ifndef PLAYERSTATS_H
#define PLAYERSTATS_H

#include <QMap>
#include <QString>
#include <cstdint>

class BatterStat {

    public:
        BatterStat(): BatterStat(QString()) {}
        explicit BatterStat(const QString &);
        ~BatterStat() {}

        void addDelivery(const uint16_t, const bool, const bool, const bool, const bool);
        inline void addDismissal() { ++_dismissals; return; }
        void setOut(const QString &);
        inline void setRetired(const QString & description) { _howOut = description; return; }

        // strike rate is computed once, after all deliveries of the innings have been processed
        void finalize();

        inline QString name() const { return _name; }
        inline uint16_t runs() const { return _runs; }
        inline uint16_t balls() const { return _balls; }
        inline uint16_t fours() const { return _fours; }
        inline uint16_t sixes() const { return _sixes; }
        inline uint16_t dots() const { return _dots; }
        // dismissals credited to bowlers (run outs and retirements excluded)
        inline uint16_t dismissals() const { return _dismissals; }
        inline bool isOut() const { return _out; }
        inline QString howOut() const { return _howOut; }
        inline double strikeRate() const { return _strikeRate; }

    private:
        QString _name;
        uint16_t _runs;
        uint16_t _balls;
        uint16_t _fours;
        uint16_t _sixes;
        uint16_t _dots;
        uint16_t _dismissals;
        bool _out;
        QString _howOut;
        double _strikeRate;
};

class BowlerStat {

    public:
        BowlerStat(): BowlerStat(QString()) {}
        explicit BowlerStat(const QString &);
        ~BowlerStat() {}

        void addDelivery(const uint16_t, const bool, const bool, const bool, const bool);
        inline void addWide() { ++_wides; return; }
        inline void addNoBall() { ++_noBalls; return; }
        inline void addWicket() { ++_wickets; return; }
        inline void addMaiden() { ++_maidens; return; }
        void addOverBalls(const uint8_t, const uint8_t);

        // economy is computed once, after all deliveries of the innings have been processed
        void finalize(const uint8_t);

        inline QString name() const { return _name; }
        inline uint16_t balls() const { return _balls; }
        inline uint16_t runs() const { return _runs; }
        inline uint16_t wickets() const { return _wickets; }
        inline uint16_t maidens() const { return _maidens; }
        inline uint16_t completedOvers() const { return _completedOvers; }
        inline uint16_t incompleteOverBalls() const { return _incompleteOverBalls; }
        inline uint16_t dots() const { return _dots; }
        inline uint16_t fours() const { return _fours; }
        inline uint16_t sixes() const { return _sixes; }
        inline uint16_t wides() const { return _wides; }
        inline uint16_t noBalls() const { return _noBalls; }
        inline double economy() const { return _economy; }

        // completed overs + balls of incomplete overs / balls per over (not rounded)
        double oversBowled(const uint8_t) const;

    private:
        QString _name;
        uint16_t _balls;
        uint16_t _runs;
        uint16_t _wickets;
        uint16_t _maidens;
        uint16_t _completedOvers;
        uint16_t _incompleteOverBalls;
        uint16_t _dots;
        uint16_t _fours;
        uint16_t _sixes;
        uint16_t _wides;
        uint16_t _noBalls;
        double _economy;
};

class FielderStat {

    public:
        enum class Contribution: uint8_t { CATCH, STUMPING, RUN_OUT };

        FielderStat(): FielderStat(QString()) {}
        explicit FielderStat(const QString &);
        ~FielderStat() {}

        void addContribution(const Contribution, const QString &);

        inline QString name() const { return _name; }
        inline uint16_t catches() const { return _catches; }
        inline uint16_t stumpings() const { return _stumpings; }
        inline uint16_t runOuts() const { return _runOuts; }
        inline uint16_t total() const { return (_catches + _stumpings + _runOuts); }

        // position -> count
        QMap<QString, uint16_t> byPosition(const Contribution) const;

    private:
        QString _name;
        uint16_t _catches;
        uint16_t _stumpings;
        uint16_t _runOuts;
        QMap<Contribution, QMap<QString, uint16_t>> _byPosition;
};

#endif // PLAYERSTATS_H
