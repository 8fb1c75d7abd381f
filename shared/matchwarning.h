/*******************************************************************************
 Copyright 2023 Daniel Neuwirth
 This program is distributed under the terms of the GNU General Public License.
*******************************************************************************/

#ifndef MATCHWARNING_H
#define MATCHWARNING_H

#include <QMap>
#include <QString>
#include <cstdint>

// non-fatal anomaly found while aggregating one innings; processing continues
class MatchWarning {

    public:
        enum class WarningType: uint8_t { DELIVERY_WARNING, UNKNOWN_PLAYER_REFERENCE };

        MatchWarning(): MatchWarning(WarningType::DELIVERY_WARNING, 0, -1, 0, QString(), QString()) {}
        MatchWarning(const WarningType type, const uint8_t inningsNo, const int16_t overNo, const uint8_t ballNo,
                     const QString & fieldPath, const QString & message):
            _type(type), _inningsNo(inningsNo), _overNo(overNo), _ballNo(ballNo), _fieldPath(fieldPath), _message(message) {}
        ~MatchWarning() {}

        inline WarningType type() const { return _type; }
        inline uint8_t inningsNo() const { return _inningsNo; }
        inline int16_t overNo() const { return _overNo; }
        inline uint8_t ballNo() const { return _ballNo; }
        inline QString fieldPath() const { return _fieldPath; }
        inline QString message() const { return _message; }

        QString description() const;

    private:
        static const QMap<WarningType, QString> _typeNames;

        WarningType _type;
        uint8_t _inningsNo;
        int16_t _overNo;    // -1 = not related to a specific over
        uint8_t _ballNo;    // 0 = not related to a specific delivery
        QString _fieldPath;
        QString _message;
};

#endif // MATCHWARNING_H
