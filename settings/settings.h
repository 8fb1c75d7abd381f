/*******************************************************************************
 Copyright 2023 Daniel Neuwirth
 This program is distributed under the terms of the GNU General Public License.
*******************************************************************************/

#ifndef SETTINGS_H
#define SETTINGS_H

#include <QString>
#include <cstdint>
#include "stats/phase.h"

class Settings {

    public:
        Settings();
        ~Settings() {}

        inline uint8_t ballsPerOver() const { return _ballsPerOver; }
        inline const PhasePolicy & phasePolicy() const { return _phasePolicy; }
        inline uint16_t partnershipFloor() const { return _partnershipFloor; }
        inline QString unknownValue() const { return _unknownValue; }

        void setPhasePolicy(const PhasePolicy &);
        void setBallsPerOver(const uint8_t);
        inline void setPartnershipFloor(const uint16_t floor) { _partnershipFloor = floor; return; }

        // keys not present in the file keep their current values
        void loadFromFile(const QString &);

    private:
        uint8_t _ballsPerOver;
        PhasePolicy _phasePolicy;
        uint16_t _partnershipFloor;
        QString _unknownValue;
};

#endif // SETTINGS_H
