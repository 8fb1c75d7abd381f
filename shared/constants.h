/*******************************************************************************
 Copyright 2023 Daniel Neuwirth
 This program is distributed under the terms of the GNU General Public License.
*******************************************************************************/

#ifndef CONSTANTS_H
#define CONSTANTS_H

#include <QString>
#include <cstdint>

// sentinel used for every textual field missing in the source record
const struct {

    const QString Value = QStringLiteral("Unknown");

} unknownValue {};

const struct {

    const uint8_t BallsPerOver = 6;
    const uint16_t PowerplayEnd = 6;        // first over (0-indexed) after powerplay
    const uint16_t MiddleEnd = 16;          // first over (0-indexed) of death overs
    const uint16_t PartnershipFloor = 20;   // min. runs for per-bowler breakdown

} cricketDefaults {};

const struct {

    const uint8_t Four = 4;
    const uint8_t Six = 6;

} boundaryRuns {};

#endif // CONSTANTS_H
