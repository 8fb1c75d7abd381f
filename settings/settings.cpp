/*******************************************************************************
 Copyright 2023 Daniel Neuwirth
 This program is distributed under the terms of the GNU General Public License.
*******************************************************************************/

#include <QFileInfo>
#include <QSettings>
#include <QStringBuilder>
#include <QtDebug>
#include "settings/settings.h"
#include "shared/constants.h"
#include "shared/error.h"

namespace {

    const struct {

        const QString BallsPerOver = QStringLiteral("match/ballsPerOver");
        const QString PowerplayEnd = QStringLiteral("phases/powerplayEnd");
        const QString MiddleEnd = QStringLiteral("phases/middleEnd");
        const QString PartnershipFloor = QStringLiteral("report/partnershipFloor");

    } settingsKey {};

    // reads a non-negative integer not greater than maxValue; absent key returns currentValue
    uint16_t readUnsigned(const QSettings & file, const QString & key, const uint16_t currentValue, const uint16_t maxValue) {

        if (!file.contains(key))
            return currentValue;

        bool converted = false;
        const int value = file.value(key).toInt(&converted);

        if (!converted || value < 0 || value > maxValue)
            throw SettingsException(key % QStringLiteral(" must be an integer between 0 and ") % QString::number(maxValue));

        return static_cast<uint16_t>(value);
    }
}

Settings::Settings(): _ballsPerOver(cricketDefaults.BallsPerOver), _phasePolicy(),
    _partnershipFloor(cricketDefaults.PartnershipFloor), _unknownValue(::unknownValue.Value) {}

void Settings::setPhasePolicy(const PhasePolicy & policy) {

    if (!policy.isValid())
        throw SettingsException(QStringLiteral("powerplay must end before (or where) middle overs end (") %
                                QString::number(policy.powerplayEnd()) % QStringLiteral(" > ") %
                                QString::number(policy.middleEnd()) % QStringLiteral(")"));

    _phasePolicy = policy;
    return;
}

void Settings::setBallsPerOver(const uint8_t ballsPerOver) {

    if (ballsPerOver == 0)
        throw SettingsException(QStringLiteral("number of balls per over must be positive"));

    _ballsPerOver = ballsPerOver;
    return;
}

void Settings::loadFromFile(const QString & fileName) {

    if (!QFileInfo::exists(fileName))
        throw FileOperationFailedException(fileName, QStringLiteral("settings file does not exist"));

    const QSettings file(fileName, QSettings::IniFormat);

    if (file.status() != QSettings::NoError)
        throw SettingsException(QStringLiteral("unable to parse ") % fileName);

    const uint16_t ballsPerOver = readUnsigned(file, settingsKey.BallsPerOver, _ballsPerOver, UINT8_MAX);
    const uint16_t powerplayEnd = readUnsigned(file, settingsKey.PowerplayEnd, _phasePolicy.powerplayEnd(), UINT16_MAX);
    const uint16_t middleEnd = readUnsigned(file, settingsKey.MiddleEnd, _phasePolicy.middleEnd(), UINT16_MAX);
    const uint16_t partnershipFloor =
        readUnsigned(file, settingsKey.PartnershipFloor, _partnershipFloor, UINT16_MAX);

    // all values are validated before any of them is applied
    Settings loaded(*this);
    loaded.setBallsPerOver(static_cast<uint8_t>(ballsPerOver));
    loaded.setPhasePolicy(PhasePolicy(powerplayEnd, middleEnd));
    loaded.setPartnershipFloor(partnershipFloor);
    *this = loaded;

    qDebug() << "settings loaded from" << fileName << "| balls per over:" << static_cast<int>(_ballsPerOver)
             << "| phases:" << _phasePolicy.powerplayEnd() << _phasePolicy.middleEnd()
             << "| partnership floor:" << _partnershipFloor;

    return;
}
