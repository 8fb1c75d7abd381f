/*******************************************************************************
 Copyright 2023 Daniel Neuwirth
 This program is distributed under the terms of the GNU General Public License.
*******************************************************************************/

#include <QStringBuilder>
#include "shared/texts.h"

const StringFunctions string_functions;

QString StringFunctions::wrapInBrackets(const QString & text, const QString & brackets, const bool leadingSpace) const {

    const QString pair = (brackets.length() == 2) ? brackets : QStringLiteral("()");
    const QString space = (leadingSpace) ? QStringLiteral(" ") : QString();

    return (space % pair.at(0) % text % pair.at(1));
}

QString StringFunctions::countWithNoun(const uint16_t count, const QString & noun, const QString & pluralSuffix) const {

    const QString suffix = (count == 1) ? QString() : pluralSuffix;
    return (QString::number(count) % QChar(32) % noun % suffix);
}

QString StringFunctions::oversNotation(const uint16_t validBalls, const uint8_t ballsPerOver) const {

    if (ballsPerOver == 0)
        return QString::number(validBalls);

    return (QString::number(validBalls / ballsPerOver) % QChar('.') % QString::number(validBalls % ballsPerOver));
}
