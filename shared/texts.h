/*******************************************************************************
 Copyright 2023 Daniel Neuwirth
 This program is distributed under the terms of the GNU General Public License.
*******************************************************************************/

#ifndef TEXTS_H
#define TEXTS_H

#include <QString>
#include <QStringList>
#include <cstdint>

class StringFunctions {

    public:
        StringFunctions() {}
        ~StringFunctions() {}

        QString wrapInBrackets(const QString &, const QString & = QString(), const bool = true) const;

        // rates are printed with 2 decimal places, percentages with 1
        inline QString rate(const double value) const { return QString::number(value, 'f', 2); }
        inline QString percentage(const double value) const { return QString::number(value, 'f', 1); }

        // "1 catch", "2 catches"
        QString countWithNoun(const uint16_t, const QString &, const QString & = QStringLiteral("s")) const;
        // overs in cricket notation ("4.3" = 4 overs and 3 balls)
        QString oversNotation(const uint16_t, const uint8_t) const;
};

extern const StringFunctions string_functions;

#endif // TEXTS_H
