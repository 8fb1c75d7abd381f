/*******************************************************************************
 Copyright 2023 Daniel Neuwirth
 This program is distributed under the terms of the GNU General Public License.
*******************************************************************************/

#include <QStringBuilder>
#include "shared/matchwarning.h"

const QMap<MatchWarning::WarningType, QString> MatchWarning::_typeNames {

    { MatchWarning::WarningType::DELIVERY_WARNING, QStringLiteral("DeliveryWarning") },
    { MatchWarning::WarningType::UNKNOWN_PLAYER_REFERENCE, QStringLiteral("UnknownPlayerReference") }
};

QString MatchWarning::description() const {

    QString location = QStringLiteral("innings ") % QString::number(_inningsNo);

    if (_overNo >= 0)
        location += QStringLiteral(", over ") % QString::number(_overNo);
    if (_ballNo > 0)
        location += QStringLiteral(", ball ") % QString::number(_ballNo);

    return (_typeNames.value(_type, QStringLiteral("Warning")) % QStringLiteral(" [") % location %
            QStringLiteral("] ") % _fieldPath % QStringLiteral(": ") % _message);
}
