/*******************************************************************************
 Copyright 2023 Daniel Neuwirth
 This program is distributed under the terms of the GNU General Public License.
*******************************************************************************/

#ifndef MATCHLOADER_H
#define MATCHLOADER_H

#include <QPair>
#include <QString>
#include <QStringList>
#include <QVector>
#include "report/matchdocument.h"
#include "settings/settings.h"

// Runs parser, aggregator and renderer over match files. Every file is
// processed independently: a file that fails does not stop the others.
class MatchLoader {

    public:
        // file name, error description
        typedef QPair<QString, QString> Failure;

        explicit MatchLoader(const Settings & settings): _settings(settings) {}
        ~MatchLoader() {}

        // single file, or every *.json file of a directory (sorted by name)
        QStringList matchFiles(const QString &) const;
        MatchDocument loadFile(const QString &) const;

        // returns number of files that failed
        int loadPath(const QString &, QVector<MatchDocument> &, QVector<Failure> &) const;

    private:
        const Settings _settings;
};

#endif // MATCHLOADER_H
