/*******************************************************************************
 Copyright 2023 Daniel Neuwirth
 This program is distributed under the terms of the GNU General Public License.
*******************************************************************************/

#ifndef ERROR_H
#define ERROR_H

#include <QByteArray>
#include <QString>
#include <exception>

class ReportException: public std::exception {

    public:
        explicit ReportException(const QString & description):
            _description(description), _what(description.toUtf8()) {}
        virtual ~ReportException() {}

        inline QString description() const { return _description; }
        const char * what() const noexcept override { return _what.constData(); }

    private:
        QString _description;
        QByteArray _what;
};

// match structure unusable (missing innings/over/delivery data, invalid values)
class MalformedMatchError: public ReportException {

    public:
        explicit MalformedMatchError(const QString & fieldPath, const QString & reason):
            ReportException(QStringLiteral("malformed match record at '") + fieldPath + QStringLiteral("': ") + reason),
            _fieldPath(fieldPath) {}

        inline QString fieldPath() const { return _fieldPath; }

    private:
        QString _fieldPath;
};

class SettingsException: public ReportException {

    public:
        explicit SettingsException(const QString & description):
            ReportException(QStringLiteral("invalid settings: ") + description) {}
};

class FileOperationFailedException: public ReportException {

    public:
        explicit FileOperationFailedException(const QString & fileName, const QString & reason):
            ReportException(QStringLiteral("file operation failed (") + fileName + QStringLiteral("): ") + reason),
            _fileName(fileName) {}

        inline QString fileName() const { return _fileName; }

    private:
        QString _fileName;
};

#endif // ERROR_H
