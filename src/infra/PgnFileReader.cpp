#include "infra/PgnFileReader.hpp"

#include <cstdio>

#include <QFile>

namespace pgnkit::infra {

bool PgnFileReader::readText(const QString& path, std::string* textOut, QString* errorOut) {
    QFile file;
    bool opened = false;
    if (path == QStringLiteral("-")) {
        opened = file.open(stdin, QIODevice::ReadOnly);
    } else {
        file.setFileName(path);
        if (!file.exists()) {
            if (errorOut) *errorOut = QStringLiteral("File not found: %1").arg(path);
            return false;
        }
        opened = file.open(QIODevice::ReadOnly);
    }

    if (!opened) {
        if (errorOut) *errorOut = QStringLiteral("Cannot open %1: %2").arg(path, file.errorString());
        return false;
    }

    const QByteArray bytes = file.readAll();
    if (file.error() != QFileDevice::NoError) {
        if (errorOut) *errorOut = QStringLiteral("Cannot read %1: %2").arg(path, file.errorString());
        return false;
    }

    if (textOut) *textOut = bytes.toStdString();
    return true;
}

} // namespace pgnkit::infra
