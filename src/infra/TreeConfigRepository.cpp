#include "infra/TreeConfigRepository.hpp"

#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QDebug>

#include "domain/chess_san_to_fen.hpp"

namespace pgnkit::infra {

using pgnkit::domain::TreeOptions;

TreeConfigRepository::TreeConfigRepository(std::string path)
    : path_(std::move(path)) {
}

TreeOptions TreeConfigRepository::load() const {
    const TreeOptions defaults;

    QFile file(QString::fromStdString(path_));
    if (!file.exists()) {
        qWarning() << "Tree config not found, using defaults:" << QString::fromStdString(path_);
        return defaults;
    }

    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qWarning() << "Failed to open tree config, using defaults:" << QString::fromStdString(path_);
        return defaults;
    }

    QJsonParseError parseErr{};
    const auto doc = QJsonDocument::fromJson(file.readAll(), &parseErr);
    if (parseErr.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning() << "Invalid tree config, using defaults:" << parseErr.errorString();
        return defaults;
    }

    const auto o = doc.object();

    TreeOptions options;
    options.defaultResult =
        o.value(QStringLiteral("default_result")).toString(QString::fromStdString(defaults.defaultResult)).toStdString();
    options.permissiveFallback =
        o.value(QStringLiteral("permissive_fallback")).toBool(defaults.permissiveFallback);
    options.reportInvalidMoves =
        o.value(QStringLiteral("report_invalid_moves")).toBool(defaults.reportInvalidMoves);

    if (options.defaultResult.empty()) {
        qWarning() << "Empty default_result in tree config, using" << QString::fromStdString(defaults.defaultResult);
        options.defaultResult = defaults.defaultResult;
    }

    const auto fen = o.value(QStringLiteral("start_fen")).toString().trimmed().toStdString();
    if (!fen.empty()) {
        if (pgnkit::domain::chess::isValidFen(fen)) {
            options.startFen = fen;
        } else {
            qWarning() << "Invalid start_fen in tree config, ignoring:" << QString::fromStdString(fen);
        }
    }

    return options;
}

bool TreeConfigRepository::save(const TreeOptions& options) const {
    QJsonObject root;
    root.insert(QStringLiteral("default_result"),       QString::fromStdString(options.defaultResult));
    root.insert(QStringLiteral("permissive_fallback"),  options.permissiveFallback);
    root.insert(QStringLiteral("report_invalid_moves"), options.reportInvalidMoves);
    if (options.startFen) {
        root.insert(QStringLiteral("start_fen"), QString::fromStdString(*options.startFen));
    }

    QFile file(QString::fromStdString(path_));
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text | QIODevice::Truncate)) {
        qWarning() << "Failed to write tree config:" << QString::fromStdString(path_);
        return false;
    }

    QJsonDocument doc(root);
    const auto bytes = doc.toJson(QJsonDocument::Indented);
    if (file.write(bytes) != bytes.size()) {
        qWarning() << "Short write to tree config:" << QString::fromStdString(path_);
        return false;
    }
    file.close();
    return true;
}

} // namespace pgnkit::infra
