#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QString>
#include <QStringList>
#include <QTextStream>

#include <string>
#include <vector>

#include "app/PgnManager.hpp"
#include "domain/domain_model.hpp"
#include "infra/PgnFileReader.hpp"
#include "infra/TreeConfigRepository.hpp"
#include "infra/TreeEditArguments.hpp"

namespace {

void printMoveList(const pgnkit::app::PgnManager& manager, QTextStream& out) {
    using pgnkit::domain::Side;
    for (int n = 1; n <= static_cast<int>(manager.moveCount()); ++n) {
        const auto id = manager.moveAt(n);
        if (!id.ok) break;
        const auto* node = manager.move(id.value);
        const auto color = manager.colorOf(id.value);
        const auto fen = manager.fenOf(id.value);
        const auto parent = manager.parentVariationOf(id.value);

        QString depth = QStringLiteral("main");
        if (parent.ok && parent.value) depth = QStringLiteral("var%1").arg(parent.value->index);

        out << n << '\t'
            << (color.ok && color.value == Side::Black ? "b" : "w") << '\t'
            << depth << '\t'
            << QString::fromStdString(node ? node->san : std::string()) << '\t'
            << QString::fromStdString(fen.ok ? fen.value : std::string()) << '\n';
    }
}

} // namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("pgnkit"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Navigate and edit the move tree of a PGN game."));
    parser.addHelpOption();

    const QCommandLineOption configOpt({QStringLiteral("c"), QStringLiteral("config")},
                                       QStringLiteral("JSON options file."), QStringLiteral("file"));
    const QCommandLineOption insertOpt({QStringLiteral("i"), QStringLiteral("insert")},
                                       QStringLiteral("Insert a move after the move at a position (0 = start)."),
                                       QStringLiteral("pos:move"));
    const QCommandLineOption deleteOpt({QStringLiteral("d"), QStringLiteral("delete")},
                                       QStringLiteral("Delete the move at a position and the rest of its line."),
                                       QStringLiteral("pos"));
    const QCommandLineOption listOpt({QStringLiteral("l"), QStringLiteral("list")},
                                     QStringLiteral("Print the linearized move list instead of the PGN."));
    const QCommandLineOption verboseOpt({QStringLiteral("v"), QStringLiteral("verbose")},
                                        QStringLiteral("Log progress."));
    parser.addOption(configOpt);
    parser.addOption(insertOpt);
    parser.addOption(deleteOpt);
    parser.addOption(listOpt);
    parser.addOption(verboseOpt);
    parser.addPositionalArgument(QStringLiteral("pgn"), QStringLiteral("PGN file, or - for standard input."));

    parser.process(app);

    const QStringList positional = parser.positionalArguments();
    if (positional.size() != 1) {
        qWarning().noquote() << "Expected exactly one PGN file";
        parser.showHelp(2);
    }
    const bool verbose = parser.isSet(verboseOpt);

    std::vector<pgnkit::infra::TreeEdit> edits;
    QString editError;
    if (!pgnkit::infra::TreeEditArguments::collect(QCoreApplication::arguments(), &edits, &editError)) {
        qWarning().noquote() << editError;
        return 2;
    }

    pgnkit::domain::TreeOptions options;
    if (parser.isSet(configOpt)) {
        pgnkit::infra::TreeConfigRepository configRepo(parser.value(configOpt).toStdString());
        options = configRepo.load();
        if (verbose) qDebug() << "Tree config path:" << parser.value(configOpt);
    }

    std::string text;
    QString readError;
    if (!pgnkit::infra::PgnFileReader::readText(positional.first(), &text, &readError)) {
        qWarning().noquote() << readError;
        return 1;
    }

    pgnkit::app::PgnManagerCallbacks cb;
    cb.onInvalidMove = [](const pgnkit::app::InvalidMoveReport& r) {
        qWarning().noquote() << "Invalid move" << QString::fromStdString(r.san)
                             << "at" << QString::fromStdString(r.fenBefore)
                             << ":" << QString::fromStdString(r.error);
    };
    cb.onInvalidStartPosition = [](const std::string& fen, const std::string& error) {
        qWarning().noquote() << "Unusable start position" << QString::fromStdString(fen)
                             << ":" << QString::fromStdString(error) << "- using the standard start";
    };
    if (verbose) {
        cb.onTreeChanged = []() { qDebug() << "Move tree changed"; };
    }

    std::string parseError;
    auto manager = pgnkit::app::PgnManager::fromPgn(text, options, cb, &parseError);
    if (!manager) {
        qWarning().noquote() << "Cannot parse" << positional.first() << ":" << QString::fromStdString(parseError);
        return 1;
    }
    if (verbose) qDebug() << "Loaded" << manager->moveCount() << "moves";

    for (const auto& e : edits) {
        if (e.kind == pgnkit::infra::TreeEdit::Kind::Insert) {
            const auto r = manager->insert(e.position, e.move.toStdString());
            if (!r.ok) {
                qWarning().noquote() << "Insert" << e.move << "after" << e.position << "failed:"
                                     << QString::fromStdString(r.error);
                return 1;
            }
            if (verbose) qDebug() << "Inserted" << e.move << "at position" << manager->orderOf(r.value);
        } else {
            const auto r = manager->remove(e.position);
            if (!r.ok) {
                qWarning().noquote() << "Delete at" << e.position << "failed:" << QString::fromStdString(r.error);
                return 1;
            }
        }
    }

    QTextStream out(stdout);
    if (parser.isSet(listOpt)) {
        printMoveList(*manager, out);
    } else {
        out << QString::fromStdString(manager->pgn()) << '\n';
    }
    out.flush();

    return 0;
}
