#include <catch2/catch.hpp>
#include <QFile>
#include <QString>
#include <QTemporaryDir>
#include <string>
#include "app/PgnManager.hpp"
#include "infra/PgnFileReader.hpp"

using pgnkit::infra::PgnFileReader;

TEST_CASE("PgnFileReader reads a file as text", "[PgnFileReader]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());

    const QString path = dir.filePath(QStringLiteral("game.pgn"));
    {
        QFile f(path);
        REQUIRE(f.open(QIODevice::WriteOnly));
        f.write("[Event \"x\"]\n\n1. e4 e5 *\n");
    }

    std::string text;
    QString error;
    REQUIRE(PgnFileReader::readText(path, &text, &error));
    REQUIRE(error.isEmpty());
    REQUIRE(text == "[Event \"x\"]\n\n1. e4 e5 *\n");

    const auto m = pgnkit::app::PgnManager::fromPgn(text);
    REQUIRE(m.has_value());
    REQUIRE(m->moveCount() == 2);
}

TEST_CASE("PgnFileReader reports a missing file", "[PgnFileReader]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());

    std::string text = "unchanged";
    QString error;
    REQUIRE_FALSE(PgnFileReader::readText(dir.filePath(QStringLiteral("absent.pgn")), &text, &error));
    REQUIRE(error.startsWith(QStringLiteral("File not found")));
    REQUIRE(text == "unchanged");
}
