#pragma once

#include <string>

#include <QString>

namespace pgnkit::infra {

// Reads a PGN file as UTF-8 text. "-" reads standard input.
class PgnFileReader final {
public:
    static bool readText(const QString& path, std::string* textOut, QString* errorOut);
};

} // namespace pgnkit::infra
