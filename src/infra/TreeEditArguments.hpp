#pragma once

#include <vector>

#include <QString>
#include <QStringList>

namespace pgnkit::infra {

struct TreeEdit {
    enum class Kind { Insert, Delete };
    Kind    kind{Kind::Insert};
    int     position{0};
    QString move; // Insert only
};

// Collects --insert <pos>:<move> and --delete <pos> edits in command-line
// order. QCommandLineParser groups values per option, so the raw argument
// list is scanned instead. Accepted spellings per option:
//   --insert v   --insert=v   -i v   -i=v   -iv
// Scanning stops at "--".
class TreeEditArguments final {
public:
    static bool collect(const QStringList& args, std::vector<TreeEdit>* edits, QString* errorOut);
};

} // namespace pgnkit::infra
