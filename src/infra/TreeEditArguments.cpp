#include "infra/TreeEditArguments.hpp"

#include <optional>
#include <utility>

namespace pgnkit::infra {

namespace {

bool parsePosition(const QString& s, int* out) {
    bool ok = false;
    const int v = s.trimmed().toInt(&ok);
    if (!ok || v < 0) return false;
    *out = v;
    return true;
}

// Value of the option spelled by arg (consuming the next argument when the
// value is separate), or nullopt when arg is another option.
std::optional<QString> optionValue(const QStringList& args, int& i,
                                   const QString& longName, const QString& shortName) {
    const QString& a = args.at(i);
    if (a == longName || a == shortName) {
        if (i + 1 < args.size()) return args.at(++i);
        return QString();
    }
    if (a.startsWith(longName + QLatin1Char('='))) return a.mid(longName.size() + 1);
    if (a.startsWith(shortName)) {
        QString v = a.mid(shortName.size());
        if (v.startsWith(QLatin1Char('='))) v.remove(0, 1);
        return v;
    }
    return std::nullopt;
}

} // namespace

bool TreeEditArguments::collect(const QStringList& args, std::vector<TreeEdit>* edits, QString* errorOut) {
    for (int i = 1; i < args.size(); ++i) {
        if (args.at(i) == QStringLiteral("--")) break;

        TreeEdit e;
        std::optional<QString> value =
            optionValue(args, i, QStringLiteral("--insert"), QStringLiteral("-i"));
        if (value) {
            e.kind = TreeEdit::Kind::Insert;
        } else {
            value = optionValue(args, i, QStringLiteral("--delete"), QStringLiteral("-d"));
            if (!value) continue;
            e.kind = TreeEdit::Kind::Delete;
        }

        if (e.kind == TreeEdit::Kind::Insert) {
            const int colon = value->indexOf(QLatin1Char(':'));
            if (colon <= 0 || !parsePosition(value->left(colon), &e.position) || colon + 1 >= value->size()) {
                if (errorOut) {
                    *errorOut = QStringLiteral("Bad --insert value '%1', expected <position>:<move>").arg(*value);
                }
                return false;
            }
            e.move = value->mid(colon + 1);
        } else if (!parsePosition(*value, &e.position) || e.position == 0) {
            if (errorOut) {
                *errorOut = QStringLiteral("Bad --delete value '%1', expected a move position").arg(*value);
            }
            return false;
        }
        edits->push_back(std::move(e));
    }
    return true;
}

} // namespace pgnkit::infra
