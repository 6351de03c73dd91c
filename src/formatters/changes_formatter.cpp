#include "jdelta/formatter.hpp"

#include <QJsonArray>
#include <QJsonObject>

namespace jdelta {

namespace {

QJsonArray toArray(const QVector<Change>& changes) {
    QJsonArray out;
    for (const Change& change : changes) {
        out.append(change.toJson());
    }
    return out;
}

}  // namespace

FormatResult Formatter::renderChanges(const ChangeSet& changes) {
    QJsonObject out;
    out.insert("added", toArray(changes.added()));
    out.insert("removed", toArray(changes.removed()));
    out.insert("modified", toArray(changes.modified()));
    return {out, {}};
}

}  // namespace jdelta
