#include "jdelta/formatter.hpp"

#include <QJsonArray>
#include <QJsonObject>

namespace jdelta {

// Operations are emitted as all adds, then all removes, then all replaces. Index-based
// operations on a resized array are not reordered, so the patch is not always replayable
// as-is against the old document.
FormatResult Formatter::renderPatch(const ChangeSet& changes) {
    QJsonArray operations;

    for (const Change& change : changes.added()) {
        operations.append(QJsonObject{
            {"op", "add"},
            {"path", change.path.toJsonPointer()},
            {"value", change.newValue},
        });
    }
    for (const Change& change : changes.removed()) {
        operations.append(QJsonObject{
            {"op", "remove"},
            {"path", change.path.toJsonPointer()},
        });
    }
    for (const Change& change : changes.modified()) {
        operations.append(QJsonObject{
            {"op", "replace"},
            {"path", change.path.toJsonPointer()},
            {"value", change.newValue},
        });
    }

    return {operations, {}};
}

}  // namespace jdelta
