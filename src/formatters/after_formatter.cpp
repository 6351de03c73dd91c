#include "jdelta/formatter.hpp"

#include <QJsonArray>
#include <QJsonObject>

#include "jdelta/json_equality.hpp"

namespace jdelta {

namespace {

// Copies the part of `source` addressed by segments[from..] into `target`, creating
// intermediate objects on the way. Arrays cannot be sparse, so a path that descends
// into one takes the whole array. Returns false if the path does not exist in `source`.
bool project(
    QJsonValue& target,
    const QJsonValue& source,
    const QVector<PathSegment>& segments,
    qsizetype from) {
    if (from == segments.size()) {
        target = source;
        return true;
    }

    const PathSegment& segment = segments.at(from);
    if (segment.isIndex()) {
        if (!source.isArray() || segment.index >= source.toArray().size()) {
            return false;
        }
        target = source;
        return true;
    }

    if (!source.isObject()) {
        return false;
    }
    const QJsonObject sourceObject = source.toObject();
    const auto found = sourceObject.constFind(segment.key);
    if (found == sourceObject.constEnd()) {
        return false;
    }

    QJsonObject targetObject = target.isObject() ? target.toObject() : QJsonObject();
    QJsonValue child = targetObject.value(segment.key);
    if (!project(child, found.value(), segments, from + 1)) {
        return false;
    }
    targetObject.insert(segment.key, child);
    target = targetObject;
    return true;
}

}  // namespace

FormatResult Formatter::renderAfter(const ChangeSet& changes) {
    const QJsonValue& after = changes.after();
    if (!isContainer(after)) {
        return {after, {}};
    }
    QJsonValue projection = QJsonObject();

    QVector<const Change*> visible;
    visible.reserve(changes.added().size() + changes.modified().size());
    for (const Change& change : changes.added()) {
        visible.append(&change);
    }
    for (const Change& change : changes.modified()) {
        visible.append(&change);
    }

    for (const Change* change : visible) {
        if (change->path.isEmpty()) {
            return {after, {}};
        }
        if (!project(projection, after, change->path.segments(), 0)) {
            const QString path = change->path.toString();
            return {
                QJsonValue(),
                Error::formatFailed(QString("path '%1' is not present in the new document").arg(path), path),
            };
        }
    }
    return {projection, {}};
}

}  // namespace jdelta
