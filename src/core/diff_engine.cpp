#include "jdelta/diff_engine.hpp"

#include <QElapsedTimer>

#include "jdelta/json_equality.hpp"
#include "jdelta/telemetry.hpp"

namespace jdelta {

DiffEngine::DiffEngine(int maxDepth, Telemetry* telemetry) : maxDepth_(maxDepth), telemetry_(telemetry) {}

DiffEngine::DiffEngine(const DiffOptions& options, Telemetry* telemetry)
    : DiffEngine(options.maxDepth, telemetry) {}

DiffResult DiffEngine::diff(const QJsonValue& oldValue, const QJsonValue& newValue) const {
    QElapsedTimer elapsed;
    elapsed.start();

    DiffResult result;
    int deepest = 0;
    bool valid = false;
    if (maxDepth_ < 1) {
        result.error = Error::invalidConfig("max_depth", QString("must be a positive integer, got %1").arg(maxDepth_));
    } else {
        valid = measureNesting(oldValue, JsonPath(), deepest, result.error) &&
                measureNesting(newValue, JsonPath(), deepest, result.error);
    }

    if (!valid) {
        if (telemetry_) {
            telemetry_->incrementCounter("diff.failures");
            telemetry_->recordEvent(
                "diff." + errorCodeName(result.error.code),
                {{"path", result.error.path}, {"limit", maxDepth_}});
            telemetry_->recordDurationMs("diff.duration_ms", elapsed.elapsed());
        }
        return result;
    }

    // Both trees are within the limit, so the walk below and jsonEquals stay bounded.
    ChangeSet changes;
    changes.setAfter(newValue);
    compareValues(oldValue, newValue, JsonPath(), changes);

    if (telemetry_) {
        telemetry_->incrementCounter("diff.runs");
        telemetry_->incrementCounter("diff.changes." + changeKindName(ChangeKind::Added), changes.added().size());
        telemetry_->incrementCounter("diff.changes." + changeKindName(ChangeKind::Removed), changes.removed().size());
        telemetry_->incrementCounter("diff.changes." + changeKindName(ChangeKind::Modified), changes.modified().size());
        telemetry_->setGauge("diff.last.nesting", deepest);
        telemetry_->setGauge("diff.last.changes", static_cast<double>(changes.size()));
        telemetry_->recordDurationMs("diff.duration_ms", elapsed.elapsed());
    }
    result.changes = changes;
    return result;
}

// The root container is level 1.
bool DiffEngine::measureNesting(const QJsonValue& value, const JsonPath& path, int& deepest, Error& error) const {
    if (!isContainer(value)) {
        return true;
    }
    const int level = static_cast<int>(path.size()) + 1;
    if (level > maxDepth_) {
        error = Error::depthExceeded(path.toString(), maxDepth_);
        return false;
    }
    deepest = qMax(deepest, level);

    if (value.isObject()) {
        const QJsonObject object = value.toObject();
        for (auto it = object.constBegin(); it != object.constEnd(); ++it) {
            if (!measureNesting(it.value(), path.child(it.key()), deepest, error)) {
                return false;
            }
        }
        return true;
    }

    const QJsonArray array = value.toArray();
    for (qsizetype i = 0; i < array.size(); ++i) {
        if (!measureNesting(array.at(i), path.child(i), deepest, error)) {
            return false;
        }
    }
    return true;
}

void DiffEngine::compareValues(
    const QJsonValue& oldValue,
    const QJsonValue& newValue,
    const JsonPath& path,
    ChangeSet& out) const {
    if (jsonEquals(oldValue, newValue)) {
        return;
    }
    if (!sameContainerKind(oldValue, newValue)) {
        out.push(Change::modified(path, oldValue, newValue));
        return;
    }
    if (oldValue.isObject()) {
        compareObjects(oldValue.toObject(), newValue.toObject(), path, out);
    } else {
        compareArrays(oldValue.toArray(), newValue.toArray(), path, out);
    }
}

void DiffEngine::compareObjects(
    const QJsonObject& oldObject,
    const QJsonObject& newObject,
    const JsonPath& path,
    ChangeSet& out) const {
    for (auto it = newObject.constBegin(); it != newObject.constEnd(); ++it) {
        const JsonPath keyPath = path.child(it.key());
        const auto previous = oldObject.constFind(it.key());
        if (previous == oldObject.constEnd()) {
            out.push(Change::added(keyPath, it.value()));
        } else {
            compareValues(previous.value(), it.value(), keyPath, out);
        }
    }

    for (auto it = oldObject.constBegin(); it != oldObject.constEnd(); ++it) {
        if (!newObject.contains(it.key())) {
            out.push(Change::removed(path.child(it.key()), it.value()));
        }
    }
}

void DiffEngine::compareArrays(
    const QJsonArray& oldArray,
    const QJsonArray& newArray,
    const JsonPath& path,
    ChangeSet& out) const {
    const qsizetype oldSize = oldArray.size();
    const qsizetype newSize = newArray.size();
    const qsizetype count = qMax(oldSize, newSize);

    for (qsizetype i = 0; i < count; ++i) {
        const JsonPath indexPath = path.child(i);
        if (i >= oldSize) {
            out.push(Change::added(indexPath, newArray.at(i)));
        } else if (i >= newSize) {
            out.push(Change::removed(indexPath, oldArray.at(i)));
        } else {
            compareValues(oldArray.at(i), newArray.at(i), indexPath, out);
        }
    }
}

DiffResult diff(const QJsonValue& oldValue, const QJsonValue& newValue, const DiffOptions& options) {
    return DiffEngine(options).diff(oldValue, newValue);
}

}  // namespace jdelta
