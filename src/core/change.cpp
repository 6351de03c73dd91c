#include "jdelta/change.hpp"

#include "jdelta/json_equality.hpp"

namespace jdelta {

QString changeKindName(ChangeKind kind) {
    switch (kind) {
    case ChangeKind::Added:
        return "added";
    case ChangeKind::Removed:
        return "removed";
    case ChangeKind::Modified:
        return "modified";
    }
    return {};
}

Change Change::added(const JsonPath& path, const QJsonValue& value) {
    return {ChangeKind::Added, path, QJsonValue(), value};
}

Change Change::removed(const JsonPath& path, const QJsonValue& value) {
    return {ChangeKind::Removed, path, value, QJsonValue()};
}

Change Change::modified(const JsonPath& path, const QJsonValue& oldValue, const QJsonValue& newValue) {
    return {ChangeKind::Modified, path, oldValue, newValue};
}

QJsonValue Change::value() const {
    return kind == ChangeKind::Removed ? oldValue : newValue;
}

QJsonObject Change::toJson() const {
    QJsonObject out;
    out.insert("path", path.toString());
    switch (kind) {
    case ChangeKind::Added:
        out.insert("value", newValue);
        break;
    case ChangeKind::Removed:
        out.insert("value", oldValue);
        break;
    case ChangeKind::Modified:
        out.insert("old_value", oldValue);
        out.insert("new_value", newValue);
        break;
    }
    return out;
}

bool Change::operator==(const Change& other) const {
    return kind == other.kind && path == other.path && jsonEquals(oldValue, other.oldValue) &&
           jsonEquals(newValue, other.newValue);
}

}  // namespace jdelta
