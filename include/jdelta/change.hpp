#pragma once

#include <QJsonObject>
#include <QJsonValue>
#include <QString>

#include "jdelta/json_path.hpp"

namespace jdelta {

enum class ChangeKind { Added, Removed, Modified };

QString changeKindName(ChangeKind kind);

struct Change {
    ChangeKind kind = ChangeKind::Added;
    JsonPath path;
    QJsonValue oldValue;
    QJsonValue newValue;

    static Change added(const JsonPath& path, const QJsonValue& value);
    static Change removed(const JsonPath& path, const QJsonValue& value);
    static Change modified(const JsonPath& path, const QJsonValue& oldValue, const QJsonValue& newValue);

    QJsonValue value() const;

    QJsonObject toJson() const;

    bool operator==(const Change& other) const;
    bool operator!=(const Change& other) const { return !(*this == other); }
};

}  // namespace jdelta
