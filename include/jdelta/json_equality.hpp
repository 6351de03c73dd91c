#pragma once

#include <QJsonValue>

namespace jdelta {

bool jsonEquals(const QJsonValue& left, const QJsonValue& right);

[[nodiscard]] inline bool isContainer(const QJsonValue& value) {
    return value.isObject() || value.isArray();
}

[[nodiscard]] inline bool sameContainerKind(const QJsonValue& left, const QJsonValue& right) {
    return (left.isObject() && right.isObject()) || (left.isArray() && right.isArray());
}

}  // namespace jdelta
