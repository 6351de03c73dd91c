#include "jdelta/json_equality.hpp"

#include <QJsonArray>
#include <QJsonObject>

namespace jdelta {

bool jsonEquals(const QJsonValue& left, const QJsonValue& right) {
    if (left.type() != right.type()) {
        return false;
    }

    switch (left.type()) {
    case QJsonValue::Null:
    case QJsonValue::Undefined:
        return true;
    case QJsonValue::Bool:
        return left.toBool() == right.toBool();
    case QJsonValue::Double:
        // QJsonValue keeps integers and doubles apart internally and compares them numerically.
        return left == right;
    case QJsonValue::String:
        return left.toString() == right.toString();
    case QJsonValue::Array: {
        const QJsonArray a = left.toArray();
        const QJsonArray b = right.toArray();
        if (a.size() != b.size()) {
            return false;
        }
        for (qsizetype i = 0; i < a.size(); ++i) {
            if (!jsonEquals(a.at(i), b.at(i))) {
                return false;
            }
        }
        return true;
    }
    case QJsonValue::Object: {
        const QJsonObject a = left.toObject();
        const QJsonObject b = right.toObject();
        if (a.size() != b.size()) {
            return false;
        }
        for (auto it = a.constBegin(); it != a.constEnd(); ++it) {
            const auto other = b.constFind(it.key());
            if (other == b.constEnd() || !jsonEquals(it.value(), other.value())) {
                return false;
            }
        }
        return true;
    }
    }
    return false;
}

}  // namespace jdelta
