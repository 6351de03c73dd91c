#include "jdelta/ignore_filter.hpp"

#include <QJsonArray>
#include <QJsonObject>

#include <algorithm>

namespace jdelta {

namespace {

bool isTruthyLeaf(const QJsonValue& value) {
    return (value.isBool() && value.toBool()) || value.isDouble();
}

void collectPointerPaths(const QJsonObject& object, const QString& prefix, QStringList& out) {
    for (auto it = object.constBegin(); it != object.constEnd(); ++it) {
        const QJsonValue value = it.value();
        const bool nested = value.isObject() && !value.toObject().isEmpty();
        if (!nested && !isTruthyLeaf(value)) {
            continue;
        }
        const QString path = prefix + QLatin1Char('/') + JsonPath::escapePointerToken(it.key());
        if (nested) {
            collectPointerPaths(value.toObject(), path, out);
        } else {
            out.append(path);
        }
    }
}

}  // namespace

IgnoreFilterResult IgnoreFilter::compile(const QStringList& patterns) {
    IgnoreFilterResult result;
    for (const QString& pattern : patterns) {
        if (!pattern.startsWith(QLatin1Char('/'))) {
            result.filter.rendered_.insert(pattern);
            continue;
        }
        const PathParseResult parsed = JsonPath::fromJsonPointer(pattern);
        if (!parsed.success()) {
            result.filter = IgnoreFilter();
            result.error = Error::invalidPattern(pattern, parsed.error.message);
            return result;
        }
        result.filter.rendered_.insert(parsed.path.toString());
    }
    return result;
}

PatternListResult IgnoreFilter::patternsFromJson(const QJsonValue& document) {
    PatternListResult result;

    if (document.isArray()) {
        for (const QJsonValue& entry : document.toArray()) {
            if (!entry.isString()) {
                result.patterns.clear();
                result.error = Error::invalidPattern(
                    QString(),
                    "ignore list entries must be strings");
                return result;
            }
            const QString pattern = entry.toString();
            if (!pattern.startsWith(QLatin1Char('/'))) {
                result.patterns.clear();
                result.error = Error::invalidPattern(pattern, "must start with '/' (JSON Pointer format)");
                return result;
            }
            result.patterns.append(pattern);
        }
        return result;
    }

    if (document.isObject()) {
        collectPointerPaths(document.toObject(), QString(), result.patterns);
        std::sort(result.patterns.begin(), result.patterns.end());
        result.patterns.erase(
            std::unique(result.patterns.begin(), result.patterns.end()),
            result.patterns.end());
        return result;
    }

    result.error = Error::invalidPattern(
        QString(),
        "ignore document must be either a JSON array of strings or a JSON object");
    return result;
}

bool IgnoreFilter::ignores(const JsonPath& path) const {
    return !rendered_.isEmpty() && rendered_.contains(path.toString());
}

QStringList IgnoreFilter::patterns() const {
    QStringList out = rendered_.values();
    std::sort(out.begin(), out.end());
    return out;
}

}  // namespace jdelta
