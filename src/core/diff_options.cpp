#include "jdelta/diff_options.hpp"

#include <QJsonArray>
#include <QJsonValue>

#include <cmath>
#include <limits>

namespace jdelta {

DiffOptionsResult DiffOptions::fromJson(const QJsonObject& payload) {
    DiffOptionsResult result;
    DiffOptions& options = result.options;

    if (payload.contains("max_depth")) {
        const QJsonValue depth = payload.value("max_depth");
        const double d = depth.toDouble(-1.0);
        if (!depth.isDouble() || d < 1.0 || std::floor(d) != d ||
            d > static_cast<double>(std::numeric_limits<int>::max())) {
            result.error = Error::invalidConfig("max_depth", "must be a positive integer");
            return result;
        }
        options.maxDepth = static_cast<int>(d);
    }

    if (payload.contains("format")) {
        const QJsonValue format = payload.value("format");
        if (!format.isString()) {
            result.error = Error::invalidConfig("format", "must be a string");
            return result;
        }
        options.format = format.toString().trimmed().toLower();
    }

    if (payload.contains("sort")) {
        const QJsonValue sort = payload.value("sort");
        if (!sort.isBool()) {
            result.error = Error::invalidConfig("sort", "must be a boolean");
            return result;
        }
        options.sortKeys = sort.toBool();
    }

    if (payload.contains("ignore")) {
        const QJsonValue ignore = payload.value("ignore");
        if (!ignore.isArray()) {
            result.error = Error::invalidConfig("ignore", "must be an array of strings");
            return result;
        }
        for (const QJsonValue& entry : ignore.toArray()) {
            if (!entry.isString()) {
                result.error = Error::invalidConfig("ignore", "must be an array of strings");
                return result;
            }
            options.ignorePatterns.append(entry.toString());
        }
    }

    return result;
}

QJsonObject DiffOptions::toJson() const {
    return {
        {"max_depth", maxDepth},
        {"format", format},
        {"sort", sortKeys},
        {"ignore", QJsonArray::fromStringList(ignorePatterns)},
    };
}

}  // namespace jdelta
