#pragma once

#include <QJsonObject>
#include <QString>
#include <QStringList>

#include "jdelta/errors.hpp"

namespace jdelta {

struct DiffOptionsResult;

struct DiffOptions {
    static constexpr int kDefaultMaxDepth = 1000;

    int maxDepth = kDefaultMaxDepth;
    QString format = "changes";
    bool sortKeys = false;
    QStringList ignorePatterns;

    static DiffOptionsResult fromJson(const QJsonObject& payload);
    QJsonObject toJson() const;
};

struct DiffOptionsResult {
    DiffOptions options;
    Error error;

    [[nodiscard]] bool success() const { return !error.isError(); }
};

}  // namespace jdelta
