#pragma once

#include <QJsonValue>
#include <QSet>
#include <QString>
#include <QStringList>

#include "jdelta/change.hpp"
#include "jdelta/errors.hpp"
#include "jdelta/json_path.hpp"

namespace jdelta {

struct IgnoreFilterResult;

struct PatternListResult {
    QStringList patterns;
    Error error;

    [[nodiscard]] bool success() const { return !error.isError(); }
};

// Exact match only: ignoring "address" leaves "address.city" visible.
class IgnoreFilter {
public:
    IgnoreFilter() = default;

    static IgnoreFilterResult compile(const QStringList& patterns);

    static PatternListResult patternsFromJson(const QJsonValue& document);

    bool ignores(const JsonPath& path) const;
    bool ignores(const Change& change) const { return ignores(change.path); }

    [[nodiscard]] bool isEmpty() const { return rendered_.isEmpty(); }
    [[nodiscard]] qsizetype size() const { return rendered_.size(); }
    QStringList patterns() const;

private:
    QSet<QString> rendered_;
};

struct IgnoreFilterResult {
    IgnoreFilter filter;
    Error error;

    [[nodiscard]] bool success() const { return !error.isError(); }
};

}  // namespace jdelta
