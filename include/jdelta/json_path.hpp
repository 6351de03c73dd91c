#pragma once

#include <QHashFunctions>
#include <QString>
#include <QVector>

#include "jdelta/errors.hpp"

namespace jdelta {

struct PathSegment {
    enum class Kind { Key, Index };

    Kind kind = Kind::Key;
    QString key;
    qsizetype index = 0;

    static PathSegment fromKey(const QString& key) { return {Kind::Key, key, 0}; }
    static PathSegment fromIndex(qsizetype index) { return {Kind::Index, {}, index}; }

    [[nodiscard]] bool isKey() const { return kind == Kind::Key; }
    [[nodiscard]] bool isIndex() const { return kind == Kind::Index; }

    bool operator==(const PathSegment& other) const;
    bool operator!=(const PathSegment& other) const { return !(*this == other); }
};

struct PathParseResult;

// Rendered as "user.tags[0].name"; the root is the empty path and renders as "".
class JsonPath {
public:
    JsonPath() = default;
    explicit JsonPath(const QVector<PathSegment>& segments);

    JsonPath child(const QString& key) const;
    JsonPath child(qsizetype index) const;
    JsonPath child(const PathSegment& segment) const;

    [[nodiscard]] const QVector<PathSegment>& segments() const { return segments_; }
    [[nodiscard]] qsizetype size() const { return segments_.size(); }
    [[nodiscard]] bool isEmpty() const { return segments_.isEmpty(); }
    const PathSegment& last() const { return segments_.last(); }

    JsonPath parent() const;
    bool startsWith(const JsonPath& prefix) const;

    QString toString() const;
    QString toJsonPointer() const;

    bool matches(const QString& pattern) const;

    static PathParseResult parse(const QString& text);
    static PathParseResult fromJsonPointer(const QString& pointer);

    static QString escapePointerToken(const QString& token);
    static QString unescapePointerToken(const QString& token, bool* ok = nullptr);

    bool operator==(const JsonPath& other) const { return segments_ == other.segments_; }
    bool operator!=(const JsonPath& other) const { return !(*this == other); }

private:
    QVector<PathSegment> segments_;
};

struct PathParseResult {
    JsonPath path;
    Error error;

    [[nodiscard]] bool success() const { return !error.isError(); }
};

size_t qHash(const PathSegment& segment, size_t seed = 0);
size_t qHash(const JsonPath& path, size_t seed = 0);

}  // namespace jdelta
