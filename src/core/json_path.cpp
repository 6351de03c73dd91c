#include "jdelta/json_path.hpp"

#include <QStringList>

namespace jdelta {

namespace {

bool isAllDigits(const QString& text) {
    if (text.isEmpty()) {
        return false;
    }
    for (const QChar c : text) {
        if (c.unicode() < u'0' || c.unicode() > u'9') {
            return false;
        }
    }
    return true;
}

}  // namespace

bool PathSegment::operator==(const PathSegment& other) const {
    if (kind != other.kind) {
        return false;
    }
    return kind == Kind::Key ? key == other.key : index == other.index;
}

JsonPath::JsonPath(const QVector<PathSegment>& segments) : segments_(segments) {}

JsonPath JsonPath::child(const QString& key) const {
    return child(PathSegment::fromKey(key));
}

JsonPath JsonPath::child(qsizetype index) const {
    return child(PathSegment::fromIndex(index));
}

JsonPath JsonPath::child(const PathSegment& segment) const {
    QVector<PathSegment> extended;
    extended.reserve(segments_.size() + 1);
    extended.append(segments_);
    extended.append(segment);
    return JsonPath(extended);
}

JsonPath JsonPath::parent() const {
    if (segments_.size() <= 1) {
        return {};
    }
    return JsonPath(segments_.mid(0, segments_.size() - 1));
}

bool JsonPath::startsWith(const JsonPath& prefix) const {
    if (prefix.size() > size()) {
        return false;
    }
    for (qsizetype i = 0; i < prefix.size(); ++i) {
        if (segments_[i] != prefix.segments_[i]) {
            return false;
        }
    }
    return true;
}

QString JsonPath::toString() const {
    QString out;
    for (qsizetype i = 0; i < segments_.size(); ++i) {
        const PathSegment& segment = segments_[i];
        if (segment.isIndex()) {
            out += QString("[%1]").arg(segment.index);
            continue;
        }
        if (i > 0) {
            out += QLatin1Char('.');
        }
        out += segment.key;
    }
    return out;
}

QString JsonPath::toJsonPointer() const {
    QString out;
    for (const PathSegment& segment : segments_) {
        out += QLatin1Char('/');
        out += segment.isIndex() ? QString::number(segment.index) : escapePointerToken(segment.key);
    }
    return out;
}

bool JsonPath::matches(const QString& pattern) const {
    return toString() == pattern;
}

PathParseResult JsonPath::parse(const QString& text) {
    PathParseResult result;
    if (text.trimmed().isEmpty()) {
        return result;
    }

    QVector<PathSegment> segments;
    QString current;
    const qsizetype n = text.size();
    qsizetype i = 0;

    const auto flushKey = [&]() {
        if (!current.isEmpty()) {
            segments.append(PathSegment::fromKey(current));
            current.clear();
        }
    };

    while (i < n) {
        const QChar c = text.at(i);
        if (c == QLatin1Char('.')) {
            flushKey();
            ++i;
            continue;
        }
        if (c == QLatin1Char(']')) {
            result.error = Error::invalidPath(text, QString("unexpected ']' at position %1").arg(i));
            return result;
        }
        if (c != QLatin1Char('[')) {
            current += c;
            ++i;
            continue;
        }

        flushKey();
        const qsizetype close = text.indexOf(QLatin1Char(']'), i + 1);
        if (close < 0) {
            result.error = Error::invalidPath(text, QString("unclosed bracket at position %1").arg(i));
            return result;
        }
        const QString digits = text.mid(i + 1, close - i - 1);
        bool ok = false;
        const qlonglong index = digits.toLongLong(&ok);
        if (!isAllDigits(digits) || !ok) {
            result.error = Error::invalidPath(
                text,
                QString("invalid array index '%1' at position %2").arg(digits).arg(i + 1));
            return result;
        }
        segments.append(PathSegment::fromIndex(static_cast<qsizetype>(index)));
        i = close + 1;
    }
    flushKey();

    if (segments.isEmpty()) {
        result.error = Error::invalidPath(text, "path has no segments");
        return result;
    }
    result.path = JsonPath(segments);
    return result;
}

PathParseResult JsonPath::fromJsonPointer(const QString& pointer) {
    PathParseResult result;
    if (pointer.isEmpty()) {
        return result;
    }
    if (!pointer.startsWith(QLatin1Char('/'))) {
        result.error = Error::invalidPath(pointer, "JSON Pointer must start with '/'");
        return result;
    }

    QVector<PathSegment> segments;
    const QStringList tokens = pointer.mid(1).split(QLatin1Char('/'));
    for (const QString& token : tokens) {
        bool ok = true;
        const QString decoded = unescapePointerToken(token, &ok);
        if (!ok) {
            result.error = Error::invalidPath(pointer, QString("bad escape in token '%1'").arg(token));
            return result;
        }
        bool isNumber = false;
        const qlonglong index = decoded.toLongLong(&isNumber);
        if (isAllDigits(decoded) && isNumber) {
            segments.append(PathSegment::fromIndex(static_cast<qsizetype>(index)));
        } else {
            segments.append(PathSegment::fromKey(decoded));
        }
    }
    result.path = JsonPath(segments);
    return result;
}

QString JsonPath::escapePointerToken(const QString& token) {
    QString out = token;
    out.replace(QLatin1Char('~'), QStringLiteral("~0"));
    out.replace(QLatin1Char('/'), QStringLiteral("~1"));
    return out;
}

QString JsonPath::unescapePointerToken(const QString& token, bool* ok) {
    QString out;
    out.reserve(token.size());
    bool valid = true;
    for (qsizetype i = 0; i < token.size(); ++i) {
        const QChar c = token.at(i);
        if (c != QLatin1Char('~')) {
            out += c;
            continue;
        }
        const QChar next = i + 1 < token.size() ? token.at(i + 1) : QChar();
        if (next == QLatin1Char('0')) {
            out += QLatin1Char('~');
        } else if (next == QLatin1Char('1')) {
            out += QLatin1Char('/');
        } else {
            valid = false;
            break;
        }
        ++i;
    }
    if (ok) {
        *ok = valid;
    }
    return valid ? out : QString();
}

size_t qHash(const PathSegment& segment, size_t seed) {
    if (segment.isKey()) {
        return ::qHash(segment.key, seed);
    }
    return ::qHash(static_cast<qint64>(segment.index), seed ^ 0x9e37u);
}

size_t qHash(const JsonPath& path, size_t seed) {
    return qHashRange(path.segments().cbegin(), path.segments().cend(), seed);
}

}  // namespace jdelta
