#pragma once

#include <QJsonValue>
#include <QString>
#include <QStringList>

#include "jdelta/change_set.hpp"
#include "jdelta/errors.hpp"

namespace jdelta {

class Telemetry;

enum class FormatKind { Changes, Rfc6902, After };

QString formatKindName(FormatKind kind);

struct FormatResult {
    QJsonValue output;
    Error error;

    [[nodiscard]] bool success() const { return !error.isError(); }
};

struct FormatterResult;

class Formatter {
public:
    Formatter() = default;
    explicit Formatter(FormatKind kind, bool sortKeys = false, Telemetry* telemetry = nullptr);

    static FormatterResult create(const QString& name, bool sortKeys, Telemetry* telemetry = nullptr);
    static QStringList validFormatNames();

    FormatResult format(const ChangeSet& changes) const;

    [[nodiscard]] FormatKind kind() const { return kind_; }
    [[nodiscard]] QString name() const { return formatKindName(kind_); }
    // QJsonObject always emits keys in ascending order, so output is key-sorted either way.
    [[nodiscard]] bool sortKeys() const { return sortKeys_; }

private:
    static FormatResult renderChanges(const ChangeSet& changes);
    static FormatResult renderPatch(const ChangeSet& changes);
    static FormatResult renderAfter(const ChangeSet& changes);

    FormatKind kind_ = FormatKind::Changes;
    bool sortKeys_ = false;
    Telemetry* telemetry_ = nullptr;
};

struct FormatterResult {
    Formatter formatter;
    Error error;

    [[nodiscard]] bool success() const { return !error.isError(); }
};

}  // namespace jdelta
