#include "jdelta/formatter.hpp"

#include <QElapsedTimer>

#include "jdelta/telemetry.hpp"

namespace jdelta {

QString formatKindName(FormatKind kind) {
    switch (kind) {
    case FormatKind::Changes:
        return "changes";
    case FormatKind::Rfc6902:
        return "rfc6902";
    case FormatKind::After:
        return "after";
    }
    return {};
}

Formatter::Formatter(FormatKind kind, bool sortKeys, Telemetry* telemetry)
    : kind_(kind), sortKeys_(sortKeys), telemetry_(telemetry) {}

QStringList Formatter::validFormatNames() {
    return {"changes", "after", "rfc6902"};
}

FormatterResult Formatter::create(const QString& name, bool sortKeys, Telemetry* telemetry) {
    FormatterResult result;
    const QString key = name.trimmed().toLower();
    if (key == "changes") {
        result.formatter = Formatter(FormatKind::Changes, sortKeys, telemetry);
    } else if (key == "rfc6902") {
        result.formatter = Formatter(FormatKind::Rfc6902, sortKeys, telemetry);
    } else if (key == "after") {
        result.formatter = Formatter(FormatKind::After, sortKeys, telemetry);
    } else {
        result.error = Error::unknownFormat(name, validFormatNames().join(", "));
        if (telemetry) {
            telemetry->incrementCounter("format.unknown");
            telemetry->recordEvent("format.unknown", {{"name", name}});
        }
    }
    return result;
}

FormatResult Formatter::format(const ChangeSet& changes) const {
    QElapsedTimer elapsed;
    elapsed.start();

    FormatResult result;
    switch (kind_) {
    case FormatKind::Changes:
        result = renderChanges(changes);
        break;
    case FormatKind::Rfc6902:
        result = renderPatch(changes);
        break;
    case FormatKind::After:
        result = renderAfter(changes);
        break;
    }

    if (telemetry_) {
        const QString prefix = "format." + name();
        telemetry_->incrementCounter(result.success() ? prefix + ".count" : prefix + ".failures");
        telemetry_->recordDurationMs(prefix + ".duration_ms", elapsed.elapsed());
        if (!result.success()) {
            telemetry_->recordEvent("format.failed", result.error.toJson());
        }
    }
    return result;
}

}  // namespace jdelta
