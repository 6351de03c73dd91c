#include "jdelta/delta_service.hpp"

#include "jdelta/diff_engine.hpp"
#include "jdelta/formatter.hpp"
#include "jdelta/ignore_filter.hpp"
#include "jdelta/telemetry.hpp"

namespace jdelta {

namespace {

QJsonObject failure(const Error& error, const QString& stage) {
    QJsonObject out = error.toJson();
    out.insert("stage", stage);
    return out;
}

}  // namespace

DeltaService::DeltaService(Telemetry* telemetry) : telemetry_(telemetry) {}

QJsonObject DeltaService::compare(
    const QJsonValue& left,
    const QJsonValue& right,
    const QJsonObject& optionsPayload) const {
    const DiffOptionsResult parsed = DiffOptions::fromJson(optionsPayload);
    if (!parsed.success()) {
        if (telemetry_) {
            telemetry_->incrementCounter("service.invalid_options");
        }
        return failure(parsed.error, "options");
    }
    return compare(left, right, parsed.options);
}

QJsonObject DeltaService::compare(
    const QJsonValue& left,
    const QJsonValue& right,
    const DiffOptions& options) const {
    if (telemetry_) {
        telemetry_->incrementCounter("service.requests");
    }

    const FormatterResult formatter = Formatter::create(options.format, options.sortKeys, telemetry_);
    if (!formatter.success()) {
        return failure(formatter.error, "format");
    }

    const IgnoreFilterResult filter = IgnoreFilter::compile(options.ignorePatterns);
    if (!filter.success()) {
        return failure(filter.error, "ignore");
    }

    const DiffResult diffed = DiffEngine(options, telemetry_).diff(left, right);
    if (!diffed.success()) {
        return failure(diffed.error, "diff");
    }

    const ChangeSet visible = filter.filter.isEmpty()
        ? diffed.changes
        : diffed.changes.filterIgnorePatterns(filter.filter);

    const FormatResult rendered = formatter.formatter.format(visible);
    if (!rendered.success()) {
        return failure(rendered.error, "format");
    }

    QJsonObject out;
    out.insert("success", true);
    out.insert("format", formatter.formatter.name());
    out.insert("output", rendered.output);
    out.insert("summary", visible.summary());
    out.insert("ignored_count", static_cast<double>(diffed.changes.size() - visible.size()));
    return out;
}

}  // namespace jdelta
