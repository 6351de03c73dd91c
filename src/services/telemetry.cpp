#include "jdelta/telemetry.hpp"

#include <QDateTime>
#include <QMutexLocker>

namespace jdelta {

Telemetry::Telemetry(int maxEvents) : maxEvents_(qMax(1, maxEvents)) {}

void Telemetry::incrementCounter(const QString& key, qint64 delta) {
    QMutexLocker lock(&mutex_);
    counters_[key] += delta;
}

void Telemetry::setGauge(const QString& key, double value) {
    QMutexLocker lock(&mutex_);
    gauges_.insert(key, value);
}

void Telemetry::recordDurationMs(const QString& key, qint64 durationMs) {
    QMutexLocker lock(&mutex_);
    Duration& duration = durations_[key];
    ++duration.count;
    duration.totalMs += durationMs;
    duration.maxMs = qMax(duration.maxMs, durationMs);
}

void Telemetry::recordEvent(const QString& type, const QJsonObject& payload) {
    const QDateTime now = QDateTime::currentDateTimeUtc();
    QJsonObject event = payload;
    event.insert("type", type);
    event.insert("timestamp_utc", now.toString(Qt::ISODateWithMs));
    event.insert("epoch_ms", static_cast<double>(now.toMSecsSinceEpoch()));

    QMutexLocker lock(&mutex_);
    events_.enqueue(event);
    while (events_.size() > maxEvents_) {
        events_.dequeue();
    }
}

qint64 Telemetry::counter(const QString& key) const {
    QMutexLocker lock(&mutex_);
    return counters_.value(key, 0);
}

double Telemetry::gauge(const QString& key) const {
    QMutexLocker lock(&mutex_);
    return gauges_.value(key, 0.0);
}

QJsonArray Telemetry::events() const {
    QMutexLocker lock(&mutex_);
    QJsonArray out;
    for (const QJsonObject& event : events_) {
        out.append(event);
    }
    return out;
}

QJsonObject Telemetry::snapshot() const {
    QMutexLocker lock(&mutex_);

    QJsonObject counters;
    for (auto it = counters_.constBegin(); it != counters_.constEnd(); ++it) {
        counters.insert(it.key(), static_cast<double>(it.value()));
    }

    QJsonObject gauges;
    for (auto it = gauges_.constBegin(); it != gauges_.constEnd(); ++it) {
        gauges.insert(it.key(), it.value());
    }

    QJsonObject durations;
    for (auto it = durations_.constBegin(); it != durations_.constEnd(); ++it) {
        const Duration& d = it.value();
        durations.insert(it.key(), QJsonObject{
            {"count", static_cast<double>(d.count)},
            {"total_ms", static_cast<double>(d.totalMs)},
            {"max_ms", static_cast<double>(d.maxMs)},
            {"avg_ms", static_cast<double>(d.totalMs) / static_cast<double>(d.count)},
        });
    }

    return {
        {"counters", counters},
        {"gauges", gauges},
        {"durations", durations},
        {"event_count", static_cast<double>(events_.size())},
    };
}

}  // namespace jdelta
