#pragma once

#include <QHash>
#include <QJsonArray>
#include <QJsonObject>
#include <QMutex>
#include <QQueue>
#include <QString>

namespace jdelta {

class Telemetry final {
public:
    explicit Telemetry(int maxEvents = 500);

    Telemetry(const Telemetry&) = delete;
    Telemetry& operator=(const Telemetry&) = delete;

    void incrementCounter(const QString& key, qint64 delta = 1);
    void setGauge(const QString& key, double value);
    void recordDurationMs(const QString& key, qint64 durationMs);
    void recordEvent(const QString& type, const QJsonObject& payload = {});

    [[nodiscard]] qint64 counter(const QString& key) const;
    [[nodiscard]] double gauge(const QString& key) const;
    [[nodiscard]] QJsonArray events() const;
    [[nodiscard]] QJsonObject snapshot() const;

private:
    struct Duration {
        qint64 count = 0;
        qint64 totalMs = 0;
        qint64 maxMs = 0;
    };

    mutable QMutex mutex_;
    QHash<QString, qint64> counters_;
    QHash<QString, double> gauges_;
    QHash<QString, Duration> durations_;
    QQueue<QJsonObject> events_;

    int maxEvents_;
};

}  // namespace jdelta
