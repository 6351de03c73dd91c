#pragma once

#include <QJsonObject>
#include <QJsonValue>

#include "jdelta/diff_options.hpp"

namespace jdelta {

class Telemetry;

class DeltaService {
public:
    explicit DeltaService(Telemetry* telemetry = nullptr);

    QJsonObject compare(const QJsonValue& left, const QJsonValue& right, const DiffOptions& options) const;
    QJsonObject compare(const QJsonValue& left, const QJsonValue& right, const QJsonObject& optionsPayload) const;

private:
    Telemetry* telemetry_;
};

}  // namespace jdelta
