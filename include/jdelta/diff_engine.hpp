#pragma once

#include <QJsonArray>
#include <QJsonObject>
#include <QJsonValue>

#include "jdelta/change_set.hpp"
#include "jdelta/diff_options.hpp"
#include "jdelta/errors.hpp"
#include "jdelta/json_path.hpp"

namespace jdelta {

class Telemetry;

struct DiffResult {
    ChangeSet changes;
    Error error;

    [[nodiscard]] bool success() const { return !error.isError(); }
};

class DiffEngine {
public:
    explicit DiffEngine(int maxDepth = DiffOptions::kDefaultMaxDepth, Telemetry* telemetry = nullptr);
    explicit DiffEngine(const DiffOptions& options, Telemetry* telemetry = nullptr);

    DiffResult diff(const QJsonValue& oldValue, const QJsonValue& newValue) const;

    [[nodiscard]] int maxDepth() const { return maxDepth_; }

private:
    bool measureNesting(const QJsonValue& value, const JsonPath& path, int& deepest, Error& error) const;
    void compareValues(const QJsonValue& oldValue, const QJsonValue& newValue, const JsonPath& path, ChangeSet& out) const;
    void compareObjects(
        const QJsonObject& oldObject,
        const QJsonObject& newObject,
        const JsonPath& path,
        ChangeSet& out) const;
    void compareArrays(const QJsonArray& oldArray, const QJsonArray& newArray, const JsonPath& path, ChangeSet& out) const;

    int maxDepth_;
    Telemetry* telemetry_;
};

DiffResult diff(const QJsonValue& oldValue, const QJsonValue& newValue, const DiffOptions& options = {});

}  // namespace jdelta
