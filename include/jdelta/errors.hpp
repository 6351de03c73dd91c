#pragma once

#include <QJsonObject>
#include <QString>

namespace jdelta {

enum class ErrorCode {
    None,
    DepthExceeded,
    UnknownFormat,
    FormatFailed,
    InvalidPath,
    InvalidPattern,
    InvalidConfig,
};

QString errorCodeName(ErrorCode code);

struct Error {
    ErrorCode code = ErrorCode::None;
    QString message;
    QString path;

    [[nodiscard]] bool isError() const { return code != ErrorCode::None; }

    static Error depthExceeded(const QString& path, int limit);
    static Error unknownFormat(const QString& name, const QString& validNames);
    static Error formatFailed(const QString& message, const QString& path = {});
    static Error invalidPath(const QString& input, const QString& reason);
    static Error invalidPattern(const QString& pattern, const QString& reason);
    static Error invalidConfig(const QString& key, const QString& reason);

    QJsonObject toJson() const;
};

}  // namespace jdelta
