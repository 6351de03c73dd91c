#include "jdelta/errors.hpp"

namespace jdelta {

QString errorCodeName(ErrorCode code) {
    switch (code) {
    case ErrorCode::None:
        return "none";
    case ErrorCode::DepthExceeded:
        return "depth_exceeded";
    case ErrorCode::UnknownFormat:
        return "unknown_format";
    case ErrorCode::FormatFailed:
        return "format_failed";
    case ErrorCode::InvalidPath:
        return "invalid_path";
    case ErrorCode::InvalidPattern:
        return "invalid_pattern";
    case ErrorCode::InvalidConfig:
        return "invalid_config";
    }
    return "unknown";
}

Error Error::depthExceeded(const QString& path, int limit) {
    const QString where = path.isEmpty() ? QStringLiteral("<root>") : path;
    return {
        ErrorCode::DepthExceeded,
        QString("JSON depth exceeded at '%1': nesting exceeds limit %2").arg(where).arg(limit),
        path,
    };
}

Error Error::unknownFormat(const QString& name, const QString& validNames) {
    return {
        ErrorCode::UnknownFormat,
        QString("Unknown format '%1'. Valid formats are: %2").arg(name, validNames),
        {},
    };
}

Error Error::formatFailed(const QString& message, const QString& path) {
    return {ErrorCode::FormatFailed, QString("Formatter error: %1").arg(message), path};
}

Error Error::invalidPath(const QString& input, const QString& reason) {
    return {ErrorCode::InvalidPath, QString("Invalid path '%1': %2").arg(input, reason), input};
}

Error Error::invalidPattern(const QString& pattern, const QString& reason) {
    return {
        ErrorCode::InvalidPattern,
        QString("Invalid ignore pattern '%1': %2").arg(pattern, reason),
        pattern,
    };
}

Error Error::invalidConfig(const QString& key, const QString& reason) {
    return {ErrorCode::InvalidConfig, QString("Invalid option '%1': %2").arg(key, reason), {}};
}

QJsonObject Error::toJson() const {
    QJsonObject out{
        {"success", false},
        {"error", message},
        {"code", errorCodeName(code)},
    };
    if (!path.isEmpty()) {
        out.insert("path", path);
    }
    return out;
}

}  // namespace jdelta
