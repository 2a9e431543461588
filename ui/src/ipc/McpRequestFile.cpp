#include "McpRequestFile.hpp"

#include "utils/PathUtils.hpp"

#include <QFile>
#include <QObject>

using hengjing::popup::utils::expandPath;

namespace {
constexpr qint64 kMaxRequestFileBytes = 4 * 1024 * 1024;
}

std::optional<PopupRequest> readMcpRequestFile(const QString& path, QString* errorMessage)
{
    const QString resolved = expandPath(path);
    if (resolved.isEmpty()) {
        if (errorMessage)
            *errorMessage = QObject::tr("No request file given");
        return std::nullopt;
    }

    QFile file(resolved);
    if (!file.open(QIODevice::ReadOnly)) {
        if (errorMessage)
            *errorMessage = QObject::tr("Cannot open request file %1: %2").arg(resolved, file.errorString());
        return std::nullopt;
    }
    if (file.size() > kMaxRequestFileBytes) {
        if (errorMessage)
            *errorMessage = QObject::tr("Request file %1 is too large").arg(resolved);
        return std::nullopt;
    }

    QString parseError;
    auto request = PopupRequest::fromJsonBytes(file.readAll(), &parseError);
    if (!request) {
        if (errorMessage)
            *errorMessage = QObject::tr("Invalid request file %1: %2").arg(resolved, parseError);
        return std::nullopt;
    }
    return request;
}

QString formatMcpStdoutResponse(const PopupResponse& response)
{
    if (response.isCancelled())
        return {};
    return response.toWireString();
}
