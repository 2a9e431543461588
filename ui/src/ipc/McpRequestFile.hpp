#pragma once

#include <QString>

#include <optional>

#include "models/PopupTypes.hpp"

//! Reads a request written by the MCP host for a one-shot popup (`--mcp-request <file>`).
std::optional<PopupRequest> readMcpRequestFile(const QString& path, QString* errorMessage = nullptr);

//! Text printed on stdout when the one-shot popup closes; empty for a cancelled request.
QString formatMcpStdoutResponse(const PopupResponse& response);
