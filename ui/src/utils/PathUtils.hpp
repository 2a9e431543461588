#pragma once

#include <QString>

namespace hengjing::popup::utils {

//! Replace $VAR, ${VAR} and %VAR% with their environment values; unknown names are kept as typed.
QString expandEnvironmentPlaceholders(const QString& text);

//! Expand '~', environment placeholders and file: URLs into an absolute, cleaned path.
QString expandPath(const QString& path);

} // namespace hengjing::popup::utils
