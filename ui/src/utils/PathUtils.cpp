#include "PathUtils.hpp"

#include <QByteArray>
#include <QDir>
#include <QFileInfo>
#include <QUrl>
#include <QtGlobal>

namespace {

bool lookupVariable(const QString& name, QString* value)
{
    if (name.isEmpty())
        return false;
    const QByteArray key = name.toUtf8();
    if (!qEnvironmentVariableIsSet(key.constData()))
        return false;
    *value = qEnvironmentVariable(key.constData());
    return true;
}

int identifierEnd(const QString& text, int from)
{
    int end = from;
    while (end < text.size() && (text.at(end).isLetterOrNumber() || text.at(end) == QLatin1Char('_')))
        ++end;
    return end;
}

} // namespace

namespace hengjing::popup::utils {

QString expandEnvironmentPlaceholders(const QString& text)
{
    QString result;
    result.reserve(text.size());

    int index = 0;
    while (index < text.size()) {
        const QChar ch = text.at(index);
        int consumed = 0;
        QString name;

        if (ch == QLatin1Char('$') && index + 1 < text.size() && text.at(index + 1) == QLatin1Char('{')) {
            const int close = text.indexOf(QLatin1Char('}'), index + 2);
            if (close > index + 2) {
                name = text.mid(index + 2, close - index - 2);
                consumed = close - index + 1;
            }
        } else if (ch == QLatin1Char('$')) {
            const int end = identifierEnd(text, index + 1);
            if (end > index + 1) {
                name = text.mid(index + 1, end - index - 1);
                consumed = end - index;
            }
        } else if (ch == QLatin1Char('%')) {
            const int close = text.indexOf(QLatin1Char('%'), index + 1);
            if (close > index + 1) {
                name = text.mid(index + 1, close - index - 1);
                consumed = close - index + 1;
            }
        }

        if (consumed == 0) {
            result.append(ch);
            ++index;
            continue;
        }

        QString value;
        if (lookupVariable(name, &value))
            result.append(value);
        else
            result.append(text.mid(index, consumed));
        index += consumed;
    }
    return result;
}

QString expandPath(const QString& path)
{
    const QString trimmed = path.trimmed();
    if (trimmed.isEmpty())
        return {};

    QString expanded = expandEnvironmentPlaceholders(trimmed);

    if (expanded.startsWith(QStringLiteral("file:"), Qt::CaseInsensitive)) {
        const QUrl url(expanded);
        if (url.isLocalFile() && !url.toLocalFile().isEmpty())
            expanded = url.toLocalFile();
    }

    if (expanded == QStringLiteral("~"))
        expanded = QDir::homePath();
    else if (expanded.startsWith(QStringLiteral("~/")))
        expanded = QDir::homePath() + expanded.mid(1);

    if (QFileInfo(expanded).isRelative())
        expanded = QDir::current().absoluteFilePath(expanded);

    return QDir::cleanPath(expanded);
}

} // namespace hengjing::popup::utils
