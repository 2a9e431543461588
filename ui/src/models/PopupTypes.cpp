#include "PopupTypes.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QtGlobal>

#include <optional>

namespace {

const QString kEnabledKey = QStringLiteral("enabled");
const QString kTimeoutSecondsKey = QStringLiteral("timeout_seconds");
const QString kPromptSourceKey = QStringLiteral("prompt_source");
const QString kCustomPromptIdKey = QStringLiteral("custom_prompt_id");
const QString kManualPromptKey = QStringLiteral("manual_prompt");

const QString kNormalPromptKind = QStringLiteral("normal");

// QVariant::toBool() treats any non-empty string other than "0"/"false" as
// true; the settings surface only accepts an explicit vocabulary.
std::optional<bool> strictBoolFromVariant(const QVariant& value)
{
    switch (value.typeId()) {
    case QMetaType::Bool:
        return value.toBool();
    case QMetaType::Int:
    case QMetaType::LongLong:
    case QMetaType::UInt:
    case QMetaType::ULongLong: {
        const qlonglong number = value.toLongLong();
        if (number == 0 || number == 1)
            return number == 1;
        return std::nullopt;
    }
    case QMetaType::Double: {
        const double number = value.toDouble();
        if (number == 0.0 || number == 1.0)
            return number == 1.0;
        return std::nullopt;
    }
    case QMetaType::QString: {
        const QString text = value.toString().trimmed().toLower();
        if (text == QLatin1String("1") || text == QLatin1String("true") || text == QLatin1String("yes")
            || text == QLatin1String("on"))
            return true;
        if (text == QLatin1String("0") || text == QLatin1String("false") || text == QLatin1String("no")
            || text == QLatin1String("off"))
            return false;
        return std::nullopt;
    }
    default:
        return std::nullopt;
    }
}

QStringList stringListFromJson(const QJsonValue& value)
{
    QStringList result;
    const QJsonArray array = value.toArray();
    for (const QJsonValue& entry : array) {
        if (entry.isString())
            result.append(entry.toString());
    }
    return result;
}

} // namespace

QString promptSourceToString(PromptSource source)
{
    switch (source) {
    case PromptSource::Continue:
        return QStringLiteral("continue");
    case PromptSource::Custom:
        return QStringLiteral("custom");
    case PromptSource::Manual:
        return QStringLiteral("manual");
    }
    return QStringLiteral("continue");
}

std::optional<PromptSource> promptSourceFromString(const QString& value)
{
    const QString normalized = value.trimmed().toLower();
    if (normalized == QStringLiteral("continue"))
        return PromptSource::Continue;
    if (normalized == QStringLiteral("custom"))
        return PromptSource::Custom;
    if (normalized == QStringLiteral("manual"))
        return PromptSource::Manual;
    return std::nullopt;
}

int clampAutoSubmitTimeoutSeconds(int seconds)
{
    return qBound(kMinAutoSubmitTimeoutSeconds, seconds, kMaxAutoSubmitTimeoutSeconds);
}

QVariantMap TimeoutAutoSubmitConfig::toVariantMap() const
{
    QVariantMap map;
    map.insert(kEnabledKey, enabled);
    map.insert(kTimeoutSecondsKey, timeoutSeconds);
    map.insert(kPromptSourceKey, promptSourceToString(promptSource));
    map.insert(kCustomPromptIdKey, customPromptId ? QVariant(*customPromptId) : QVariant());
    map.insert(kManualPromptKey, manualPrompt);
    return map;
}

bool TimeoutAutoSubmitConfig::mergeFrom(const QVariantMap& partial, QStringList* rejectedKeys)
{
    const TimeoutAutoSubmitConfig before = *this;
    auto reject = [rejectedKeys](const QString& key) {
        if (rejectedKeys)
            rejectedKeys->append(key);
    };

    for (auto it = partial.constBegin(); it != partial.constEnd(); ++it) {
        const QString& key = it.key();
        const QVariant& value = it.value();
        if (key == kEnabledKey) {
            const auto flag = strictBoolFromVariant(value);
            if (flag)
                enabled = *flag;
            else
                reject(key);
        } else if (key == kTimeoutSecondsKey) {
            bool ok = false;
            const int seconds = value.toInt(&ok);
            if (ok)
                timeoutSeconds = clampAutoSubmitTimeoutSeconds(seconds);
            else
                reject(key);
        } else if (key == kPromptSourceKey) {
            const auto source = promptSourceFromString(value.toString());
            if (source)
                promptSource = *source;
            else
                reject(key);
        } else if (key == kCustomPromptIdKey) {
            const QString id = value.isNull() ? QString() : value.toString().trimmed();
            if (id.isEmpty())
                customPromptId.reset();
            else
                customPromptId = id;
        } else if (key == kManualPromptKey) {
            manualPrompt = value.toString();
        } else {
            reject(key);
        }
    }

    return before != *this;
}

TimeoutAutoSubmitConfig TimeoutAutoSubmitConfig::fromVariantMap(const QVariantMap& map)
{
    TimeoutAutoSubmitConfig config;
    config.mergeFrom(map);
    return config;
}

bool TimeoutAutoSubmitConfig::operator==(const TimeoutAutoSubmitConfig& other) const
{
    return enabled == other.enabled && timeoutSeconds == other.timeoutSeconds
        && promptSource == other.promptSource && customPromptId == other.customPromptId
        && manualPrompt == other.manualPrompt;
}

bool PromptTemplate::isSelectable() const
{
    return kind.compare(kNormalPromptKind, Qt::CaseInsensitive) == 0;
}

QVariantMap PromptTemplate::toVariantMap() const
{
    QVariantMap map;
    map.insert(QStringLiteral("id"), id);
    map.insert(QStringLiteral("name"), name);
    map.insert(QStringLiteral("content"), content);
    map.insert(QStringLiteral("kind"), kind);
    return map;
}

QList<PromptTemplate> selectablePromptTemplates(const QList<PromptTemplate>& templates)
{
    QList<PromptTemplate> result;
    for (const PromptTemplate& entry : templates) {
        if (entry.isSelectable())
            result.append(entry);
    }
    return result;
}

std::optional<PromptTemplate> findSelectablePromptTemplate(const QList<PromptTemplate>& templates,
                                                           const QString& id)
{
    if (id.trimmed().isEmpty())
        return std::nullopt;
    for (const PromptTemplate& entry : templates) {
        if (entry.isSelectable() && entry.id == id)
            return entry;
    }
    return std::nullopt;
}

QJsonObject PopupRequest::toJson() const
{
    QJsonObject object;
    object.insert(QStringLiteral("id"), id);
    object.insert(QStringLiteral("message"), message);
    if (hasPredefinedOptions)
        object.insert(QStringLiteral("predefined_options"), QJsonArray::fromStringList(predefinedOptions));
    else
        object.insert(QStringLiteral("predefined_options"), QJsonValue::Null);
    object.insert(QStringLiteral("is_markdown"), isMarkdown);
    return object;
}

QVariantMap PopupRequest::toVariantMap() const
{
    QVariantMap map;
    map.insert(QStringLiteral("id"), id);
    map.insert(QStringLiteral("message"), message);
    map.insert(QStringLiteral("predefinedOptions"), predefinedOptions);
    map.insert(QStringLiteral("isMarkdown"), isMarkdown);
    return map;
}

std::optional<PopupRequest> PopupRequest::fromJson(const QJsonObject& object, QString* errorMessage)
{
    const QJsonValue idValue = object.value(QStringLiteral("id"));
    if (!idValue.isString() || idValue.toString().trimmed().isEmpty()) {
        if (errorMessage)
            *errorMessage = QStringLiteral("request id is missing");
        return std::nullopt;
    }

    PopupRequest request;
    request.id = idValue.toString().trimmed();
    request.message = object.value(QStringLiteral("message")).toString();
    const QJsonValue options = object.value(QStringLiteral("predefined_options"));
    if (options.isArray()) {
        request.hasPredefinedOptions = true;
        request.predefinedOptions = stringListFromJson(options);
    }
    request.isMarkdown = object.value(QStringLiteral("is_markdown")).toBool(false);
    return request;
}

std::optional<PopupRequest> PopupRequest::fromJsonBytes(const QByteArray& data, QString* errorMessage)
{
    QJsonParseError parseError{};
    const QJsonDocument document = QJsonDocument::fromJson(data, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        if (errorMessage)
            *errorMessage = QStringLiteral("invalid request JSON: %1").arg(parseError.errorString());
        return std::nullopt;
    }
    if (!document.isObject()) {
        if (errorMessage)
            *errorMessage = QStringLiteral("request must be a JSON object");
        return std::nullopt;
    }
    return fromJson(document.object(), errorMessage);
}

QJsonObject PopupResponse::payloadJson() const
{
    QJsonObject object;
    if (kind == Kind::Cancelled) {
        object.insert(QStringLiteral("cancelled"), true);
    } else {
        object.insert(QStringLiteral("user_input"), userInput);
        object.insert(QStringLiteral("selected_options"), QJsonArray::fromStringList(selectedOptions));
    }
    object.insert(QStringLiteral("auto_submitted"), autoSubmitted);
    return object;
}

QString PopupResponse::toWireString() const
{
    return QString::fromUtf8(QJsonDocument(payloadJson()).toJson(QJsonDocument::Compact));
}

PopupResponse PopupResponse::accepted(const QString& requestId,
                                      const QString& userInput,
                                      const QStringList& selectedOptions,
                                      bool autoSubmitted)
{
    PopupResponse response;
    response.kind = Kind::Accepted;
    response.requestId = requestId;
    response.userInput = userInput;
    response.selectedOptions = selectedOptions;
    response.autoSubmitted = autoSubmitted;
    return response;
}

PopupResponse PopupResponse::cancelled(const QString& requestId)
{
    PopupResponse response;
    response.kind = Kind::Cancelled;
    response.requestId = requestId;
    return response;
}
