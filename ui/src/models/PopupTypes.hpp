#pragma once

#include <QJsonObject>
#include <QList>
#include <QMetaType>
#include <QString>
#include <QStringList>
#include <QVariantMap>

#include <optional>

constexpr int kMinAutoSubmitTimeoutSeconds = 5;
constexpr int kMaxAutoSubmitTimeoutSeconds = 3600;
constexpr int kDefaultAutoSubmitTimeoutSeconds = 300;

enum class PromptSource {
    Continue,
    Custom,
    Manual,
};

QString promptSourceToString(PromptSource source);
std::optional<PromptSource> promptSourceFromString(const QString& value);

int clampAutoSubmitTimeoutSeconds(int seconds);

struct TimeoutAutoSubmitConfig {
    bool                   enabled = false;
    int                    timeoutSeconds = kDefaultAutoSubmitTimeoutSeconds;
    PromptSource           promptSource = PromptSource::Continue;
    std::optional<QString> customPromptId;
    QString                manualPrompt;

    QVariantMap toVariantMap() const;

    // Applies only the keys present in `partial`; unknown keys and invalid values are ignored.
    // Returns true when at least one field changed.
    bool mergeFrom(const QVariantMap& partial, QStringList* rejectedKeys = nullptr);

    static TimeoutAutoSubmitConfig fromVariantMap(const QVariantMap& map);

    bool operator==(const TimeoutAutoSubmitConfig& other) const;
    bool operator!=(const TimeoutAutoSubmitConfig& other) const { return !(*this == other); }
};

struct PromptTemplate {
    QString id;
    QString name;
    QString content;
    QString kind;

    bool isSelectable() const;
    QVariantMap toVariantMap() const;

    bool operator==(const PromptTemplate& other) const
    {
        return id == other.id && name == other.name && content == other.content && kind == other.kind;
    }
};

//! Templates offered for `customPromptId`; only the `normal` kind qualifies.
QList<PromptTemplate> selectablePromptTemplates(const QList<PromptTemplate>& templates);
std::optional<PromptTemplate> findSelectablePromptTemplate(const QList<PromptTemplate>& templates,
                                                           const QString& id);

struct PopupRequest {
    QString     id;
    QString     message;
    QStringList predefinedOptions;
    bool        hasPredefinedOptions = false;
    bool        isMarkdown = false;

    bool isValid() const { return !id.trimmed().isEmpty(); }

    QJsonObject toJson() const;
    QVariantMap toVariantMap() const;

    static std::optional<PopupRequest> fromJson(const QJsonObject& object, QString* errorMessage = nullptr);
    static std::optional<PopupRequest> fromJsonBytes(const QByteArray& data, QString* errorMessage = nullptr);
};

struct PopupResponse {
    enum class Kind {
        Accepted,
        Cancelled,
    };

    Kind        kind = Kind::Cancelled;
    QString     requestId;
    QString     userInput;
    QStringList selectedOptions;
    bool        autoSubmitted = false;

    bool isCancelled() const { return kind == Kind::Cancelled; }

    //! Payload handed back to the host, serialized as compact JSON by `toWireString`.
    QJsonObject payloadJson() const;
    QString toWireString() const;

    static PopupResponse accepted(const QString& requestId,
                                  const QString& userInput,
                                  const QStringList& selectedOptions = {},
                                  bool autoSubmitted = false);
    static PopupResponse cancelled(const QString& requestId);
};

Q_DECLARE_METATYPE(PopupRequest)
Q_DECLARE_METATYPE(PopupResponse)
