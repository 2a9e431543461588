#pragma once

#include <QDateTime>
#include <QObject>
#include <QPointer>
#include <QStringList>
#include <QVariantMap>

#include <optional>

#include "models/PopupTypes.hpp"

class TimeoutAutoSubmitEngine;

class PopupLifecycleController : public QObject {
    Q_OBJECT
    Q_PROPERTY(State state READ state NOTIFY stateChanged)
    Q_PROPERTY(QString requestId READ requestId NOTIFY stateChanged)
    Q_PROPERTY(bool hasRequest READ hasRequest NOTIFY requestChanged)
    Q_PROPERTY(QVariantMap request READ requestMap NOTIFY requestChanged)
    Q_PROPERTY(bool requestLoaded READ requestLoaded NOTIFY requestLoadedChanged)
    Q_PROPERTY(bool settingsOpen READ settingsOpen NOTIFY stateChanged)
    Q_PROPERTY(QDateTime armedAt READ armedAt NOTIFY stateChanged)

public:
    enum class State {
        Idle,
        AwaitingInput,
        SettingsOverlay,
        Completed,
    };
    Q_ENUM(State)

    struct LifecycleState {
        State     kind = State::Idle;
        QString   requestId;
        QDateTime armedAt;
    };

    explicit PopupLifecycleController(QObject* parent = nullptr);
    ~PopupLifecycleController() override;

    void setAutoSubmitEngine(TimeoutAutoSubmitEngine* engine);

    State state() const { return m_state.kind; }
    const LifecycleState& lifecycleState() const { return m_state; }
    QString requestId() const { return m_state.requestId; }
    QDateTime armedAt() const { return m_state.armedAt; }
    bool hasRequest() const { return m_request.has_value(); }
    const std::optional<PopupRequest>& request() const { return m_request; }
    QVariantMap requestMap() const;
    bool requestLoaded() const { return m_requestLoaded; }
    bool settingsOpen() const { return m_state.kind == State::SettingsOverlay; }

    //! True while `requestId` waits for a response (popup or settings overlay shown).
    bool isAwaiting(const QString& requestId) const;

    bool receive(const PopupRequest& request);
    bool submitResponse(PopupResponse response);

    Q_INVOKABLE bool submit(const QString& userInput, const QStringList& selectedOptions = {});
    Q_INVOKABLE bool canSubmit(const QString& userInput, const QStringList& selectedOptions = {}) const;
    Q_INVOKABLE bool cancel();
    Q_INVOKABLE bool openSettings();
    Q_INVOKABLE bool closeSettings();
    Q_INVOKABLE void markRequestLoaded();

signals:
    void stateChanged();
    void requestChanged();
    void requestLoadedChanged();
    void requestAccepted(const QString& requestId);
    void requestRejected(const QString& requestId, const QString& reason);
    void requestSuperseded(const QString& requestId);
    void responseReady(const PopupResponse& response);
    void requestCompleted(const QString& requestId, bool autoSubmitted);

private slots:
    void handleAutoSubmitRequested(const QString& requestId, const QString& prompt);

private:
    bool isPending() const;
    void transitionTo(LifecycleState next, std::optional<PopupResponse> emission = std::nullopt);
    void setRequestLoaded(bool loaded);

    QPointer<TimeoutAutoSubmitEngine> m_autoSubmit;
    LifecycleState                    m_state;
    std::optional<PopupRequest>       m_request;
    bool                              m_requestLoaded = false;
};
