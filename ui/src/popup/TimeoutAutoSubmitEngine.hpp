#pragma once

#include <QObject>
#include <QPointer>
#include <QTimer>

#include <functional>

#include "models/PopupTypes.hpp"

class AutoSubmitSettingsController;

/**
 * @brief Countdown bound to a single request id.
 *
 * On expiry the engine picks the prompt configured by the operator and hands it
 * back through `autoSubmitRequested`. The armed request id acts as a token: a tick
 * or expiry whose token no longer matches the armed id, or no longer refers to a
 * live request, is dropped.
 */
class TimeoutAutoSubmitEngine : public QObject {
    Q_OBJECT
    Q_PROPERTY(bool active READ active NOTIFY activeChanged)
    Q_PROPERTY(QString armedRequestId READ armedRequestId NOTIFY activeChanged)
    Q_PROPERTY(int remainingSeconds READ remainingSeconds NOTIFY remainingSecondsChanged)
    Q_PROPERTY(QString continuePrompt READ continuePrompt WRITE setContinuePrompt NOTIFY continuePromptChanged)

public:
    using LiveRequestCheck = std::function<bool(const QString& requestId)>;
    // Id of the request currently awaiting input, empty when there is none.
    using PendingRequestSource = std::function<QString()>;

    explicit TimeoutAutoSubmitEngine(QObject* parent = nullptr);
    ~TimeoutAutoSubmitEngine() override;

    static QString defaultContinuePrompt();

    void setSettingsController(AutoSubmitSettingsController* settings);
    void setLiveRequestCheck(LiveRequestCheck check);
    void setPendingRequestSource(PendingRequestSource source);

    bool active() const { return !m_armedRequestId.isEmpty(); }
    QString armedRequestId() const { return m_armedRequestId; }
    int remainingSeconds() const { return m_remainingSeconds; }
    QString continuePrompt() const { return m_continuePrompt; }
    void setContinuePrompt(const QString& prompt);

    // Returns false when auto-submit is disabled; the engine stays idle then.
    bool arm(const QString& requestId);
    void disarm();

    QString synthesizePrompt(const TimeoutAutoSubmitConfig& config,
                             const QList<PromptTemplate>& templates) const;

    void setSecondLengthForTesting(int milliseconds);
    void expireForTesting(const QString& requestId) { handleExpiry(requestId); }

signals:
    void activeChanged();
    void remainingSecondsChanged();
    void continuePromptChanged();
    void autoSubmitRequested(const QString& requestId, const QString& prompt);

private slots:
    void handleTick();
    void handleSettingsChanged();

private:
    void handleExpiry(const QString& requestId);
    TimeoutAutoSubmitConfig currentConfig() const;
    QList<PromptTemplate> currentTemplates() const;
    void setRemainingSeconds(int seconds);

    QPointer<AutoSubmitSettingsController> m_settings;
    LiveRequestCheck                       m_isLive;
    PendingRequestSource                   m_pendingRequest;
    QTimer                                 m_tickTimer;
    QString                                m_armedRequestId;
    QString                                m_continuePrompt;
    int                                    m_remainingSeconds = 0;
    int                                    m_secondLengthMs = 1000;
};
