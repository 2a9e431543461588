#pragma once

#include <QFutureWatcher>
#include <QObject>
#include <QTimer>
#include <QVariant>

#include <memory>
#include <optional>

#include "grpc/PopupConfigClient.hpp"
#include "models/PopupTypes.hpp"

class QThreadPool;

/**
 * @brief Holds the timeout auto-submit configuration for the session.
 *
 * Edits are applied to the in-memory copy immediately and written to the host
 * config service after a quiet interval. The in-memory copy stays authoritative
 * when a read or write fails.
 */
class AutoSubmitSettingsController : public QObject {
    Q_OBJECT
    Q_PROPERTY(QVariantMap config READ configMap NOTIFY configChanged)
    Q_PROPERTY(bool enabled READ enabled NOTIFY configChanged)
    Q_PROPERTY(int timeoutSeconds READ timeoutSeconds NOTIFY configChanged)
    Q_PROPERTY(QString promptSource READ promptSource NOTIFY configChanged)
    Q_PROPERTY(QVariantList selectablePrompts READ selectablePrompts NOTIFY promptTemplatesChanged)
    Q_PROPERTY(QString continuePrompt READ continuePrompt NOTIFY continuePromptChanged)
    Q_PROPERTY(bool loaded READ loaded NOTIFY loadedChanged)
    Q_PROPERTY(bool savePending READ savePending NOTIFY savePendingChanged)
    Q_PROPERTY(QString lastError READ lastError NOTIFY lastErrorChanged)

public:
    explicit AutoSubmitSettingsController(QObject* parent = nullptr);
    ~AutoSubmitSettingsController() override;

    const TimeoutAutoSubmitConfig& config() const { return m_config; }
    QVariantMap configMap() const { return m_config.toVariantMap(); }
    bool enabled() const { return m_config.enabled; }
    int timeoutSeconds() const { return m_config.timeoutSeconds; }
    QString promptSource() const { return promptSourceToString(m_config.promptSource); }

    const QList<PromptTemplate>& promptTemplates() const { return m_promptTemplates; }
    QVariantList selectablePrompts() const;
    QString continuePrompt() const { return m_continuePrompt; }

    bool loaded() const { return m_loaded; }
    bool savePending() const;
    QString lastError() const { return m_lastError; }

    Q_INVOKABLE void load();
    Q_INVOKABLE void refreshPromptTemplates();
    Q_INVOKABLE void update(const QVariantMap& partial);
    Q_INVOKABLE void flush();

    void setConfigClient(const std::shared_ptr<PopupConfigClientInterface>& client);
    void setThreadPoolForTesting(QThreadPool* pool);
    void setDebounceIntervalForTesting(int intervalMs);
    bool isSaveTimerActiveForTesting() const { return m_saveTimer.isActive(); }
    bool isWriteInFlightForTesting() const { return m_writeWatcher.isRunning(); }

signals:
    void configChanged();
    void promptTemplatesChanged();
    void continuePromptChanged();
    void loadedChanged();
    void savePendingChanged();
    void lastErrorChanged();
    void configPersisted(bool ok);
    void promptSourceSwitched(const QString& source);

private slots:
    void handleLoadFinished();
    void handleTemplatesFinished();
    void handleWriteFinished();
    void persistPending();

private:
    struct WriteOutcome {
        bool    ok = false;
        QString errorMessage;
    };

    QThreadPool* pool() const;
    void startWrite(const TimeoutAutoSubmitConfig& snapshot);
    void finishWrite(const WriteOutcome& outcome);
    void setLastError(const QString& message);
    void setLoaded(bool loaded);

    std::shared_ptr<PopupConfigClientInterface>                          m_client;
    QFutureWatcher<PopupConfigClientInterface::AutoSubmitConfigResult>   m_loadWatcher;
    QFutureWatcher<PopupConfigClientInterface::PromptConfigResult>       m_templatesWatcher;
    QFutureWatcher<WriteOutcome>                                         m_writeWatcher;
    QTimer                                                               m_saveTimer;
    QThreadPool*                                                         m_threadPool = nullptr;

    TimeoutAutoSubmitConfig                m_config;
    std::optional<TimeoutAutoSubmitConfig> m_queuedWrite;
    bool                                   m_dirty = false;
    bool                                   m_writeHandled = true;
    bool                                   m_editedDuringLoad = false;
    QList<PromptTemplate>                  m_promptTemplates;
    QString                                m_continuePrompt;
    bool                                   m_loaded = false;
    QString                                m_lastError;
};
