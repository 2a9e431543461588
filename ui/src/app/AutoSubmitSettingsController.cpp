#include "AutoSubmitSettingsController.hpp"

#include <QLoggingCategory>
#include <QThreadPool>
#include <QtConcurrent>

Q_LOGGING_CATEGORY(lcAutoSubmitSettings, "hengjing.popup.settings")

namespace {
constexpr int kSettingsDebounceMs = 500;
}

AutoSubmitSettingsController::AutoSubmitSettingsController(QObject* parent)
    : QObject(parent)
    , m_client(std::make_shared<InProcessPopupConfigClient>())
{
    m_saveTimer.setSingleShot(true);
    m_saveTimer.setInterval(kSettingsDebounceMs);
    connect(&m_saveTimer, &QTimer::timeout, this, &AutoSubmitSettingsController::persistPending);

    connect(&m_loadWatcher, &QFutureWatcher<PopupConfigClientInterface::AutoSubmitConfigResult>::finished,
            this, &AutoSubmitSettingsController::handleLoadFinished);
    connect(&m_templatesWatcher, &QFutureWatcher<PopupConfigClientInterface::PromptConfigResult>::finished,
            this, &AutoSubmitSettingsController::handleTemplatesFinished);
    connect(&m_writeWatcher, &QFutureWatcher<WriteOutcome>::finished,
            this, &AutoSubmitSettingsController::handleWriteFinished);
}

AutoSubmitSettingsController::~AutoSubmitSettingsController()
{
    // A debounced write must never outlive the settings surface.
    m_saveTimer.stop();
    if (m_writeWatcher.isRunning())
        m_writeWatcher.waitForFinished();
}

QVariantList AutoSubmitSettingsController::selectablePrompts() const
{
    QVariantList list;
    const QList<PromptTemplate> selectable = selectablePromptTemplates(m_promptTemplates);
    for (const PromptTemplate& entry : selectable)
        list.append(entry.toVariantMap());
    return list;
}

bool AutoSubmitSettingsController::savePending() const
{
    return m_dirty || m_saveTimer.isActive() || m_writeWatcher.isRunning() || m_queuedWrite.has_value();
}

void AutoSubmitSettingsController::setConfigClient(const std::shared_ptr<PopupConfigClientInterface>& client)
{
    if (!client)
        return;
    m_client = client;
}

void AutoSubmitSettingsController::setThreadPoolForTesting(QThreadPool* pool)
{
    m_threadPool = pool;
}

void AutoSubmitSettingsController::setDebounceIntervalForTesting(int intervalMs)
{
    m_saveTimer.setInterval(qMax(1, intervalMs));
}

QThreadPool* AutoSubmitSettingsController::pool() const
{
    return m_threadPool ? m_threadPool : QThreadPool::globalInstance();
}

void AutoSubmitSettingsController::load()
{
    if (!m_client)
        return;
    if (m_loadWatcher.isRunning())
        return;

    m_editedDuringLoad = false;
    auto future = QtConcurrent::run(pool(), [client = m_client]() {
        return client->fetchTimeoutAutoSubmitConfig();
    });
    m_loadWatcher.setFuture(future);
    refreshPromptTemplates();
}

void AutoSubmitSettingsController::refreshPromptTemplates()
{
    if (!m_client)
        return;

    // A newer refresh replaces the watched future; only the latest result is applied.
    auto future = QtConcurrent::run(pool(), [client = m_client]() {
        return client->fetchCustomPromptConfig();
    });
    m_templatesWatcher.setFuture(future);
}

void AutoSubmitSettingsController::update(const QVariantMap& partial)
{
    const PromptSource previousSource = m_config.promptSource;
    QStringList rejected;
    const bool changed = m_config.mergeFrom(partial, &rejected);
    if (!rejected.isEmpty())
        qCWarning(lcAutoSubmitSettings) << "Ignoring invalid auto-submit settings keys" << rejected;

    if (!changed && !m_saveTimer.isActive())
        return;

    if (changed) {
        m_dirty = true;
        if (m_loadWatcher.isRunning())
            m_editedDuringLoad = true;
        Q_EMIT configChanged();
    }

    m_saveTimer.start();
    Q_EMIT savePendingChanged();

    if (changed && previousSource != m_config.promptSource) {
        Q_EMIT promptSourceSwitched(promptSourceToString(m_config.promptSource));
        if (m_config.promptSource == PromptSource::Custom)
            refreshPromptTemplates();
    }
}

void AutoSubmitSettingsController::flush()
{
    if (m_saveTimer.isActive())
        m_saveTimer.stop();
    persistPending();

    // The queued snapshot normally starts from the finished signal, which
    // never arrives once the event loop has stopped.
    if (m_queuedWrite && m_writeWatcher.isRunning()) {
        QFuture<WriteOutcome> inFlight = m_writeWatcher.future();
        inFlight.waitForFinished();
        finishWrite(inFlight.result());
    }
}

void AutoSubmitSettingsController::persistPending()
{
    if (!m_dirty) {
        Q_EMIT savePendingChanged();
        return;
    }

    m_dirty = false;
    const TimeoutAutoSubmitConfig snapshot = m_config;
    if (m_writeWatcher.isRunning()) {
        m_queuedWrite = snapshot;
        return;
    }
    startWrite(snapshot);
}

void AutoSubmitSettingsController::startWrite(const TimeoutAutoSubmitConfig& snapshot)
{
    if (!m_client)
        return;

    qCDebug(lcAutoSubmitSettings) << "Writing auto-submit settings" << snapshot.toVariantMap();
    m_writeHandled = false;
    auto future = QtConcurrent::run(pool(), [client = m_client, snapshot]() {
        WriteOutcome outcome;
        outcome.ok = client->storeTimeoutAutoSubmitConfig(snapshot, &outcome.errorMessage);
        return outcome;
    });
    m_writeWatcher.setFuture(future);
    Q_EMIT savePendingChanged();
}

void AutoSubmitSettingsController::handleLoadFinished()
{
    if (!m_loadWatcher.isFinished())
        return;

    const auto result = m_loadWatcher.result();
    if (!result.ok) {
        qCWarning(lcAutoSubmitSettings) << "Could not load auto-submit settings, keeping current values:"
                                        << result.errorMessage;
        setLastError(result.errorMessage);
        setLoaded(true);
        return;
    }

    if (m_editedDuringLoad || m_dirty) {
        qCInfo(lcAutoSubmitSettings) << "Local auto-submit edits made during load take precedence";
    } else if (result.config != m_config) {
        const PromptSource previousSource = m_config.promptSource;
        m_config = result.config;
        Q_EMIT configChanged();
        if (previousSource != m_config.promptSource)
            Q_EMIT promptSourceSwitched(promptSourceToString(m_config.promptSource));
    }
    setLastError({});
    setLoaded(true);
}

void AutoSubmitSettingsController::handleTemplatesFinished()
{
    if (!m_templatesWatcher.isFinished())
        return;

    const auto result = m_templatesWatcher.result();
    if (!result.ok) {
        qCWarning(lcAutoSubmitSettings) << "Could not load prompt templates:" << result.errorMessage;
        return;
    }

    if (result.prompts != m_promptTemplates) {
        m_promptTemplates = result.prompts;
        Q_EMIT promptTemplatesChanged();
    }

    const QString continuePrompt = result.continuePrompt.trimmed();
    if (!continuePrompt.isEmpty() && continuePrompt != m_continuePrompt) {
        m_continuePrompt = continuePrompt;
        Q_EMIT continuePromptChanged();
    }

    if (m_config.promptSource == PromptSource::Custom && m_config.customPromptId
        && !findSelectablePromptTemplate(m_promptTemplates, *m_config.customPromptId)) {
        qCInfo(lcAutoSubmitSettings) << "Selected prompt template is no longer available"
                                     << *m_config.customPromptId;
    }
}

void AutoSubmitSettingsController::handleWriteFinished()
{
    if (m_writeHandled || !m_writeWatcher.future().isFinished())
        return;
    finishWrite(m_writeWatcher.result());
}

void AutoSubmitSettingsController::finishWrite(const WriteOutcome& outcome)
{
    m_writeHandled = true;
    if (!outcome.ok) {
        // No retry; the in-memory configuration remains in effect for this session.
        qCWarning(lcAutoSubmitSettings) << "Could not save auto-submit settings:" << outcome.errorMessage;
        setLastError(outcome.errorMessage.isEmpty() ? tr("Saving settings failed") : outcome.errorMessage);
    } else {
        qCInfo(lcAutoSubmitSettings) << "Auto-submit settings saved";
        setLastError({});
    }
    Q_EMIT configPersisted(outcome.ok);

    if (m_queuedWrite) {
        const TimeoutAutoSubmitConfig next = *m_queuedWrite;
        m_queuedWrite.reset();
        startWrite(next);
        return;
    }
    Q_EMIT savePendingChanged();
}

void AutoSubmitSettingsController::setLastError(const QString& message)
{
    if (m_lastError == message)
        return;
    m_lastError = message;
    Q_EMIT lastErrorChanged();
}

void AutoSubmitSettingsController::setLoaded(bool loaded)
{
    if (m_loaded == loaded)
        return;
    m_loaded = loaded;
    Q_EMIT loadedChanged();
}
