#include "TimeoutAutoSubmitEngine.hpp"

#include "app/AutoSubmitSettingsController.hpp"

#include <QLoggingCategory>

Q_LOGGING_CATEGORY(lcAutoSubmit, "hengjing.popup.autosubmit")

TimeoutAutoSubmitEngine::TimeoutAutoSubmitEngine(QObject* parent)
    : QObject(parent)
    , m_continuePrompt(defaultContinuePrompt())
{
    m_tickTimer.setSingleShot(false);
    m_tickTimer.setTimerType(Qt::PreciseTimer);
    m_tickTimer.setInterval(m_secondLengthMs);
    connect(&m_tickTimer, &QTimer::timeout, this, &TimeoutAutoSubmitEngine::handleTick);
}

TimeoutAutoSubmitEngine::~TimeoutAutoSubmitEngine() = default;

QString TimeoutAutoSubmitEngine::defaultContinuePrompt()
{
    return QStringLiteral("Please continue, following best practices.");
}

void TimeoutAutoSubmitEngine::setSettingsController(AutoSubmitSettingsController* settings)
{
    if (m_settings == settings)
        return;
    if (m_settings)
        disconnect(m_settings, nullptr, this, nullptr);
    m_settings = settings;
    if (m_settings) {
        connect(m_settings, &AutoSubmitSettingsController::configChanged,
                this, &TimeoutAutoSubmitEngine::handleSettingsChanged);
    }
}

void TimeoutAutoSubmitEngine::setLiveRequestCheck(LiveRequestCheck check)
{
    m_isLive = std::move(check);
}

void TimeoutAutoSubmitEngine::setPendingRequestSource(PendingRequestSource source)
{
    m_pendingRequest = std::move(source);
}

void TimeoutAutoSubmitEngine::setContinuePrompt(const QString& prompt)
{
    const QString sanitized = prompt.trimmed().isEmpty() ? defaultContinuePrompt() : prompt;
    if (sanitized == m_continuePrompt)
        return;
    m_continuePrompt = sanitized;
    Q_EMIT continuePromptChanged();
}

bool TimeoutAutoSubmitEngine::arm(const QString& requestId)
{
    disarm();

    const TimeoutAutoSubmitConfig config = currentConfig();
    if (!config.enabled || requestId.isEmpty())
        return false;

    m_armedRequestId = requestId;
    setRemainingSeconds(clampAutoSubmitTimeoutSeconds(config.timeoutSeconds));
    m_tickTimer.start(m_secondLengthMs);
    qCInfo(lcAutoSubmit) << "Auto-submit armed for" << requestId << "in" << m_remainingSeconds << "s";
    Q_EMIT activeChanged();
    return true;
}

void TimeoutAutoSubmitEngine::disarm()
{
    m_tickTimer.stop();
    if (m_armedRequestId.isEmpty())
        return;
    qCDebug(lcAutoSubmit) << "Auto-submit disarmed for" << m_armedRequestId;
    m_armedRequestId.clear();
    setRemainingSeconds(0);
    Q_EMIT activeChanged();
}

void TimeoutAutoSubmitEngine::setSecondLengthForTesting(int milliseconds)
{
    m_secondLengthMs = qMax(1, milliseconds);
    m_tickTimer.setInterval(m_secondLengthMs);
}

void TimeoutAutoSubmitEngine::handleTick()
{
    if (m_armedRequestId.isEmpty()) {
        m_tickTimer.stop();
        return;
    }

    setRemainingSeconds(m_remainingSeconds - 1);
    qCDebug(lcAutoSubmit) << "Auto-submit countdown" << m_armedRequestId << m_remainingSeconds;
    if (m_remainingSeconds <= 0)
        handleExpiry(m_armedRequestId);
}

void TimeoutAutoSubmitEngine::handleSettingsChanged()
{
    const bool enabled = currentConfig().enabled;
    if (active() && !enabled) {
        qCInfo(lcAutoSubmit) << "Auto-submit switched off while armed";
        disarm();
        return;
    }

    // Covers the host config arriving after the request, and the operator
    // switching auto-submit on while a request is shown.
    if (!active() && enabled && m_pendingRequest) {
        const QString requestId = m_pendingRequest();
        if (!requestId.isEmpty() && (!m_isLive || m_isLive(requestId))) {
            qCInfo(lcAutoSubmit) << "Auto-submit switched on for pending request" << requestId;
            arm(requestId);
        }
    }
}

void TimeoutAutoSubmitEngine::handleExpiry(const QString& requestId)
{
    // The token is checked right before synthesis, not only when scheduling.
    if (requestId.isEmpty() || requestId != m_armedRequestId) {
        qCDebug(lcAutoSubmit) << "Ignoring stale auto-submit timer for" << requestId;
        return;
    }
    if (m_isLive && !m_isLive(requestId)) {
        qCDebug(lcAutoSubmit) << "Request" << requestId << "is no longer awaiting input";
        disarm();
        return;
    }

    const QString prompt = synthesizePrompt(currentConfig(), currentTemplates());
    disarm();
    qCInfo(lcAutoSubmit) << "Auto-submitting request" << requestId;
    Q_EMIT autoSubmitRequested(requestId, prompt);
}

QString TimeoutAutoSubmitEngine::synthesizePrompt(const TimeoutAutoSubmitConfig& config,
                                                  const QList<PromptTemplate>& templates) const
{
    switch (config.promptSource) {
    case PromptSource::Manual:
        return config.manualPrompt;
    case PromptSource::Custom: {
        if (config.customPromptId) {
            const auto entry = findSelectablePromptTemplate(templates, *config.customPromptId);
            if (entry && !entry->content.trimmed().isEmpty())
                return entry->content;
        }
        qCInfo(lcAutoSubmit) << "Custom prompt"
                             << (config.customPromptId ? *config.customPromptId : QStringLiteral("<none>"))
                             << "is unavailable, falling back to the continue prompt";
        return m_continuePrompt;
    }
    case PromptSource::Continue:
        break;
    }
    return m_continuePrompt;
}

TimeoutAutoSubmitConfig TimeoutAutoSubmitEngine::currentConfig() const
{
    return m_settings ? m_settings->config() : TimeoutAutoSubmitConfig{};
}

QList<PromptTemplate> TimeoutAutoSubmitEngine::currentTemplates() const
{
    return m_settings ? m_settings->promptTemplates() : QList<PromptTemplate>{};
}

void TimeoutAutoSubmitEngine::setRemainingSeconds(int seconds)
{
    const int sanitized = qMax(0, seconds);
    if (sanitized == m_remainingSeconds)
        return;
    m_remainingSeconds = sanitized;
    Q_EMIT remainingSecondsChanged();
}
