#include "PopupLifecycleController.hpp"

#include "TimeoutAutoSubmitEngine.hpp"

#include <QLoggingCategory>
#include <QMetaEnum>
#include <QTimer>

Q_LOGGING_CATEGORY(lcLifecycle, "hengjing.popup.lifecycle")

namespace {

const char* stateName(PopupLifecycleController::State state)
{
    return QMetaEnum::fromType<PopupLifecycleController::State>().valueToKey(static_cast<int>(state));
}

bool isPendingState(PopupLifecycleController::State state)
{
    return state == PopupLifecycleController::State::AwaitingInput
        || state == PopupLifecycleController::State::SettingsOverlay;
}

} // namespace

PopupLifecycleController::PopupLifecycleController(QObject* parent)
    : QObject(parent)
{
    qRegisterMetaType<PopupRequest>("PopupRequest");
    qRegisterMetaType<PopupResponse>("PopupResponse");
}

PopupLifecycleController::~PopupLifecycleController()
{
    if (m_autoSubmit) {
        m_autoSubmit->setLiveRequestCheck({});
        m_autoSubmit->setPendingRequestSource({});
        m_autoSubmit->disarm();
    }
}

void PopupLifecycleController::setAutoSubmitEngine(TimeoutAutoSubmitEngine* engine)
{
    if (m_autoSubmit == engine)
        return;

    if (m_autoSubmit) {
        disconnect(m_autoSubmit, nullptr, this, nullptr);
        m_autoSubmit->setLiveRequestCheck({});
        m_autoSubmit->setPendingRequestSource({});
        m_autoSubmit->disarm();
    }

    m_autoSubmit = engine;
    if (!m_autoSubmit)
        return;

    connect(m_autoSubmit, &TimeoutAutoSubmitEngine::autoSubmitRequested,
            this, &PopupLifecycleController::handleAutoSubmitRequested);
    m_autoSubmit->setLiveRequestCheck([guard = QPointer<PopupLifecycleController>(this)](const QString& id) {
        return guard && guard->isAwaiting(id);
    });
    m_autoSubmit->setPendingRequestSource([guard = QPointer<PopupLifecycleController>(this)]() {
        return guard && guard->isPending() ? guard->m_state.requestId : QString();
    });
    if (isPending())
        m_autoSubmit->arm(m_state.requestId);
}

QVariantMap PopupLifecycleController::requestMap() const
{
    return m_request ? m_request->toVariantMap() : QVariantMap{};
}

bool PopupLifecycleController::isAwaiting(const QString& requestId) const
{
    return isPending() && !requestId.isEmpty() && m_state.requestId == requestId;
}

bool PopupLifecycleController::isPending() const
{
    return isPendingState(m_state.kind);
}

bool PopupLifecycleController::receive(const PopupRequest& request)
{
    if (!request.isValid()) {
        qCWarning(lcLifecycle) << "Rejecting request without id";
        Q_EMIT requestRejected(request.id, QStringLiteral("invalid"));
        return false;
    }

    QString superseded;
    switch (m_state.kind) {
    case State::AwaitingInput:
        qCWarning(lcLifecycle) << "Rejecting request" << request.id << "while" << m_state.requestId
                               << "is still in flight";
        Q_EMIT requestRejected(request.id, QStringLiteral("busy"));
        return false;
    case State::SettingsOverlay:
        if (request.id == m_state.requestId) {
            qCWarning(lcLifecycle) << "Rejecting duplicate delivery of request" << request.id;
            Q_EMIT requestRejected(request.id, QStringLiteral("busy"));
            return false;
        }
        superseded = m_state.requestId;
        break;
    case State::Idle:
    case State::Completed:
        break;
    }

    m_request = request;
    setRequestLoaded(false);
    transitionTo({State::AwaitingInput, request.id, {}});
    Q_EMIT requestChanged();

    if (!superseded.isEmpty()) {
        qCInfo(lcLifecycle) << "Request" << superseded << "superseded by" << request.id;
        Q_EMIT requestSuperseded(superseded);
    }
    Q_EMIT requestAccepted(request.id);

    // Fallback for views that never report their layout.
    QTimer::singleShot(0, this, [this, id = request.id]() {
        if (m_request && m_request->id == id)
            markRequestLoaded();
    });
    return true;
}

bool PopupLifecycleController::submitResponse(PopupResponse response)
{
    if (!isPending()) {
        qCWarning(lcLifecycle) << "Ignoring response for" << response.requestId
                               << "- no request is awaiting input";
        return false;
    }
    if (!response.requestId.isEmpty() && response.requestId != m_state.requestId) {
        qCWarning(lcLifecycle) << "Ignoring response for stale request" << response.requestId
                               << "- current request is" << m_state.requestId;
        return false;
    }

    response.requestId = m_state.requestId;
    transitionTo({State::Completed, m_state.requestId, {}}, std::move(response));
    return true;
}

bool PopupLifecycleController::canSubmit(const QString& userInput, const QStringList& selectedOptions) const
{
    return isPending() && (!userInput.trimmed().isEmpty() || !selectedOptions.isEmpty());
}

bool PopupLifecycleController::submit(const QString& userInput, const QStringList& selectedOptions)
{
    if (!canSubmit(userInput, selectedOptions)) {
        qCDebug(lcLifecycle) << "Submit ignored: nothing entered or no request pending";
        return false;
    }
    return submitResponse(PopupResponse::accepted(m_state.requestId, userInput, selectedOptions));
}

bool PopupLifecycleController::cancel()
{
    return submitResponse(PopupResponse::cancelled(m_state.requestId));
}

bool PopupLifecycleController::openSettings()
{
    if (m_state.kind != State::AwaitingInput)
        return false;
    transitionTo({State::SettingsOverlay, m_state.requestId, m_state.armedAt});
    return true;
}

bool PopupLifecycleController::closeSettings()
{
    if (m_state.kind != State::SettingsOverlay)
        return false;
    transitionTo({State::AwaitingInput, m_state.requestId, m_state.armedAt});
    return true;
}

void PopupLifecycleController::markRequestLoaded()
{
    if (!m_request)
        return;
    setRequestLoaded(true);
}

void PopupLifecycleController::handleAutoSubmitRequested(const QString& requestId, const QString& prompt)
{
    if (!isAwaiting(requestId)) {
        qCDebug(lcLifecycle) << "Dropping auto-submit for inactive request" << requestId;
        return;
    }
    submitResponse(PopupResponse::accepted(requestId, prompt, {}, true));
}

void PopupLifecycleController::transitionTo(LifecycleState next, std::optional<PopupResponse> emission)
{
    const LifecycleState previous = m_state;
    const bool wasPending = isPendingState(previous.kind);
    const bool willBePending = isPendingState(next.kind);
    const bool sameRequest = previous.requestId == next.requestId;
    const bool entersNewRequest = willBePending && (!wasPending || !sameRequest);

    if (wasPending && (!willBePending || !sameRequest) && m_autoSubmit)
        m_autoSubmit->disarm();

    if (entersNewRequest)
        next.armedAt = QDateTime::currentDateTimeUtc();
    else if (!willBePending)
        next.armedAt = {};

    m_state = next;
    qCInfo(lcLifecycle) << "Lifecycle" << stateName(previous.kind) << previous.requestId << "->"
                        << stateName(next.kind) << next.requestId;

    if (!willBePending && m_request) {
        // The request is discarded once it completes.
        m_request.reset();
        setRequestLoaded(false);
        Q_EMIT requestChanged();
    }

    Q_EMIT stateChanged();

    if (entersNewRequest && m_autoSubmit)
        m_autoSubmit->arm(next.requestId);

    if (!emission)
        return;

    const QString completedId = next.requestId;
    const bool autoSubmitted = emission->autoSubmitted;
    Q_EMIT responseReady(*emission);
    emission.reset();
    Q_EMIT requestCompleted(completedId, autoSubmitted);

    // A slot may already have delivered the next request; only reset if nothing moved on.
    if (m_state.kind == State::Completed && m_state.requestId == completedId)
        transitionTo({State::Idle, {}, {}});
}

void PopupLifecycleController::setRequestLoaded(bool loaded)
{
    if (m_requestLoaded == loaded)
        return;
    m_requestLoaded = loaded;
    Q_EMIT requestLoadedChanged();
}
