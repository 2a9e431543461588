#include "WindowPresentationCoordinator.hpp"

#include <QLoggingCategory>
#include <QMetaEnum>
#include <QQuickItem>
#include <QQuickWindow>

Q_LOGGING_CATEGORY(lcWindow, "hengjing.popup.window")

QuickPopupWindowHost::QuickPopupWindowHost(QQuickWindow* window)
    : m_window(window)
{
}

bool QuickPopupWindowHost::startSystemMove()
{
    if (!m_window)
        return false;
    return m_window->startSystemMove();
}

void QuickPopupWindowHost::setAlwaysOnTop(bool enabled)
{
    if (!m_window)
        return;
    const Qt::WindowFlags current = m_window->flags();
    const Qt::WindowFlags wanted = enabled ? (current | Qt::WindowStaysOnTopHint)
                                           : (current & ~Qt::WindowStaysOnTopHint);
    if (wanted != current)
        m_window->setFlags(wanted);
}

void QuickPopupWindowHost::raiseAndActivate()
{
    if (!m_window)
        return;
    if (m_window->visibility() == QWindow::Minimized || !m_window->isVisible())
        m_window->showNormal();
    m_window->raise();
    m_window->requestActivate();
}

WindowPresentationCoordinator::WindowPresentationCoordinator(QObject* parent)
    : QObject(parent)
{
}

WindowPresentationCoordinator::~WindowPresentationCoordinator() = default;

WindowPresentationCoordinator::Mode WindowPresentationCoordinator::deriveMode(const Inputs& inputs)
{
    using State = PopupLifecycleController::State;

    if (inputs.state == State::AwaitingInput && inputs.hasRequest && inputs.requestLoaded)
        return Mode::PopupActive;
    if (inputs.state == State::SettingsOverlay)
        return Mode::SettingsPanel;
    if (inputs.initializing || (inputs.hasRequest && !inputs.requestLoaded))
        return Mode::Loading;
    return Mode::MainLayout;
}

bool WindowPresentationCoordinator::shouldStartWindowDrag(const PointerPress& press)
{
    if (!press.touch && press.button != Qt::LeftButton)
        return false;

    for (const PressedElement& element : press.chain) {
        if (element.isButton || element.isHyperlink || !element.interactiveRole.trimmed().isEmpty())
            return false;
    }
    return true;
}

WindowPresentationCoordinator::PressedElement WindowPresentationCoordinator::describeElement(const QQuickItem* item)
{
    PressedElement element;
    if (!item)
        return element;

    element.isButton = item->inherits("QQuickAbstractButton");
    element.interactiveRole = item->property("interactiveRole").toString();
    element.isHyperlink = !item->property("hoveredLink").toString().isEmpty()
        || item->property("isHyperlink").toBool();
    return element;
}

void WindowPresentationCoordinator::setLifecycleController(PopupLifecycleController* controller)
{
    if (m_lifecycle == controller)
        return;
    if (m_lifecycle)
        disconnect(m_lifecycle, nullptr, this, nullptr);

    m_lifecycle = controller;
    if (m_lifecycle) {
        connect(m_lifecycle, &PopupLifecycleController::stateChanged, this, &WindowPresentationCoordinator::refreshMode);
        connect(m_lifecycle, &PopupLifecycleController::requestChanged, this, &WindowPresentationCoordinator::refreshMode);
        connect(m_lifecycle, &PopupLifecycleController::requestLoadedChanged,
                this, &WindowPresentationCoordinator::refreshMode);
    }
    refreshMode();
}

void WindowPresentationCoordinator::attachWindow(QQuickWindow* window)
{
    if (!window)
        return;
    setWindowHost(std::make_shared<QuickPopupWindowHost>(window));
}

void WindowPresentationCoordinator::setWindowHostForTesting(std::shared_ptr<PopupWindowHost> host)
{
    setWindowHost(std::move(host));
}

void WindowPresentationCoordinator::setWindowHost(std::shared_ptr<PopupWindowHost> host)
{
    m_host = std::move(host);
    if (!m_host)
        return;
    m_host->setAlwaysOnTop(m_alwaysOnTop);
    if (m_mode == Mode::PopupActive)
        m_host->raiseAndActivate();
}

QString WindowPresentationCoordinator::modeName() const
{
    return QString::fromLatin1(QMetaEnum::fromType<Mode>().valueToKey(static_cast<int>(m_mode)));
}

void WindowPresentationCoordinator::setInitializing(bool initializing)
{
    if (m_initializing == initializing)
        return;
    m_initializing = initializing;
    Q_EMIT initializingChanged();
    refreshMode();
}

void WindowPresentationCoordinator::setAlwaysOnTop(bool enabled)
{
    if (m_alwaysOnTop == enabled)
        return;
    m_alwaysOnTop = enabled;
    qCInfo(lcWindow) << "Always-on-top" << (enabled ? "enabled" : "disabled");
    if (m_host)
        m_host->setAlwaysOnTop(enabled);
    Q_EMIT alwaysOnTopChanged();
}

bool WindowPresentationCoordinator::handlePointerPress(const PointerPress& press)
{
    if (!shouldStartWindowDrag(press))
        return false;
    if (!m_host) {
        qCDebug(lcWindow) << "Drag requested without an attached window";
        return false;
    }
    if (!m_host->startSystemMove()) {
        qCDebug(lcWindow) << "Window system refused to start a move";
        return false;
    }
    return true;
}

bool WindowPresentationCoordinator::handleHeaderPress(QQuickItem* origin, QQuickItem* headerRoot, int button, bool touch)
{
    PointerPress press;
    press.button = static_cast<Qt::MouseButton>(button);
    press.touch = touch;
    for (QQuickItem* item = origin; item; item = item->parentItem()) {
        press.chain.append(describeElement(item));
        if (item == headerRoot)
            break;
    }
    return handlePointerPress(press);
}

void WindowPresentationCoordinator::refreshMode()
{
    Inputs inputs;
    inputs.initializing = m_initializing;
    if (m_lifecycle) {
        inputs.state = m_lifecycle->state();
        inputs.hasRequest = m_lifecycle->hasRequest();
        inputs.requestLoaded = m_lifecycle->requestLoaded();
    }

    const Mode next = deriveMode(inputs);
    if (next == m_mode)
        return;

    m_mode = next;
    qCDebug(lcWindow) << "Presentation mode" << modeName();
    if (m_mode == Mode::PopupActive && m_host)
        m_host->raiseAndActivate();
    Q_EMIT modeChanged();
}
