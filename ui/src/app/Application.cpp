#include "Application.hpp"

#include <QLoggingCategory>
#include <QQmlContext>
#include <QQuickWindow>

#include "app/AutoSubmitSettingsController.hpp"
#include "grpc/PopupConfigClient.hpp"
#include "ipc/McpRequestFile.hpp"
#include "ipc/PopupIpcServer.hpp"
#include "popup/PopupLifecycleController.hpp"
#include "popup/TimeoutAutoSubmitEngine.hpp"
#include "popup/WindowPresentationCoordinator.hpp"

Q_LOGGING_CATEGORY(lcApp, "hengjing.popup.app")

namespace {

constexpr char kConfigEndpointEnv[] = "HENGJING_CONFIG_ENDPOINT";
constexpr char kSocketPathEnv[] = "HENGJING_UI_SOCKET";
constexpr char kContinuePromptEnv[] = "HENGJING_CONTINUE_PROMPT";
constexpr char kAlwaysOnTopEnv[] = "HENGJING_UI_ALWAYS_ON_TOP";

std::optional<QString> envValue(const char* key)
{
    if (!qEnvironmentVariableIsSet(key))
        return std::nullopt;
    return qEnvironmentVariable(key);
}

std::optional<bool> envBool(const char* key)
{
    const auto valueOpt = envValue(key);
    if (!valueOpt.has_value())
        return std::nullopt;
    const QString normalized = valueOpt->trimmed().toLower();
    if (normalized.isEmpty())
        return std::nullopt;
    if (normalized == QStringLiteral("1") || normalized == QStringLiteral("true") ||
        normalized == QStringLiteral("yes") || normalized == QStringLiteral("on"))
        return true;
    if (normalized == QStringLiteral("0") || normalized == QStringLiteral("false") ||
        normalized == QStringLiteral("no") || normalized == QStringLiteral("off"))
        return false;
    qCWarning(lcApp) << "Invalid value" << *valueOpt << "in" << QString::fromLatin1(key)
                     << "- expected a boolean (true/false)";
    return std::nullopt;
}

} // namespace

Application::Application(QQmlApplicationEngine& engine, QObject* parent)
    : QObject(parent)
    , m_engine(engine)
    , m_settings(std::make_unique<AutoSubmitSettingsController>())
    , m_autoSubmit(std::make_unique<TimeoutAutoSubmitEngine>())
    , m_lifecycle(std::make_unique<PopupLifecycleController>())
    , m_windowCoordinator(std::make_unique<WindowPresentationCoordinator>())
{
    m_autoSubmit->setSettingsController(m_settings.get());
    m_lifecycle->setAutoSubmitEngine(m_autoSubmit.get());
    m_windowCoordinator->setLifecycleController(m_lifecycle.get());
    m_windowCoordinator->setInitializing(m_initializing);
    m_ipcServer = std::make_unique<PopupIpcServer>(m_lifecycle.get());

    connect(m_settings.get(), &AutoSubmitSettingsController::loadedChanged,
            this, &Application::handleSettingsLoaded);
    connect(m_settings.get(), &AutoSubmitSettingsController::continuePromptChanged, this, [this]() {
        if (m_continuePromptOverride.isEmpty())
            m_autoSubmit->setContinuePrompt(m_settings->continuePrompt());
    });
    connect(m_lifecycle.get(), &PopupLifecycleController::responseReady,
            this, &Application::handleResponseReady);

    exposeToQml();

    connect(&m_engine, &QQmlApplicationEngine::objectCreated, this,
            [this](QObject* object, const QUrl&) { attachWindow(object); });
}

Application::~Application()
{
    stop();
}

void Application::configureParser(QCommandLineParser& parser) const {
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addOption({"config-endpoint",
                      tr("gRPC host:port of the host configuration service (empty keeps settings in memory)"),
                      tr("endpoint"), QString()});
    parser.addOption({"socket-path", tr("Local socket the MCP host delivers requests on"),
                      tr("path"), QString()});
    parser.addOption({"mcp-request", tr("Answer a single request read from a JSON file and exit"),
                      tr("file"), QString()});
    parser.addOption({"continue-prompt", tr("Text submitted by the \"continue\" auto-submit source"),
                      tr("text"), QString()});
    parser.addOption({"always-on-top", tr("Keep the popup window above other windows")});
    parser.addOption({"no-always-on-top", tr("Let other windows cover the popup")});
}

bool Application::applyParser(const QCommandLineParser& parser) {
    m_startupError.clear();

    m_configEndpoint = parser.value("config-endpoint").trimmed();
    if (m_configEndpoint.isEmpty()) {
        if (const auto envEndpoint = envValue(kConfigEndpointEnv); envEndpoint.has_value())
            m_configEndpoint = envEndpoint->trimmed();
    }

    QString socketPath = parser.value("socket-path").trimmed();
    if (socketPath.isEmpty()) {
        if (const auto envSocket = envValue(kSocketPathEnv); envSocket.has_value())
            socketPath = envSocket->trimmed();
    }
    m_ipcServer->setSocketPath(socketPath);

    m_continuePromptOverride = parser.value("continue-prompt");
    if (m_continuePromptOverride.trimmed().isEmpty()) {
        if (const auto envPrompt = envValue(kContinuePromptEnv); envPrompt.has_value())
            m_continuePromptOverride = *envPrompt;
    }
    if (m_continuePromptOverride.trimmed().isEmpty())
        m_continuePromptOverride.clear();
    else
        m_autoSubmit->setContinuePrompt(m_continuePromptOverride);

    bool alwaysOnTop = true;
    if (const auto envOnTop = envBool(kAlwaysOnTopEnv); envOnTop.has_value())
        alwaysOnTop = *envOnTop;
    if (parser.isSet("always-on-top"))
        alwaysOnTop = true;
    if (parser.isSet("no-always-on-top"))
        alwaysOnTop = false;
    m_windowCoordinator->setAlwaysOnTop(alwaysOnTop);

    m_oneShotRequest.reset();
    const QString requestFile = parser.value("mcp-request").trimmed();
    if (!requestFile.isEmpty()) {
        QString error;
        m_oneShotRequest = readMcpRequestFile(requestFile, &error);
        if (!m_oneShotRequest) {
            qCWarning(lcApp) << "Cannot use request file" << requestFile << ":" << error;
            m_startupError = error;
            return false;
        }
        qCInfo(lcApp) << "One-shot mode for request" << m_oneShotRequest->id;
    }

    ensureConfigClient();
    return true;
}

QString Application::socketPath() const
{
    return m_ipcServer->socketPath();
}

void Application::setConfigClientOverrideForTesting(std::shared_ptr<PopupConfigClientInterface> client)
{
    m_configClientOverride = std::move(client);
    ensureConfigClient();
}

void Application::ensureConfigClient()
{
    if (m_configClientOverride) {
        m_configClient = m_configClientOverride;
    } else if (m_configEndpoint.isEmpty()) {
        if (!std::dynamic_pointer_cast<InProcessPopupConfigClient>(m_configClient)) {
            qCInfo(lcApp) << "No config endpoint configured; auto-submit settings live for this session only";
            m_configClient = std::make_shared<InProcessPopupConfigClient>();
        }
    } else {
        auto grpcClient = std::dynamic_pointer_cast<PopupConfigClient>(m_configClient);
        if (!grpcClient) {
            grpcClient = std::make_shared<PopupConfigClient>();
            m_configClient = grpcClient;
        }
        grpcClient->setEndpoint(m_configEndpoint);
    }
    m_settings->setConfigClient(m_configClient);
}

void Application::start() {
    if (m_started)
        return;
    m_started = true;

    ensureConfigClient();
    setInitializing(!m_settings->loaded());
    m_settings->load();

    if (m_oneShotRequest) {
        if (!m_lifecycle->receive(*m_oneShotRequest)) {
            m_startupError = tr("Request %1 could not be shown").arg(m_oneShotRequest->id);
            Q_EMIT startupFailed(m_startupError);
        }
        return;
    }

    QString error;
    if (!m_ipcServer->start(&error)) {
        m_startupError = error;
        Q_EMIT startupFailed(error);
    }
}

void Application::stop() {
    if (!m_started)
        return;
    m_started = false;

    // Unsaved edits still reach the host before the process goes away.
    m_settings->flush();
    m_ipcServer->stop();
    m_autoSubmit->disarm();
}

void Application::handleSettingsLoaded()
{
    if (m_settings->loaded())
        setInitializing(false);
}

void Application::handleResponseReady(const PopupResponse& response)
{
    if (!m_oneShotRequest || response.requestId != m_oneShotRequest->id)
        return;
    qCInfo(lcApp) << "One-shot request" << response.requestId
                  << (response.isCancelled() ? "cancelled" : "answered");
    Q_EMIT oneShotCompleted(formatMcpStdoutResponse(response));
}

void Application::setInitializing(bool initializing)
{
    if (m_initializing == initializing)
        return;
    m_initializing = initializing;
    m_windowCoordinator->setInitializing(initializing);
    Q_EMIT initializingChanged();
}

void Application::exposeToQml() {
    m_engine.rootContext()->setContextProperty(QStringLiteral("appController"), this);
    m_engine.rootContext()->setContextProperty(QStringLiteral("popupController"), m_lifecycle.get());
    m_engine.rootContext()->setContextProperty(QStringLiteral("autoSubmitEngine"), m_autoSubmit.get());
    m_engine.rootContext()->setContextProperty(QStringLiteral("autoSubmitSettings"), m_settings.get());
    m_engine.rootContext()->setContextProperty(QStringLiteral("windowCoordinator"), m_windowCoordinator.get());
}

void Application::attachWindow(QObject* object) {
    auto* window = qobject_cast<QQuickWindow*>(object);
    if (!window && object)
        window = object->findChild<QQuickWindow*>();
    if (!window)
        return;

    m_windowCoordinator->attachWindow(window);
}
