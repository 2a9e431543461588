#pragma once

#include <QCommandLineParser>
#include <QObject>
#include <QPointer>
#include <QQmlApplicationEngine>
#include <QString>

#include <memory>
#include <optional>

#include "models/PopupTypes.hpp"

class AutoSubmitSettingsController;   // forward decl (app/AutoSubmitSettingsController.hpp)
class PopupConfigClientInterface;     // forward decl (grpc/PopupConfigClient.hpp)
class PopupIpcServer;                 // forward decl (ipc/PopupIpcServer.hpp)
class PopupLifecycleController;       // forward decl (popup/PopupLifecycleController.hpp)
class TimeoutAutoSubmitEngine;        // forward decl (popup/TimeoutAutoSubmitEngine.hpp)
class WindowPresentationCoordinator;  // forward decl (popup/WindowPresentationCoordinator.hpp)

class Application : public QObject {
    Q_OBJECT
    Q_PROPERTY(bool    initializing   READ initializing   NOTIFY initializingChanged)
    Q_PROPERTY(bool    oneShotMode    READ oneShotMode    CONSTANT)
    Q_PROPERTY(QString configEndpoint READ configEndpoint CONSTANT)
    Q_PROPERTY(QString socketPath     READ socketPath     CONSTANT)

public:
    explicit Application(QQmlApplicationEngine& engine, QObject* parent = nullptr);
    ~Application() override;

    // CLI
    void configureParser(QCommandLineParser& parser) const;
    bool applyParser(const QCommandLineParser& parser);

    bool    initializing() const { return m_initializing; }
    bool    oneShotMode() const { return m_oneShotRequest.has_value(); }
    QString configEndpoint() const { return m_configEndpoint; }
    QString socketPath() const;
    QString startupError() const { return m_startupError; }

    PopupLifecycleController*      lifecycleController() const { return m_lifecycle.get(); }
    TimeoutAutoSubmitEngine*       autoSubmitEngine() const { return m_autoSubmit.get(); }
    AutoSubmitSettingsController*  settingsController() const { return m_settings.get(); }
    WindowPresentationCoordinator* windowCoordinator() const { return m_windowCoordinator.get(); }
    PopupIpcServer*                ipcServer() const { return m_ipcServer.get(); }

    // Test helpers
    void setConfigClientOverrideForTesting(std::shared_ptr<PopupConfigClientInterface> client);
    std::shared_ptr<PopupConfigClientInterface> activeConfigClientForTesting() const { return m_configClient; }

public slots:
    void start();
    void stop();

signals:
    void initializingChanged();
    void startupFailed(const QString& message);
    //! One-shot mode only: text to print on stdout before quitting.
    void oneShotCompleted(const QString& output);

private:
    void exposeToQml();
    void attachWindow(QObject* object);
    void ensureConfigClient();
    void handleSettingsLoaded();
    void handleResponseReady(const PopupResponse& response);
    void setInitializing(bool initializing);

    QQmlApplicationEngine& m_engine;

    std::unique_ptr<AutoSubmitSettingsController>  m_settings;
    std::unique_ptr<TimeoutAutoSubmitEngine>       m_autoSubmit;
    std::unique_ptr<PopupLifecycleController>      m_lifecycle;
    std::unique_ptr<WindowPresentationCoordinator> m_windowCoordinator;
    std::unique_ptr<PopupIpcServer>                m_ipcServer;

    std::shared_ptr<PopupConfigClientInterface> m_configClient;
    std::shared_ptr<PopupConfigClientInterface> m_configClientOverride;

    QString                     m_configEndpoint;
    QString                     m_continuePromptOverride;
    std::optional<PopupRequest> m_oneShotRequest;
    QString                     m_startupError;
    bool                        m_initializing = true;
    bool                        m_started = false;
};
