#pragma once

#include <QList>
#include <QObject>
#include <QPointer>
#include <QString>

#include <memory>

#include "popup/PopupLifecycleController.hpp"

class QQuickItem;
class QQuickWindow;

//! Native window operations the coordinator needs.
class PopupWindowHost {
public:
    virtual ~PopupWindowHost() = default;

    virtual bool startSystemMove() = 0;
    virtual void setAlwaysOnTop(bool enabled) = 0;
    virtual void raiseAndActivate() = 0;
};

class QuickPopupWindowHost final : public PopupWindowHost {
public:
    explicit QuickPopupWindowHost(QQuickWindow* window);

    bool startSystemMove() override;
    void setAlwaysOnTop(bool enabled) override;
    void raiseAndActivate() override;

    QQuickWindow* window() const { return m_window; }

private:
    QPointer<QQuickWindow> m_window;
};

class WindowPresentationCoordinator : public QObject {
    Q_OBJECT
    Q_PROPERTY(Mode mode READ mode NOTIFY modeChanged)
    Q_PROPERTY(QString modeName READ modeName NOTIFY modeChanged)
    Q_PROPERTY(bool initializing READ initializing WRITE setInitializing NOTIFY initializingChanged)
    Q_PROPERTY(bool alwaysOnTop READ alwaysOnTop WRITE setAlwaysOnTop NOTIFY alwaysOnTopChanged)

public:
    enum class Mode {
        Loading,
        SettingsPanel,
        PopupActive,
        MainLayout,
    };
    Q_ENUM(Mode)

    struct Inputs {
        PopupLifecycleController::State state = PopupLifecycleController::State::Idle;
        bool hasRequest = false;
        bool requestLoaded = false;
        bool initializing = false;
    };

    //! One element on the path from the pressed item up to the header root.
    struct PressedElement {
        bool    isButton = false;
        QString interactiveRole;
        bool    isHyperlink = false;
    };

    struct PointerPress {
        Qt::MouseButton       button = Qt::LeftButton;
        bool                  touch = false;
        QList<PressedElement> chain;
    };

    explicit WindowPresentationCoordinator(QObject* parent = nullptr);
    ~WindowPresentationCoordinator() override;

    static Mode deriveMode(const Inputs& inputs);
    static bool shouldStartWindowDrag(const PointerPress& press);
    static PressedElement describeElement(const QQuickItem* item);

    void setLifecycleController(PopupLifecycleController* controller);
    void attachWindow(QQuickWindow* window);
    void setWindowHostForTesting(std::shared_ptr<PopupWindowHost> host);

    Mode mode() const { return m_mode; }
    QString modeName() const;
    bool initializing() const { return m_initializing; }
    void setInitializing(bool initializing);
    bool alwaysOnTop() const { return m_alwaysOnTop; }
    void setAlwaysOnTop(bool enabled);

    bool handlePointerPress(const PointerPress& press);
    Q_INVOKABLE bool handleHeaderPress(QQuickItem* origin, QQuickItem* headerRoot, int button, bool touch = false);

signals:
    void modeChanged();
    void initializingChanged();
    void alwaysOnTopChanged();

private slots:
    void refreshMode();

private:
    void setWindowHost(std::shared_ptr<PopupWindowHost> host);

    QPointer<PopupLifecycleController> m_lifecycle;
    std::shared_ptr<PopupWindowHost>   m_host;
    Mode                               m_mode = Mode::MainLayout;
    bool                               m_initializing = false;
    bool                               m_alwaysOnTop = true;
};
