#include <QtTest/QtTest>
#include <QQuickItem>
#include <QSignalSpy>

#include <memory>

#include "popup/PopupLifecycleController.hpp"
#include "popup/WindowPresentationCoordinator.hpp"

class FakeWindowHost : public PopupWindowHost {
public:
    bool startSystemMove() override
    {
        ++moveCount;
        return moveSucceeds;
    }
    void setAlwaysOnTop(bool enabled) override
    {
        alwaysOnTop = enabled;
        ++alwaysOnTopCalls;
    }
    void raiseAndActivate() override { ++raiseCount; }

    bool moveSucceeds = true;
    bool alwaysOnTop = false;
    int  moveCount = 0;
    int  alwaysOnTopCalls = 0;
    int  raiseCount = 0;
};

namespace {

using Mode = WindowPresentationCoordinator::Mode;
using State = PopupLifecycleController::State;

Mode derive(State state, bool hasRequest, bool loaded, bool initializing)
{
    WindowPresentationCoordinator::Inputs inputs;
    inputs.state = state;
    inputs.hasRequest = hasRequest;
    inputs.requestLoaded = loaded;
    inputs.initializing = initializing;
    return WindowPresentationCoordinator::deriveMode(inputs);
}

PopupRequest makeRequest(const QString& id)
{
    PopupRequest request;
    request.id = id;
    request.message = QStringLiteral("Proceed?");
    return request;
}

} // namespace

class WindowPresentationCoordinatorTest : public QObject {
    Q_OBJECT

private slots:
    void deriveModeFollowsPriorityOrder();
    void modeTracksLifecycle();
    void dragStartsOnEmptyHeaderSpace();
    void dragIgnoresInteractiveElements();
    void dragIgnoresSecondaryButton();
    void headerPressInspectsChainUpToRoot();
    void alwaysOnTopReachesWindow();
    void popupActiveRaisesWindow();
};

void WindowPresentationCoordinatorTest::deriveModeFollowsPriorityOrder()
{
    QCOMPARE(derive(State::AwaitingInput, true, true, false), Mode::PopupActive);
    QCOMPARE(derive(State::AwaitingInput, true, true, true), Mode::PopupActive);
    QCOMPARE(derive(State::AwaitingInput, true, false, false), Mode::Loading);
    QCOMPARE(derive(State::SettingsOverlay, true, true, false), Mode::SettingsPanel);
    QCOMPARE(derive(State::SettingsOverlay, true, false, true), Mode::SettingsPanel);
    QCOMPARE(derive(State::Idle, false, false, true), Mode::Loading);
    QCOMPARE(derive(State::Idle, false, false, false), Mode::MainLayout);
    QCOMPARE(derive(State::Completed, false, false, false), Mode::MainLayout);
}

void WindowPresentationCoordinatorTest::modeTracksLifecycle()
{
    PopupLifecycleController lifecycle;
    WindowPresentationCoordinator coordinator;
    coordinator.setLifecycleController(&lifecycle);
    QSignalSpy modeSpy(&coordinator, &WindowPresentationCoordinator::modeChanged);

    coordinator.setInitializing(true);
    QCOMPARE(coordinator.mode(), Mode::Loading);
    coordinator.setInitializing(false);
    QCOMPARE(coordinator.mode(), Mode::MainLayout);

    QVERIFY(lifecycle.receive(makeRequest(QStringLiteral("req"))));
    QCOMPARE(coordinator.mode(), Mode::Loading);
    lifecycle.markRequestLoaded();
    QCOMPARE(coordinator.mode(), Mode::PopupActive);
    QCOMPARE(coordinator.modeName(), QStringLiteral("PopupActive"));

    QVERIFY(lifecycle.openSettings());
    QCOMPARE(coordinator.mode(), Mode::SettingsPanel);
    QVERIFY(lifecycle.closeSettings());
    QCOMPARE(coordinator.mode(), Mode::PopupActive);

    QVERIFY(lifecycle.cancel());
    QCOMPARE(coordinator.mode(), Mode::MainLayout);
    QVERIFY(modeSpy.count() >= 6);
}

void WindowPresentationCoordinatorTest::dragStartsOnEmptyHeaderSpace()
{
    auto host = std::make_shared<FakeWindowHost>();
    WindowPresentationCoordinator coordinator;
    coordinator.setWindowHostForTesting(host);

    WindowPresentationCoordinator::PointerPress press;
    press.chain = {WindowPresentationCoordinator::PressedElement{}};
    QVERIFY(WindowPresentationCoordinator::shouldStartWindowDrag(press));
    QVERIFY(coordinator.handlePointerPress(press));
    QCOMPARE(host->moveCount, 1);

    press.touch = true;
    press.button = Qt::NoButton;
    QVERIFY(coordinator.handlePointerPress(press));
    QCOMPARE(host->moveCount, 2);

    host->moveSucceeds = false;
    QVERIFY(!coordinator.handlePointerPress(press));
}

void WindowPresentationCoordinatorTest::dragIgnoresInteractiveElements()
{
    WindowPresentationCoordinator::PressedElement plain;
    WindowPresentationCoordinator::PressedElement button;
    button.isButton = true;
    WindowPresentationCoordinator::PressedElement role;
    role.interactiveRole = QStringLiteral("menuitem");
    WindowPresentationCoordinator::PressedElement link;
    link.isHyperlink = true;

    for (const auto& element : {button, role, link}) {
        WindowPresentationCoordinator::PointerPress press;
        press.chain = {element, plain};
        QVERIFY(!WindowPresentationCoordinator::shouldStartWindowDrag(press));
        press.chain = {plain, element};
        QVERIFY(!WindowPresentationCoordinator::shouldStartWindowDrag(press));
    }

    WindowPresentationCoordinator::PressedElement blankRole;
    blankRole.interactiveRole = QStringLiteral("  ");
    WindowPresentationCoordinator::PointerPress press;
    press.chain = {blankRole};
    QVERIFY(WindowPresentationCoordinator::shouldStartWindowDrag(press));
}

void WindowPresentationCoordinatorTest::dragIgnoresSecondaryButton()
{
    auto host = std::make_shared<FakeWindowHost>();
    WindowPresentationCoordinator coordinator;
    coordinator.setWindowHostForTesting(host);

    WindowPresentationCoordinator::PointerPress press;
    press.button = Qt::RightButton;
    QVERIFY(!coordinator.handlePointerPress(press));
    press.button = Qt::MiddleButton;
    QVERIFY(!coordinator.handlePointerPress(press));
    QCOMPARE(host->moveCount, 0);
}

void WindowPresentationCoordinatorTest::headerPressInspectsChainUpToRoot()
{
    auto host = std::make_shared<FakeWindowHost>();
    WindowPresentationCoordinator coordinator;
    coordinator.setWindowHostForTesting(host);

    QQuickItem outer;
    outer.setProperty("interactiveRole", QStringLiteral("toolbar"));
    QQuickItem header;
    header.setParentItem(&outer);
    QQuickItem title;
    title.setParentItem(&header);
    QQuickItem link;
    link.setParentItem(&header);
    link.setProperty("isHyperlink", true);
    QQuickItem iconInButton;
    QQuickItem roleButton;
    roleButton.setParentItem(&header);
    roleButton.setProperty("interactiveRole", QStringLiteral("button"));
    iconInButton.setParentItem(&roleButton);

    // The interactive ancestor above the header root is outside the inspected chain.
    QVERIFY(coordinator.handleHeaderPress(&title, &header, Qt::LeftButton));
    QVERIFY(coordinator.handleHeaderPress(&header, &header, Qt::LeftButton));
    QCOMPARE(host->moveCount, 2);

    QVERIFY(!coordinator.handleHeaderPress(&link, &header, Qt::LeftButton));
    QVERIFY(!coordinator.handleHeaderPress(&iconInButton, &header, Qt::LeftButton));
    QVERIFY(!coordinator.handleHeaderPress(&title, &header, Qt::RightButton));
    QVERIFY(coordinator.handleHeaderPress(&title, &header, Qt::NoButton, true));
    QCOMPARE(host->moveCount, 3);

    QVERIFY(!WindowPresentationCoordinator::describeElement(&title).isButton);
    QCOMPARE(WindowPresentationCoordinator::describeElement(&roleButton).interactiveRole, QStringLiteral("button"));
}

void WindowPresentationCoordinatorTest::alwaysOnTopReachesWindow()
{
    auto host = std::make_shared<FakeWindowHost>();
    WindowPresentationCoordinator coordinator;
    QVERIFY(coordinator.alwaysOnTop());

    coordinator.setWindowHostForTesting(host);
    QVERIFY(host->alwaysOnTop);
    QCOMPARE(host->alwaysOnTopCalls, 1);

    QSignalSpy spy(&coordinator, &WindowPresentationCoordinator::alwaysOnTopChanged);
    coordinator.setAlwaysOnTop(false);
    QVERIFY(!host->alwaysOnTop);
    coordinator.setAlwaysOnTop(false);
    QCOMPARE(spy.count(), 1);
    QCOMPARE(host->alwaysOnTopCalls, 2);
}

void WindowPresentationCoordinatorTest::popupActiveRaisesWindow()
{
    auto host = std::make_shared<FakeWindowHost>();
    PopupLifecycleController lifecycle;
    WindowPresentationCoordinator coordinator;
    coordinator.setLifecycleController(&lifecycle);
    coordinator.setWindowHostForTesting(host);

    QVERIFY(lifecycle.receive(makeRequest(QStringLiteral("req"))));
    QCOMPARE(host->raiseCount, 0);
    QTRY_COMPARE_WITH_TIMEOUT(coordinator.mode(), Mode::PopupActive, 500);
    QCOMPARE(host->raiseCount, 1);

    QVERIFY(lifecycle.openSettings());
    QVERIFY(lifecycle.closeSettings());
    QCOMPARE(host->raiseCount, 2);
}

QTEST_MAIN(WindowPresentationCoordinatorTest)
#include "WindowPresentationCoordinatorTest.moc"
