#include <QtTest/QtTest>
#include <QElapsedTimer>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QLocalSocket>
#include <QSignalSpy>
#include <QTemporaryDir>

#include <memory>

#include "ipc/PopupIpcServer.hpp"
#include "popup/PopupLifecycleController.hpp"

namespace {

bool waitForLine(QLocalSocket& socket, int timeoutMs = 2000)
{
    QElapsedTimer timer;
    timer.start();
    while (!socket.canReadLine()) {
        if (timer.elapsed() > timeoutMs)
            return false;
        QTest::qWait(10);
    }
    return true;
}

QJsonObject readReply(QLocalSocket& socket)
{
    return QJsonDocument::fromJson(socket.readLine().trimmed()).object();
}

QByteArray requestLine(const QString& id, const QString& message = QStringLiteral("Continue?"))
{
    QJsonObject request{
        {QStringLiteral("id"), id},
        {QStringLiteral("message"), message},
        {QStringLiteral("predefined_options"), QJsonArray{QStringLiteral("Yes"), QStringLiteral("No")}},
        {QStringLiteral("is_markdown"), false},
    };
    return QJsonDocument(request).toJson(QJsonDocument::Compact) + '\n';
}

} // namespace

class PopupIpcServerTest : public QObject {
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void answeredRequestRepliesOnSameConnection();
    void cancelledRequestRepliesWithCancelledPayload();
    void malformedRequestGetsFailureReply();
    void secondRequestWhileAwaitingIsRefused();
    void supersededRequestIsReleased();
    void answerForDisconnectedRequesterIsDropped();
    void requestSplitAcrossWritesIsAssembled();

private:
    std::unique_ptr<QLocalSocket> connectClient();

    std::unique_ptr<QTemporaryDir>            m_dir;
    std::unique_ptr<PopupLifecycleController> m_lifecycle;
    std::unique_ptr<PopupIpcServer>           m_server;
};

void PopupIpcServerTest::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
    m_lifecycle = std::make_unique<PopupLifecycleController>();
    m_server = std::make_unique<PopupIpcServer>(m_lifecycle.get());
    m_server->setSocketPath(m_dir->filePath(QStringLiteral("popup.sock")));

    QString error;
    QVERIFY2(m_server->start(&error), qPrintable(error));
    QVERIFY(m_server->isListening());
}

void PopupIpcServerTest::cleanup()
{
    m_server.reset();
    m_lifecycle.reset();
    m_dir.reset();
}

std::unique_ptr<QLocalSocket> PopupIpcServerTest::connectClient()
{
    auto socket = std::make_unique<QLocalSocket>();
    socket->connectToServer(m_server->socketPath());
    if (!socket->waitForConnected(2000))
        return nullptr;
    return socket;
}

void PopupIpcServerTest::answeredRequestRepliesOnSameConnection()
{
    QSignalSpy deliveredSpy(m_server.get(), &PopupIpcServer::requestDelivered);
    auto client = connectClient();
    QVERIFY(client);
    client->write(requestLine(QStringLiteral("req-1")));
    client->flush();

    QTRY_COMPARE_WITH_TIMEOUT(deliveredSpy.count(), 1, 2000);
    QCOMPARE(m_lifecycle->state(), PopupLifecycleController::State::AwaitingInput);
    QCOMPARE(m_server->pendingRequestCount(), 1);

    QVERIFY(m_lifecycle->submit(QStringLiteral("ship it"), {QStringLiteral("Yes")}));

    QVERIFY(waitForLine(*client));
    const QJsonObject reply = readReply(*client);
    QCOMPARE(reply.value(QStringLiteral("id")).toString(), QStringLiteral("req-1"));
    QVERIFY(reply.value(QStringLiteral("success")).toBool());
    QVERIFY(reply.value(QStringLiteral("error")).isNull());

    const QJsonObject response =
        QJsonDocument::fromJson(reply.value(QStringLiteral("response")).toString().toUtf8()).object();
    QCOMPARE(response.value(QStringLiteral("user_input")).toString(), QStringLiteral("ship it"));
    QCOMPARE(response.value(QStringLiteral("selected_options")).toArray().first().toString(), QStringLiteral("Yes"));
    QCOMPARE(response.value(QStringLiteral("auto_submitted")).toBool(), false);
    QCOMPARE(m_server->pendingRequestCount(), 0);
}

void PopupIpcServerTest::cancelledRequestRepliesWithCancelledPayload()
{
    QSignalSpy deliveredSpy(m_server.get(), &PopupIpcServer::requestDelivered);
    auto client = connectClient();
    QVERIFY(client);
    client->write(requestLine(QStringLiteral("req-cancel")));
    client->flush();
    QTRY_COMPARE_WITH_TIMEOUT(deliveredSpy.count(), 1, 2000);

    QVERIFY(m_lifecycle->cancel());
    QVERIFY(waitForLine(*client));
    const QJsonObject reply = readReply(*client);
    QVERIFY(reply.value(QStringLiteral("success")).toBool());
    const QJsonObject response =
        QJsonDocument::fromJson(reply.value(QStringLiteral("response")).toString().toUtf8()).object();
    QVERIFY(response.value(QStringLiteral("cancelled")).toBool());
}

void PopupIpcServerTest::malformedRequestGetsFailureReply()
{
    auto client = connectClient();
    QVERIFY(client);
    client->write(QByteArrayLiteral("{\"id\":\"broken\",\"message\":\n"));
    client->flush();

    QVERIFY(waitForLine(*client));
    const QJsonObject reply = readReply(*client);
    QVERIFY(!reply.value(QStringLiteral("success")).toBool());
    QVERIFY(!reply.value(QStringLiteral("error")).toString().isEmpty());
    QCOMPARE(m_lifecycle->state(), PopupLifecycleController::State::Idle);

    auto noId = connectClient();
    QVERIFY(noId);
    noId->write(QByteArrayLiteral("{\"message\":\"who am I\"}\n"));
    noId->flush();
    QVERIFY(waitForLine(*noId));
    const QJsonObject noIdReply = readReply(*noId);
    QVERIFY(!noIdReply.value(QStringLiteral("success")).toBool());
    QVERIFY(noIdReply.value(QStringLiteral("id")).toString().isEmpty());
}

void PopupIpcServerTest::secondRequestWhileAwaitingIsRefused()
{
    QSignalSpy deliveredSpy(m_server.get(), &PopupIpcServer::requestDelivered);
    auto first = connectClient();
    QVERIFY(first);
    first->write(requestLine(QStringLiteral("req-a")));
    first->flush();
    QTRY_COMPARE_WITH_TIMEOUT(deliveredSpy.count(), 1, 2000);

    for (const QString& id : {QStringLiteral("req-a"), QStringLiteral("req-b")}) {
        auto other = connectClient();
        QVERIFY(other);
        other->write(requestLine(id));
        other->flush();
        QVERIFY(waitForLine(*other));
        const QJsonObject reply = readReply(*other);
        QCOMPARE(reply.value(QStringLiteral("id")).toString(), id);
        QVERIFY(!reply.value(QStringLiteral("success")).toBool());
    }

    QCOMPARE(deliveredSpy.count(), 1);
    QCOMPARE(m_lifecycle->requestId(), QStringLiteral("req-a"));
    QVERIFY(!first->canReadLine());

    QVERIFY(m_lifecycle->submit(QStringLiteral("done")));
    QVERIFY(waitForLine(*first));
    QVERIFY(readReply(*first).value(QStringLiteral("success")).toBool());
}

void PopupIpcServerTest::supersededRequestIsReleased()
{
    QSignalSpy deliveredSpy(m_server.get(), &PopupIpcServer::requestDelivered);
    auto first = connectClient();
    QVERIFY(first);
    first->write(requestLine(QStringLiteral("old")));
    first->flush();
    QTRY_COMPARE_WITH_TIMEOUT(deliveredSpy.count(), 1, 2000);
    QVERIFY(m_lifecycle->openSettings());

    auto second = connectClient();
    QVERIFY(second);
    second->write(requestLine(QStringLiteral("new")));
    second->flush();
    QTRY_COMPARE_WITH_TIMEOUT(deliveredSpy.count(), 2, 2000);

    QVERIFY(waitForLine(*first));
    const QJsonObject released = readReply(*first);
    QCOMPARE(released.value(QStringLiteral("id")).toString(), QStringLiteral("old"));
    QVERIFY(!released.value(QStringLiteral("success")).toBool());
    QCOMPARE(m_lifecycle->requestId(), QStringLiteral("new"));
    QCOMPARE(m_server->pendingRequestCount(), 1);
}

void PopupIpcServerTest::answerForDisconnectedRequesterIsDropped()
{
    QSignalSpy deliveredSpy(m_server.get(), &PopupIpcServer::requestDelivered);
    QSignalSpy replySpy(m_server.get(), &PopupIpcServer::replySent);
    auto client = connectClient();
    QVERIFY(client);
    client->write(requestLine(QStringLiteral("orphan")));
    client->flush();
    QTRY_COMPARE_WITH_TIMEOUT(deliveredSpy.count(), 1, 2000);

    client->disconnectFromServer();
    client.reset();
    QTest::qWait(100);

    // The popup stays up until the user answers.
    QCOMPARE(m_lifecycle->requestId(), QStringLiteral("orphan"));
    QVERIFY(m_lifecycle->submit(QStringLiteral("late")));
    QCOMPARE(replySpy.count(), 0);
    QCOMPARE(m_server->pendingRequestCount(), 0);
    QCOMPARE(m_lifecycle->state(), PopupLifecycleController::State::Idle);
}

void PopupIpcServerTest::requestSplitAcrossWritesIsAssembled()
{
    QSignalSpy deliveredSpy(m_server.get(), &PopupIpcServer::requestDelivered);
    auto client = connectClient();
    QVERIFY(client);

    const QByteArray line = requestLine(QStringLiteral("split"));
    const int half = line.size() / 2;
    client->write(line.left(half));
    client->flush();
    QTest::qWait(50);
    QCOMPARE(deliveredSpy.count(), 0);

    client->write(line.mid(half));
    client->flush();
    QTRY_COMPARE_WITH_TIMEOUT(deliveredSpy.count(), 1, 2000);
    QCOMPARE(deliveredSpy.at(0).at(0).toString(), QStringLiteral("split"));
}

QTEST_MAIN(PopupIpcServerTest)
#include "PopupIpcServerTest.moc"
