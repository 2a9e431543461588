#include "PopupIpcServer.hpp"

#include "popup/PopupLifecycleController.hpp"

#include <QDir>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonValue>
#include <QLocalServer>
#include <QLocalSocket>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(lcPopupIpc, "hengjing.popup.ipc")

namespace {

constexpr int kMaxRequestLineBytes = 4 * 1024 * 1024;
constexpr char kHandledProperty[] = "hengjingRequestHandled";

} // namespace

PopupIpcServer::PopupIpcServer(PopupLifecycleController* lifecycle, QObject* parent)
    : QObject(parent)
    , m_lifecycle(lifecycle)
    , m_socketPath(defaultSocketPath())
{
    if (m_lifecycle) {
        connect(m_lifecycle, &PopupLifecycleController::responseReady,
                this, &PopupIpcServer::handleResponseReady);
        connect(m_lifecycle, &PopupLifecycleController::requestSuperseded,
                this, &PopupIpcServer::handleRequestSuperseded);
    }
}

PopupIpcServer::~PopupIpcServer()
{
    stop();
}

QString PopupIpcServer::defaultSocketPath()
{
    return QDir::temp().filePath(QStringLiteral("hengjing-ui.sock"));
}

void PopupIpcServer::setSocketPath(const QString& path)
{
    const QString trimmed = path.trimmed();
    m_socketPath = trimmed.isEmpty() ? defaultSocketPath() : trimmed;
}

bool PopupIpcServer::isListening() const
{
    return m_server && m_server->isListening();
}

bool PopupIpcServer::start(QString* errorMessage)
{
    if (isListening())
        return true;

    if (!m_server) {
        m_server = new QLocalServer(this);
        m_server->setSocketOptions(QLocalServer::UserAccessOption);
        connect(m_server, &QLocalServer::newConnection, this, &PopupIpcServer::handleNewConnection);
    }

    // A crashed previous instance leaves the socket file behind.
    QLocalServer::removeServer(m_socketPath);

    if (!m_server->listen(m_socketPath)) {
        const QString error = m_server->errorString();
        qCWarning(lcPopupIpc) << "Could not listen on" << m_socketPath << ":" << error;
        if (errorMessage)
            *errorMessage = tr("Cannot listen on %1: %2").arg(m_socketPath, error);
        return false;
    }

    qCInfo(lcPopupIpc) << "Listening for popup requests on" << m_server->fullServerName();
    Q_EMIT listeningChanged();
    return true;
}

void PopupIpcServer::stop()
{
    const QList<QLocalSocket*> sockets = m_readBuffers.keys();
    m_readBuffers.clear();
    for (QLocalSocket* socket : sockets) {
        disconnect(socket, nullptr, this, nullptr);
        socket->abort();
        socket->deleteLater();
    }
    m_pending.clear();

    if (m_server && m_server->isListening()) {
        m_server->close();
        qCInfo(lcPopupIpc) << "Popup request server stopped";
        Q_EMIT listeningChanged();
    }
}

void PopupIpcServer::handleNewConnection()
{
    while (QLocalSocket* socket = m_server->nextPendingConnection()) {
        m_readBuffers.insert(socket, QByteArray());
        connect(socket, &QLocalSocket::readyRead, this, [this, socket]() { handleReadyRead(socket); });
        connect(socket, &QLocalSocket::disconnected, this, [this, socket]() { handleDisconnected(socket); });
        qCDebug(lcPopupIpc) << "Requester connected";
    }
}

void PopupIpcServer::handleReadyRead(QLocalSocket* socket)
{
    auto it = m_readBuffers.find(socket);
    if (it == m_readBuffers.end())
        return;

    it->append(socket->readAll());
    if (socket->property(kHandledProperty).toBool()) {
        // One request per connection; anything after it is ignored.
        it->clear();
        return;
    }

    const int newline = it->indexOf('\n');
    if (newline < 0) {
        if (it->size() > kMaxRequestLineBytes) {
            qCWarning(lcPopupIpc) << "Request line exceeds" << kMaxRequestLineBytes << "bytes";
            socket->setProperty(kHandledProperty, true);
            it->clear();
            sendReply(socket, {}, {}, false, tr("Request too large"));
            socket->disconnectFromServer();
        }
        return;
    }

    const QByteArray line = it->left(newline).trimmed();
    it->clear();
    socket->setProperty(kHandledProperty, true);
    processLine(socket, line);
}

void PopupIpcServer::processLine(QLocalSocket* socket, const QByteArray& line)
{
    QString parseError;
    const auto request = PopupRequest::fromJsonBytes(line, &parseError);
    if (!request) {
        qCWarning(lcPopupIpc) << "Malformed popup request:" << parseError;
        QString id;
        const QJsonDocument doc = QJsonDocument::fromJson(line);
        if (doc.isObject())
            id = doc.object().value(QStringLiteral("id")).toString();
        sendReply(socket, id, {}, false, parseError);
        socket->disconnectFromServer();
        return;
    }

    if (!m_lifecycle) {
        sendReply(socket, request->id, {}, false, tr("Popup is not available"));
        socket->disconnectFromServer();
        return;
    }

    if (m_pending.contains(request->id) || !m_lifecycle->receive(*request)) {
        qCWarning(lcPopupIpc) << "Popup busy, refusing request" << request->id;
        sendReply(socket, request->id, {}, false, tr("Another request is already being answered"));
        socket->disconnectFromServer();
        return;
    }

    m_pending.insert(request->id, socket);
    qCInfo(lcPopupIpc) << "Delivered request" << request->id;
    Q_EMIT requestDelivered(request->id);
}

void PopupIpcServer::handleDisconnected(QLocalSocket* socket)
{
    m_readBuffers.remove(socket);
    for (auto it = m_pending.cbegin(); it != m_pending.cend(); ++it) {
        if (it.value() == socket) {
            qCWarning(lcPopupIpc) << "Requester for" << it.key()
                                  << "disconnected; the popup stays open and its answer will be dropped";
            break;
        }
    }
    socket->deleteLater();
}

void PopupIpcServer::handleResponseReady(const PopupResponse& response)
{
    const QPointer<QLocalSocket> socket = m_pending.take(response.requestId);
    if (!socket || socket->state() != QLocalSocket::ConnectedState) {
        qCWarning(lcPopupIpc) << "Dropping response for" << response.requestId << "- requester is gone";
        return;
    }
    sendReply(socket, response.requestId, response.toWireString(), true);
    socket->disconnectFromServer();
}

void PopupIpcServer::handleRequestSuperseded(const QString& requestId)
{
    releasePending(requestId, tr("Superseded by a newer request"));
}

void PopupIpcServer::releasePending(const QString& requestId, const QString& error)
{
    const QPointer<QLocalSocket> socket = m_pending.take(requestId);
    if (!socket || socket->state() != QLocalSocket::ConnectedState)
        return;
    sendReply(socket, requestId, {}, false, error);
    socket->disconnectFromServer();
}

void PopupIpcServer::sendReply(QLocalSocket* socket,
                               const QString& requestId,
                               const QString& response,
                               bool success,
                               const QString& error)
{
    QJsonObject reply{
        {QStringLiteral("id"), requestId},
        {QStringLiteral("response"), response},
        {QStringLiteral("success"), success},
        {QStringLiteral("error"), success ? QJsonValue(QJsonValue::Null) : QJsonValue(error)},
    };
    QByteArray data = QJsonDocument(reply).toJson(QJsonDocument::Compact);
    data.append('\n');
    if (socket->write(data) != data.size())
        qCWarning(lcPopupIpc) << "Short write replying to" << requestId << ":" << socket->errorString();
    socket->flush();
    Q_EMIT replySent(requestId, success);
}
