#pragma once

#include <QByteArray>
#include <QHash>
#include <QObject>
#include <QPointer>
#include <QString>

#include "models/PopupTypes.hpp"

class QLocalServer;
class QLocalSocket;
class PopupLifecycleController;

/**
 * @brief Local socket bridge between the MCP host and the popup.
 *
 * Each connection carries exactly one newline-terminated request and receives
 * exactly one reply line. The connection stays open while the request is on
 * screen; the reply is written when the lifecycle controller emits the response.
 */
class PopupIpcServer : public QObject {
    Q_OBJECT
    Q_PROPERTY(bool listening READ isListening NOTIFY listeningChanged)
    Q_PROPERTY(QString socketPath READ socketPath NOTIFY listeningChanged)

public:
    explicit PopupIpcServer(PopupLifecycleController* lifecycle, QObject* parent = nullptr);
    ~PopupIpcServer() override;

    static QString defaultSocketPath();

    void setSocketPath(const QString& path);
    QString socketPath() const { return m_socketPath; }

    [[nodiscard]] bool start(QString* errorMessage = nullptr);
    void stop();
    bool isListening() const;

    int pendingRequestCount() const { return m_pending.size(); }

signals:
    void listeningChanged();
    void requestDelivered(const QString& requestId);
    void replySent(const QString& requestId, bool success);

private slots:
    void handleNewConnection();
    void handleResponseReady(const PopupResponse& response);
    void handleRequestSuperseded(const QString& requestId);

private:
    void handleReadyRead(QLocalSocket* socket);
    void handleDisconnected(QLocalSocket* socket);
    void processLine(QLocalSocket* socket, const QByteArray& line);
    void sendReply(QLocalSocket* socket,
                   const QString& requestId,
                   const QString& response,
                   bool success,
                   const QString& error = {});
    void releasePending(const QString& requestId, const QString& error);

    QPointer<PopupLifecycleController>        m_lifecycle;
    QLocalServer*                             m_server = nullptr;
    QString                                   m_socketPath;
    QHash<QLocalSocket*, QByteArray>          m_readBuffers;
    QHash<QString, QPointer<QLocalSocket>>    m_pending;
};
