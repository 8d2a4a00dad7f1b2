// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 devtray Contributors

#include "QubesdConnection.h"
#include "QubesProtocol.h"
#include "../core/Logging.h"

#include <QElapsedTimer>
#include <QLocalSocket>

#include <sys/socket.h>

QubesdConnection::QubesdConnection(const QString &socketPath)
    : m_socketPath(socketPath)
{
}

QubesdConnection::~QubesdConnection() = default;

bool QubesdConnection::sendRequest(QLocalSocket *socket, const QString &dest, const QString &method,
                                   const QString &arg, const QByteArray &payload, int timeout,
                                   QString *errorString)
{
    if (socket->state() != QLocalSocket::ConnectedState && !socket->waitForConnected(timeout)) {
        if (errorString) {
            *errorString = QStringLiteral("Failed to connect to qubesd service: %1").arg(socket->errorString());
        }
        return false;
    }

    socket->write(QubesProtocol::requestHeader(method, arg, dest));
    if (!payload.isEmpty()) {
        socket->write(payload);
    }
    while (socket->bytesToWrite() > 0) {
        if (!socket->waitForBytesWritten(timeout)) {
            if (errorString) {
                *errorString = QStringLiteral("Failed to send %1 request: %2").arg(method, socket->errorString());
            }
            return false;
        }
    }

    // qubesd starts processing once it sees end-of-stream
    if (::shutdown(static_cast<int>(socket->socketDescriptor()), SHUT_WR) != 0) {
        if (errorString) {
            *errorString = QStringLiteral("Failed to finish %1 request").arg(method);
        }
        return false;
    }
    return true;
}

AdminReply<QByteArray> QubesdConnection::call(const QString &dest, const QString &method, const QString &arg,
                                              const QByteArray &payload)
{
    QLocalSocket socket;
    socket.connectToServer(m_socketPath);

    QString errorString;
    if (!sendRequest(&socket, dest, method, arg, payload, m_timeout, &errorString)) {
        qCWarning(devtrayQubes) << method << "on" << dest << "-" << errorString;
        return AdminError::transient(errorString, QStringLiteral("QubesDaemonCommunicationError"));
    }

    QByteArray response;
    QElapsedTimer elapsed;
    elapsed.start();
    while (socket.state() == QLocalSocket::ConnectedState) {
        const int remaining = m_timeout - static_cast<int>(elapsed.elapsed());
        if (remaining <= 0) {
            qCWarning(devtrayQubes) << method << "on" << dest << "timed out";
            return AdminError::transient(QStringLiteral("Timed out waiting for qubesd"),
                                         QStringLiteral("QubesDaemonCommunicationError"));
        }
        if (!socket.waitForReadyRead(remaining) && socket.state() == QLocalSocket::ConnectedState) {
            continue;
        }
        response += socket.readAll();
    }
    response += socket.readAll();

    AdminReply<QByteArray> reply = QubesProtocol::parseResponse(response);
    if (!reply.isValid()) {
        qCDebug(devtrayQubes) << method << "+" << arg << "on" << dest << "failed:" << reply.error().type
                              << reply.error().message;
    }
    return reply;
}
