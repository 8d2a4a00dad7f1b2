// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 devtray Contributors

#include "QubesEventStream.h"
#include "QubesdConnection.h"
#include "../core/Logging.h"

#include <QTimer>

#include <utility>

QubesEventStream::QubesEventStream(const QString &socketPath, QObject *parent)
    : QObject(parent)
    , m_socketPath(socketPath)
    , m_socket(new QLocalSocket(this))
    , m_reconnectTimer(new QTimer(this))
{
    m_reconnectTimer->setSingleShot(true);
    connect(m_reconnectTimer, &QTimer::timeout, this, &QubesEventStream::start);

    connect(m_socket, &QLocalSocket::connected, this, &QubesEventStream::onConnected);
    connect(m_socket, &QLocalSocket::readyRead, this, &QubesEventStream::onReadyRead);
    connect(m_socket, &QLocalSocket::disconnected, this, &QubesEventStream::onDisconnected);
    connect(m_socket, &QLocalSocket::errorOccurred, this, &QubesEventStream::onErrorOccurred);
}

QubesEventStream::~QubesEventStream()
{
    m_listening = false;
    m_socket->disconnect(this);
    m_socket->abort();
}

void QubesEventStream::start()
{
    m_listening = true;
    m_parser.reset();
    m_socket->abort();
    qCDebug(devtrayQubes) << "Connecting to event stream at" << m_socketPath;
    m_socket->connectToServer(m_socketPath);
}

void QubesEventStream::stop()
{
    m_listening = false;
    m_reconnectTimer->stop();
    m_socket->abort();
}

void QubesEventStream::onConnected()
{
    QString errorString;
    if (!QubesdConnection::sendRequest(m_socket, QStringLiteral("dom0"), QStringLiteral("admin.Events"),
                                       QString(), QByteArray(), m_timeout, &errorString)) {
        qCWarning(devtrayQubes) << "Event stream request failed:" << errorString;
        m_socket->abort();
        scheduleReconnect();
        return;
    }
    Q_EMIT connected();
}

void QubesEventStream::onReadyRead()
{
    QList<AdminEvent> events;
    const bool ok = m_parser.feed(m_socket->readAll(), &events);

    // Deliver what was complete before any malformed data, in order
    for (const AdminEvent &event : std::as_const(events)) {
        Q_EMIT eventReceived(event);
        if (!m_listening) {
            return;
        }
    }

    if (!ok) {
        const QString message = m_parser.errorString();
        qCCritical(devtrayQubes) << "Event stream protocol error:" << message;
        stop();
        Q_EMIT failed(message);
    }
}

void QubesEventStream::onDisconnected()
{
    if (!m_listening) {
        return;
    }
    qCWarning(devtrayQubes) << "Event stream closed by qubesd";
    Q_EMIT disconnected();
    scheduleReconnect();
}

void QubesEventStream::onErrorOccurred(QLocalSocket::LocalSocketError error)
{
    if (!m_listening || error == QLocalSocket::PeerClosedError) {
        return;
    }
    qCWarning(devtrayQubes) << "Event stream socket error:" << m_socket->errorString();
    // Connect failures are reported before the socket reaches UnconnectedState
    if (m_socket->state() != QLocalSocket::ConnectedState) {
        scheduleReconnect();
    }
}

void QubesEventStream::scheduleReconnect()
{
    if (m_listening && !m_reconnectTimer->isActive()) {
        m_reconnectTimer->start(m_reconnectDelay);
    }
}
