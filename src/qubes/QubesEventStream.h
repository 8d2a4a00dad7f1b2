// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 devtray Contributors

#pragma once

#include "QubesProtocol.h"

#include <QLocalSocket>
#include <QObject>
#include <QString>

class QTimer;

/**
 * @brief Streams admin.Events from qubesd
 *
 * Reconnects after a delay when qubesd goes away (e.g. restarted). A
 * malformed stream is unrecoverable and reported through failed().
 */
class QubesEventStream : public QObject
{
    Q_OBJECT

public:
    explicit QubesEventStream(const QString &socketPath, QObject *parent = nullptr);
    ~QubesEventStream() override;

    int reconnectDelay() const { return m_reconnectDelay; }
    void setReconnectDelay(int msec) { m_reconnectDelay = msec; }

    bool isListening() const { return m_listening; }

public Q_SLOTS:
    void start();
    void stop();

Q_SIGNALS:
    void eventReceived(const AdminEvent &event);
    void connected();
    void disconnected();
    void failed(const QString &message);

private Q_SLOTS:
    void onConnected();
    void onReadyRead();
    void onDisconnected();
    void onErrorOccurred(QLocalSocket::LocalSocketError error);

private:
    void scheduleReconnect();

    QString m_socketPath;
    QLocalSocket *m_socket = nullptr;
    QTimer *m_reconnectTimer = nullptr;
    QubesProtocol::EventParser m_parser;
    int m_reconnectDelay = 1000;
    int m_timeout = 10000;
    bool m_listening = false;
};
