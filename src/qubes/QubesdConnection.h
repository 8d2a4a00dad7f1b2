// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 devtray Contributors

#pragma once

#include "../core/AdminDirectory.h"

#include <QByteArray>
#include <QString>

class QLocalSocket;

/**
 * @brief Blocking admin calls to qubesd over its Unix socket
 *
 * One connection per call, as qubesd expects: the request is terminated by
 * closing our write side, and the response runs until qubesd closes.
 */
class QubesdConnection
{
public:
    explicit QubesdConnection(const QString &socketPath = QStringLiteral("/var/run/qubesd.sock"));
    virtual ~QubesdConnection();

    QString socketPath() const { return m_socketPath; }

    int timeout() const { return m_timeout; }
    void setTimeout(int msec) { m_timeout = msec; }

    /**
     * @brief Call @p method on VM @p dest
     * @return the response data, or the error qubesd (or the socket) reported
     */
    virtual AdminReply<QByteArray> call(const QString &dest, const QString &method,
                                        const QString &arg = QString(),
                                        const QByteArray &payload = QByteArray());

    /**
     * @brief Open a socket to qubesd and send a request, leaving the reply to the caller
     * @return false with @p errorString set if the socket could not be set up
     */
    static bool sendRequest(QLocalSocket *socket, const QString &dest, const QString &method,
                            const QString &arg, const QByteArray &payload, int timeout,
                            QString *errorString);

private:
    QString m_socketPath;
    int m_timeout = 10000;
};
