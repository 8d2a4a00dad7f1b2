// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 devtray Contributors

#pragma once

#include "../core/AdminDirectory.h"
#include "../core/EventDispatcher.h"

#include <QByteArray>
#include <QList>
#include <QMap>
#include <QString>

/**
 * Wire format helpers for the qubesd admin socket.
 *
 * Request:  "<method>+<arg> dom0 name <dest>\0" followed by the payload,
 *           then end-of-stream from the client side.
 * Response: "0\0<data>" on success,
 *           "2\0<ExcType>\0<traceback>\0<format>\0<arg>\0..." on error,
 *           empty when the call was refused by policy.
 */
namespace QubesProtocol {

QByteArray requestHeader(const QString &method, const QString &arg, const QString &dest);

/**
 * @brief Parse a complete call response
 * @return the data on success, otherwise the classified error
 */
AdminReply<QByteArray> parseResponse(const QByteArray &response);

/**
 * @brief Map a qubesd exception class name to an error kind
 */
AdminError::Kind classifyException(const QString &type);

/**
 * @brief Parse "key=value key2=value2" (unquoted values, space separated)
 */
QMap<QString, QString> parseProperties(const QString &text);

/**
 * @brief admin.vm.List: "name class=AppVM state=Running" per line
 */
QList<DomainInfo> parseDomainList(const QByteArray &data);

/**
 * @brief admin.vm.CurrentState: "mem=... power_state=Running"
 */
QString parsePowerState(const QByteArray &data);

/**
 * @brief admin.vm.device.<class>.Available: "ident k=v ... description=<rest>" per line
 */
QList<DeviceInfo> parseAvailableDevices(const QByteArray &data, const QString &backend, DeviceClass devclass);

/**
 * @brief admin.vm.device.<class>.List: "backend+ident k=v ..." per line
 */
QList<DeviceKey> parseAssignedDevices(const QByteArray &data);

/**
 * @brief admin.vm.property.Get: "default=True type=label red" -> "red"
 */
QString parsePropertyValue(const QByteArray &data);

/**
 * @brief Incremental parser for the admin.Events stream
 *
 * Each event is "1\0<subject>\0<event>\0(<key>\0<value>\0)*\0". Data may
 * arrive split at any byte.
 */
class EventParser
{
public:
    /**
     * @brief Append received bytes and extract every complete event
     * @return false on a malformed stream; the parser must then be reset
     */
    bool feed(const QByteArray &data, QList<AdminEvent> *events);

    void reset();

    QString errorString() const { return m_errorString; }
    bool hasPendingData() const { return !m_buffer.isEmpty(); }

private:
    QByteArray m_buffer;
    QString m_errorString;
};

}
