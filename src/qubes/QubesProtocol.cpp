// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 devtray Contributors

#include "QubesProtocol.h"

#include <QStringList>

namespace QubesProtocol {

QByteArray requestHeader(const QString &method, const QString &arg, const QString &dest)
{
    QByteArray header = method.toLatin1();
    header += '+';
    header += arg.toLatin1();
    header += " dom0 name ";
    header += dest.toLatin1();
    header += '\0';
    return header;
}

AdminError::Kind classifyException(const QString &type)
{
    if (type.endsWith(QLatin1String("AccessError")) || type == QLatin1String("PermissionDenied")) {
        return AdminError::AccessDenied;
    }
    if (type == QLatin1String("QubesVMNotFoundError") || type == QLatin1String("QubesVMNotRunningError")
        || type == QLatin1String("QubesVMNotStartedError")) {
        return AdminError::Transient;
    }
    return AdminError::Other;
}

AdminReply<QByteArray> parseResponse(const QByteArray &response)
{
    if (response.isEmpty()) {
        return AdminError::accessDenied(QStringLiteral("Got empty response from qubesd"),
                                        QStringLiteral("QubesDaemonAccessError"));
    }

    if (response.startsWith(QByteArray("0\0", 2))) {
        return response.mid(2);
    }

    if (response.startsWith(QByteArray("2\0", 2))) {
        // drop the terminating '\0' before splitting
        QByteArray body = response.mid(2);
        if (body.endsWith('\0')) {
            body.chop(1);
        }
        const QList<QByteArray> fields = body.split('\0');
        if (fields.size() < 3) {
            return AdminError{AdminError::Other, QStringLiteral("QubesDaemonCommunicationError"),
                              QStringLiteral("Malformed exception response")};
        }

        const QString type = QString::fromLatin1(fields.at(0));
        QString message = QString::fromUtf8(fields.at(2));
        for (int i = 3; i < fields.size(); ++i) {
            const int placeholder = message.indexOf(QLatin1String("%s"));
            if (placeholder < 0) {
                break;
            }
            message.replace(placeholder, 2, QString::fromUtf8(fields.at(i)));
        }
        if (message.isEmpty()) {
            message = type;
        }
        return AdminError{classifyException(type), type, message};
    }

    return AdminError{AdminError::Other, QStringLiteral("QubesDaemonCommunicationError"),
                      QStringLiteral("Invalid response format")};
}

QMap<QString, QString> parseProperties(const QString &text)
{
    QMap<QString, QString> properties;
    const QStringList tokens = text.split(QLatin1Char(' '), Qt::SkipEmptyParts);
    for (const QString &token : tokens) {
        const int separator = token.indexOf(QLatin1Char('='));
        if (separator <= 0) {
            continue;
        }
        properties.insert(token.left(separator), token.mid(separator + 1));
    }
    return properties;
}

QList<DomainInfo> parseDomainList(const QByteArray &data)
{
    QList<DomainInfo> domains;
    const QStringList lines = QString::fromUtf8(data).split(QLatin1Char('\n'), Qt::SkipEmptyParts);
    for (const QString &line : lines) {
        const int space = line.indexOf(QLatin1Char(' '));
        const QString name = space < 0 ? line : line.left(space);
        if (name.isEmpty()) {
            continue;
        }
        const QMap<QString, QString> properties = parseProperties(space < 0 ? QString() : line.mid(space + 1));
        domains.append(DomainInfo{name, properties.value(QStringLiteral("class"))});
    }
    return domains;
}

QString parsePowerState(const QByteArray &data)
{
    return parseProperties(QString::fromUtf8(data).trimmed()).value(QStringLiteral("power_state"));
}

QList<DeviceInfo> parseAvailableDevices(const QByteArray &data, const QString &backend, DeviceClass devclass)
{
    static const QString descriptionTag = QStringLiteral("description=");

    QList<DeviceInfo> devices;
    const QStringList lines = QString::fromUtf8(data).split(QLatin1Char('\n'), Qt::SkipEmptyParts);
    for (const QString &line : lines) {
        const int space = line.indexOf(QLatin1Char(' '));
        DeviceInfo info;
        info.key = DeviceKey{backend, space < 0 ? line : line.left(space)};
        info.devclass = devclass;
        if (info.key.ident.isEmpty()) {
            continue;
        }

        QString rest = space < 0 ? QString() : line.mid(space + 1);

        // description is last and may contain spaces
        const int description = rest.indexOf(descriptionTag);
        if (description >= 0) {
            info.description = rest.mid(description + descriptionTag.size());
            rest.truncate(description);
        }

        const QMap<QString, QString> properties = parseProperties(rest);
        for (auto it = properties.constBegin(); it != properties.constEnd(); ++it) {
            info.data.insert(it.key(), it.value());
        }
        devices.append(info);
    }
    return devices;
}

QList<DeviceKey> parseAssignedDevices(const QByteArray &data)
{
    QList<DeviceKey> keys;
    const QStringList lines = QString::fromUtf8(data).split(QLatin1Char('\n'), Qt::SkipEmptyParts);
    for (const QString &line : lines) {
        const QString device = line.section(QLatin1Char(' '), 0, 0);
        const int separator = device.indexOf(QLatin1Char('+'));
        if (separator <= 0) {
            continue;
        }
        keys.append(DeviceKey{device.left(separator), device.mid(separator + 1)});
    }
    return keys;
}

QString parsePropertyValue(const QByteArray &data)
{
    // "default=<bool> type=<type> <value>"
    return QString::fromUtf8(data).section(QLatin1Char(' '), 2).trimmed();
}

bool EventParser::feed(const QByteArray &data, QList<AdminEvent> *events)
{
    m_buffer.append(data);

    for (;;) {
        int pos = 0;
        QList<QByteArray> fields;

        // Collect fields until the empty field that terminates an event
        bool complete = false;
        while (pos < m_buffer.size()) {
            const int end = m_buffer.indexOf('\0', pos);
            if (end < 0) {
                break;
            }
            const QByteArray field = m_buffer.mid(pos, end - pos);
            pos = end + 1;

            if (fields.isEmpty() && field != "1") {
                m_errorString = QStringLiteral("Non-event response received: %1").arg(QString::fromUtf8(field));
                return false;
            }
            // After header, subject and name, an empty field in key position ends the event
            if (fields.size() >= 3 && field.isEmpty() && (fields.size() - 3) % 2 == 0) {
                complete = true;
                break;
            }
            fields.append(field);
        }

        if (!complete) {
            return true;
        }

        AdminEvent event;
        event.subject = QString::fromUtf8(fields.at(1));
        event.name = QString::fromUtf8(fields.at(2));
        for (int i = 3; i + 1 < fields.size(); i += 2) {
            event.kwargs.insert(QString::fromUtf8(fields.at(i)), QString::fromUtf8(fields.at(i + 1)));
        }
        m_buffer.remove(0, pos);

        if (events) {
            events->append(event);
        }
    }
}

void EventParser::reset()
{
    m_buffer.clear();
    m_errorString.clear();
}

}
