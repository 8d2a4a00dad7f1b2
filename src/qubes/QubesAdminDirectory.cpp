// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 devtray Contributors

#include "QubesAdminDirectory.h"
#include "QubesProtocol.h"
#include "QubesdConnection.h"

static const QString ADMIN_DOMAIN = QStringLiteral("dom0");

namespace {

QString deviceMethod(DeviceClass devclass, const char *call)
{
    return QStringLiteral("admin.vm.device.%1.%2").arg(deviceClassName(devclass), QLatin1String(call));
}

}

QubesAdminDirectory::QubesAdminDirectory(QubesdConnection *connection)
    : m_connection(connection)
{
}

AdminReply<QList<DomainInfo>> QubesAdminDirectory::domains()
{
    AdminReply<QByteArray> reply = m_connection->call(ADMIN_DOMAIN, QStringLiteral("admin.vm.List"));
    if (!reply.isValid()) {
        return reply.error();
    }
    return QubesProtocol::parseDomainList(reply.value());
}

AdminReply<bool> QubesAdminDirectory::isRunning(const QString &domain)
{
    AdminReply<QByteArray> reply = m_connection->call(domain, QStringLiteral("admin.vm.CurrentState"));
    if (!reply.isValid()) {
        return reply.error();
    }

    const QString state = QubesProtocol::parsePowerState(reply.value());
    if (state.isEmpty()) {
        return AdminError{AdminError::Other, QStringLiteral("QubesDaemonCommunicationError"),
                          QStringLiteral("No power state for %1").arg(domain)};
    }
    return state != QLatin1String("Halted");
}

AdminReply<QList<DeviceInfo>> QubesAdminDirectory::availableDevices(const QString &domain, DeviceClass devclass)
{
    AdminReply<QByteArray> reply = m_connection->call(domain, deviceMethod(devclass, "Available"));
    if (!reply.isValid()) {
        return reply.error();
    }
    return QubesProtocol::parseAvailableDevices(reply.value(), domain, devclass);
}

AdminReply<QList<DeviceKey>> QubesAdminDirectory::attachedDevices(const QString &domain, DeviceClass devclass)
{
    AdminReply<QByteArray> reply = m_connection->call(domain, deviceMethod(devclass, "List"));
    if (!reply.isValid()) {
        return reply.error();
    }
    return QubesProtocol::parseAssignedDevices(reply.value());
}

AdminReply<QString> QubesAdminDirectory::domainIcon(const QString &domain)
{
    AdminReply<QByteArray> icon = m_connection->call(domain, QStringLiteral("admin.vm.property.Get"),
                                                     QStringLiteral("icon"));
    if (icon.isValid()) {
        const QString value = QubesProtocol::parsePropertyValue(icon.value());
        if (!value.isEmpty()) {
            return value;
        }
    }

    // Older VMs have no icon property; derive it from the label
    AdminReply<QByteArray> label = m_connection->call(domain, QStringLiteral("admin.vm.property.Get"),
                                                      QStringLiteral("label"));
    if (!label.isValid()) {
        return label.error();
    }
    const QString name = QubesProtocol::parsePropertyValue(label.value());
    if (name.isEmpty()) {
        return AdminError{AdminError::Other, QString(), QStringLiteral("%1 has no label").arg(domain)};
    }
    return QString(QStringLiteral("appvm-") + name);
}

QubesAttachmentApi::QubesAttachmentApi(QubesdConnection *connection)
    : m_connection(connection)
{
}

bool QubesAttachmentApi::attach(const DeviceKey &device, DeviceClass devclass, const QString &targetDomain,
                                AdminError *error)
{
    // Empty options payload: a non-persistent assignment
    AdminReply<QByteArray> reply = m_connection->call(targetDomain, deviceMethod(devclass, "Attach"),
                                                      device.toCallArgument());
    if (!reply.isValid()) {
        if (error) {
            *error = reply.error();
        }
        return false;
    }
    return true;
}

bool QubesAttachmentApi::detach(const DeviceKey &device, DeviceClass devclass, const QString &domain,
                                AdminError *error)
{
    AdminReply<QByteArray> reply = m_connection->call(domain, deviceMethod(devclass, "Detach"),
                                                      device.toCallArgument());
    if (!reply.isValid()) {
        if (error) {
            *error = reply.error();
        }
        return false;
    }
    return true;
}
