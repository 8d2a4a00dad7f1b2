// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 devtray Contributors

#include "DevicesService.h"
#include "../core/AttachCoordinator.h"
#include "../core/DeviceRegistry.h"
#include "../core/Logging.h"

#include <QDBusError>

#include <algorithm>

const QString DevicesService::ServiceName = QStringLiteral("org.qubes.qui.tray.Devices");
const QString DevicesService::ObjectPath = QStringLiteral("/org/qubes/qui/tray/Devices");

DevicesService::DevicesService(DeviceRegistry *registry, AttachCoordinator *coordinator, QObject *parent)
    : QObject(parent)
    , m_registry(registry)
    , m_coordinator(coordinator)
{
}

DevicesService::~DevicesService() = default;

bool DevicesService::registerOn(QDBusConnection connection)
{
    if (!connection.isConnected()) {
        qCWarning(devtrayDBus) << "Cannot connect to the D-Bus session bus";
        return false;
    }

    if (!connection.registerService(ServiceName)) {
        qCWarning(devtrayDBus) << "Cannot register D-Bus service:" << connection.lastError().message();
        return false;
    }

    if (!connection.registerObject(ObjectPath, this,
            QDBusConnection::ExportScriptableSlots | QDBusConnection::ExportScriptableSignals)) {
        qCWarning(devtrayDBus) << "Cannot register D-Bus object:" << connection.lastError().message();
        return false;
    }

    qCDebug(devtrayDBus) << "Devices service registered as" << ServiceName;
    return true;
}

void DevicesService::replyError(QDBusError::ErrorType type, const QString &message)
{
    qCDebug(devtrayDBus) << "Rejecting request:" << message;
    if (calledFromDBus()) {
        sendErrorReply(type, message);
    }
}

QStringList DevicesService::ListDevices()
{
    QList<Device> devices = m_registry->devices();

    // Same order as the tray menu: grouped by class
    std::sort(devices.begin(), devices.end(), [](const Device &a, const Device &b) {
        if (a.devclass != b.devclass) {
            return deviceClassName(a.devclass) < deviceClassName(b.devclass);
        }
        return a.key.toString() < b.key.toString();
    });

    QStringList keys;
    for (const Device &device : devices) {
        keys.append(device.key.toString());
    }
    return keys;
}

QVariantMap DevicesService::GetDevice(const QString &device)
{
    const DeviceKey key = DeviceKey::fromString(device);
    if (!m_registry->hasDevice(key)) {
        replyError(QDBusError::InvalidArgs,
                   QStringLiteral("Unknown device: %1").arg(device));
        return QVariantMap();
    }

    const Device record = m_registry->device(key);
    QStringList attachments = record.attachments.values();
    attachments.sort();

    QVariantMap map;
    map[QStringLiteral("description")] = record.description;
    map[QStringLiteral("devclass")] = deviceClassName(record.devclass);
    map[QStringLiteral("backend")] = record.backendDomain();
    map[QStringLiteral("ident")] = record.ident();
    map[QStringLiteral("icon")] = record.vmIcon;
    map[QStringLiteral("attachments")] = attachments;
    return map;
}

QStringList DevicesService::ListDomains()
{
    QStringList names;
    for (const Domain &domain : m_registry->domains()) {
        names.append(domain.name);
    }
    return names;
}

bool DevicesService::Toggle(const QString &device, const QString &domain)
{
    const DeviceKey key = DeviceKey::fromString(device);
    if (!m_registry->hasDevice(key)) {
        replyError(QDBusError::InvalidArgs,
                   QStringLiteral("Unknown device: %1").arg(device));
        return false;
    }

    if (domain == key.backendDomain) {
        replyError(QDBusError::InvalidArgs,
                   QStringLiteral("Cannot attach %1 to its own backend").arg(device));
        return false;
    }

    if (!m_registry->hasDomain(domain)) {
        replyError(QDBusError::InvalidArgs,
                   QStringLiteral("VM %1 is not running").arg(domain));
        return false;
    }

    return m_coordinator->toggle(key, domain);
}
