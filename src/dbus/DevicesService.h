// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 devtray Contributors

#pragma once

#include <QDBusConnection>
#include <QDBusContext>
#include <QDBusError>
#include <QObject>
#include <QString>
#include <QStringList>
#include <QVariantMap>

class AttachCoordinator;
class DeviceRegistry;

/**
 * DevicesService - Session bus front end of the device tray
 *
 * Lets a menu or applet list devices and VMs and ask for a device to be
 * attached or detached.
 *
 * D-Bus interface: org.qubes.qui.tray.Devices
 * Object path: /org/qubes/qui/tray/Devices
 */
class DevicesService : public QObject, protected QDBusContext
{
    Q_OBJECT
    Q_CLASSINFO("D-Bus Interface", "org.qubes.qui.tray.Devices")

public:
    static const QString ServiceName;
    static const QString ObjectPath;

    DevicesService(DeviceRegistry *registry, AttachCoordinator *coordinator, QObject *parent = nullptr);
    ~DevicesService() override;

    /**
     * @brief Claim the service name and export this object on @p connection
     */
    bool registerOn(QDBusConnection connection);

public Q_SLOTS:
    /**
     * List known devices as "backend:ident" keys, ordered by class then key
     */
    Q_SCRIPTABLE QStringList ListDevices();

    /**
     * Describe one device
     *
     * @param device Device key ("backend:ident")
     * @return description, devclass, backend, icon and attachments
     */
    Q_SCRIPTABLE QVariantMap GetDevice(const QString &device);

    /**
     * List running VMs devices can be attached to, sorted by name
     */
    Q_SCRIPTABLE QStringList ListDomains();

    /**
     * Attach @p device to @p domain, or detach it if it is already attached there
     *
     * @return true if the request was handed to qubesd
     */
    Q_SCRIPTABLE bool Toggle(const QString &device, const QString &domain);

Q_SIGNALS:
    Q_SCRIPTABLE void DevicesChanged();

private:
    void replyError(QDBusError::ErrorType type, const QString &message);

    DeviceRegistry *m_registry;
    AttachCoordinator *m_coordinator;
};
