// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 devtray Contributors

#pragma once

#include "DeviceTypes.h"

#include <QHash>
#include <QList>
#include <QMap>
#include <QSet>
#include <QString>

/**
 * @brief Authoritative in-memory view of devices and tracked VMs
 *
 * Pure data; performs no I/O. Every mutation is a no-op when its target is
 * absent so stale or duplicated events can be applied safely.
 */
class DeviceRegistry
{
public:
    // Devices
    void upsertDevice(const Device &device);
    void removeDevice(const DeviceKey &key);
    bool hasDevice(const DeviceKey &key) const;

    /**
     * @return the device, or a default-constructed Device if unknown
     */
    Device device(const DeviceKey &key) const;

    QList<Device> devices() const;
    QList<Device> devicesOnBackend(const QString &backendDomain) const;
    int deviceCount() const { return m_devices.size(); }

    /**
     * @brief Record that @p domainName has @p key attached
     * @return true if the attachment set changed
     */
    bool attach(const DeviceKey &key, const QString &domainName);

    /**
     * @brief Clear the attachment of @p key to @p domainName
     * @return true if the attachment set changed
     */
    bool detach(const DeviceKey &key, const QString &domainName);

    void setAttachments(const DeviceKey &key, const QSet<QString> &domainNames);

    /**
     * @brief Update the backend icon of every device served by @p backendDomain
     */
    void setBackendIcon(const QString &backendDomain, const QString &icon);

    // Domains
    void addDomain(const Domain &domain);

    /**
     * @brief Stop tracking a VM and drop it from every device's attachments
     */
    void removeDomain(const QString &name);

    bool hasDomain(const QString &name) const;
    Domain domain(const QString &name) const;

    /**
     * @return tracked VMs sorted by name
     */
    QList<Domain> domains() const;

    void setDomainIcon(const QString &name, const QString &icon);

    void clear();

private:
    QHash<DeviceKey, Device> m_devices;
    QMap<QString, Domain> m_domains;
};
