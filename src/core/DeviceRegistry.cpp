// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 devtray Contributors

#include "DeviceRegistry.h"

void DeviceRegistry::upsertDevice(const Device &device)
{
    if (!device.key.isValid()) {
        return;
    }
    m_devices.insert(device.key, device);
}

void DeviceRegistry::removeDevice(const DeviceKey &key)
{
    m_devices.remove(key);
}

bool DeviceRegistry::hasDevice(const DeviceKey &key) const
{
    return m_devices.contains(key);
}

Device DeviceRegistry::device(const DeviceKey &key) const
{
    return m_devices.value(key);
}

QList<Device> DeviceRegistry::devices() const
{
    return m_devices.values();
}

QList<Device> DeviceRegistry::devicesOnBackend(const QString &backendDomain) const
{
    QList<Device> result;
    for (const Device &device : m_devices) {
        if (device.key.backendDomain == backendDomain) {
            result.append(device);
        }
    }
    return result;
}

bool DeviceRegistry::attach(const DeviceKey &key, const QString &domainName)
{
    auto it = m_devices.find(key);
    if (it == m_devices.end() || it->attachments.contains(domainName)) {
        return false;
    }
    it->attachments.insert(domainName);
    return true;
}

bool DeviceRegistry::detach(const DeviceKey &key, const QString &domainName)
{
    auto it = m_devices.find(key);
    if (it == m_devices.end()) {
        return false;
    }
    return it->attachments.remove(domainName);
}

void DeviceRegistry::setAttachments(const DeviceKey &key, const QSet<QString> &domainNames)
{
    auto it = m_devices.find(key);
    if (it != m_devices.end()) {
        it->attachments = domainNames;
    }
}

void DeviceRegistry::setBackendIcon(const QString &backendDomain, const QString &icon)
{
    for (Device &device : m_devices) {
        if (device.key.backendDomain == backendDomain) {
            device.vmIcon = icon;
        }
    }
}

void DeviceRegistry::addDomain(const Domain &domain)
{
    if (domain.name.isEmpty()) {
        return;
    }
    m_domains.insert(domain.name, domain);
}

void DeviceRegistry::removeDomain(const QString &name)
{
    m_domains.remove(name);

    // Pruned eagerly: no device may list a VM that has shut down
    for (Device &device : m_devices) {
        device.attachments.remove(name);
    }
}

bool DeviceRegistry::hasDomain(const QString &name) const
{
    return m_domains.contains(name);
}

Domain DeviceRegistry::domain(const QString &name) const
{
    return m_domains.value(name);
}

QList<Domain> DeviceRegistry::domains() const
{
    return m_domains.values();
}

void DeviceRegistry::setDomainIcon(const QString &name, const QString &icon)
{
    auto it = m_domains.find(name);
    if (it != m_domains.end()) {
        it->icon = icon;
    }
}

void DeviceRegistry::clear()
{
    m_devices.clear();
    m_domains.clear();
}
