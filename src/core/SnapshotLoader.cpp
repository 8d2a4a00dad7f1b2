// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 devtray Contributors

#include "SnapshotLoader.h"
#include "AdminDirectory.h"
#include "DeviceRegistry.h"
#include "Logging.h"

#include <utility>

static const QString ADMIN_VM_CLASS = QStringLiteral("AdminVM");

SnapshotLoader::SnapshotLoader(AdminDirectory *admin, const QString &defaultIcon)
    : m_admin(admin)
    , m_defaultIcon(defaultIcon)
{
}

QString SnapshotLoader::resolveIcon(const QString &domain)
{
    AdminReply<QString> icon = m_admin->domainIcon(domain);
    if (!icon.isValid() || icon.value().isEmpty()) {
        return m_defaultIcon;
    }
    return icon.value();
}

bool SnapshotLoader::load(DeviceRegistry *registry)
{
    m_errorString.clear();

    AdminReply<QList<DomainInfo>> domains = m_admin->domains();
    if (!domains.isValid()) {
        m_errorString = domains.error().message;
        qCWarning(devtrayCore) << "SnapshotLoader: Cannot list VMs:" << m_errorString;
        return false;
    }

    QList<Domain> tracked;
    // Device backends: tracked VMs plus dom0, which serves devices without being tracked
    QList<Domain> backends;
    for (const DomainInfo &info : domains.value()) {
        if (info.klass == ADMIN_VM_CLASS) {
            backends.append(Domain{info.name, resolveIcon(info.name)});
            continue;
        }

        AdminReply<bool> running = m_admin->isRunning(info.name);
        if (!running.isValid()) {
            // we don't have access to VM state
            qCDebug(devtrayCore) << "SnapshotLoader: Skipping" << info.name << "-" << running.error().message;
            continue;
        }
        if (!running.value()) {
            continue;
        }

        Domain domain{info.name, resolveIcon(info.name)};
        registry->addDomain(domain);
        tracked.append(domain);
        backends.append(domain);
    }

    // List all devices
    for (const Domain &domain : std::as_const(backends)) {
        for (DeviceClass devclass : allDeviceClasses()) {
            AdminReply<QList<DeviceInfo>> available = m_admin->availableDevices(domain.name, devclass);
            if (!available.isValid()) {
                // no permission to access this VM's devices
                qCDebug(devtrayCore) << "SnapshotLoader: No" << deviceClassName(devclass)
                                     << "devices visible on" << domain.name;
                continue;
            }
            for (const DeviceInfo &info : available.value()) {
                registry->upsertDevice(Device::fromInfo(info, domain.icon));
            }
        }
    }

    // List existing attachments
    for (const Domain &domain : std::as_const(tracked)) {
        for (DeviceClass devclass : allDeviceClasses()) {
            AdminReply<QList<DeviceKey>> attached = m_admin->attachedDevices(domain.name, devclass);
            if (!attached.isValid()) {
                continue;
            }
            for (const DeviceKey &key : attached.value()) {
                // Ghost entries appear when a device was removed without being detached
                if (registry->hasDevice(key)) {
                    registry->attach(key, domain.name);
                }
            }
        }
    }

    qCDebug(devtrayCore) << "SnapshotLoader: Loaded" << tracked.size() << "VMs and"
                         << registry->deviceCount() << "devices";
    return true;
}
