// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 devtray Contributors

#include "AttachCoordinator.h"
#include "AdminDirectory.h"
#include "DeviceRegistry.h"
#include "Logging.h"
#include "NotificationSink.h"

#include <QScopeGuard>
#include <QStringList>

#include <KLocalizedString>

namespace {

// Notifications about one device share an identity so they replace each other
QString deviceIdentity(const Device &device)
{
    return device.backendDomain() + device.ident();
}

}

AttachCoordinator::AttachCoordinator(DeviceRegistry *registry, AdminDirectory *admin, AttachmentApi *api,
                                     NotificationSink *sink, QObject *parent)
    : QObject(parent)
    , m_registry(registry)
    , m_admin(admin)
    , m_api(api)
    , m_sink(sink)
{
}

AttachCoordinator::~AttachCoordinator() = default;

AttachCoordinator::State AttachCoordinator::state(const DeviceKey &key) const
{
    if (m_transitioning.contains(key)) {
        return Transitioning;
    }
    return m_registry->device(key).attachments.isEmpty() ? Detached : Attached;
}

bool AttachCoordinator::toggle(const DeviceKey &key, const QString &targetDomain)
{
    if (!m_registry->hasDevice(key)) {
        qCWarning(devtrayCore) << "AttachCoordinator: Unknown device" << key.toString();
        return false;
    }
    if (m_transitioning.contains(key)) {
        qCWarning(devtrayCore) << "AttachCoordinator:" << key.toString() << "is already being moved";
        return false;
    }

    m_transitioning.insert(key);
    auto guard = qScopeGuard([this, key]() { m_transitioning.remove(key); });

    const Device device = m_registry->device(key);
    if (device.attachments.contains(targetDomain)) {
        return detachAll(device);
    }

    if (!detachAll(device)) {
        return false;
    }
    return attachTo(device, targetDomain);
}

bool AttachCoordinator::detachAll(const Device &device)
{
    QStringList attachments = device.attachments.values();
    attachments.sort();

    for (const QString &domain : attachments) {
        if (m_sink) {
            m_sink->sendNotification(deviceIdentity(device), i18n("Detaching device"),
                                     i18n("Detaching %1 from %2", device.description, domain),
                                     NotificationPriority::Normal);
        }

        AdminError error;
        if (!m_api->detach(device.key, device.devclass, domain, &error)) {
            qCWarning(devtrayCore) << "AttachCoordinator: Detaching" << device.key.toString() << "from"
                                   << domain << "failed:" << error.message;
            reportError(device, i18n("Detaching device %1 from %2 failed. Error: %3",
                                     device.description, domain, error.message));
            resynchronize(device.key);
            return false;
        }
    }
    return true;
}

bool AttachCoordinator::attachTo(const Device &device, const QString &targetDomain)
{
    AdminError error;
    if (!m_api->attach(device.key, device.devclass, targetDomain, &error)) {
        qCWarning(devtrayCore) << "AttachCoordinator: Attaching" << device.key.toString() << "to"
                               << targetDomain << "failed:" << error.type << error.message;
        reportError(device, i18n("Attaching device %1 to %2 failed. Error: %3 - %4",
                                 device.description, targetDomain, error.type, error.message));
        resynchronize(device.key);
        return false;
    }

    if (m_sink) {
        m_sink->sendNotification(deviceIdentity(device), i18n("Attaching device"),
                                 i18n("Attaching %1 to %2", device.description, targetDomain),
                                 NotificationPriority::Normal);
    }
    return true;
}

void AttachCoordinator::reportError(const Device &device, const QString &message)
{
    if (m_sink) {
        m_sink->sendNotification(deviceIdentity(device), i18n("Error"), message, NotificationPriority::High,
                                 true);
    }
    Q_EMIT errorOccurred(message);
}

void AttachCoordinator::resynchronize(const DeviceKey &key)
{
    if (!m_registry->hasDevice(key)) {
        return;
    }
    const DeviceClass devclass = m_registry->device(key).devclass;

    // Used only on error paths, when the attach/detach events may never arrive
    QSet<QString> attachments;
    AdminReply<QList<DomainInfo>> domains = m_admin->domains();
    if (!domains.isValid()) {
        qCWarning(devtrayCore) << "AttachCoordinator: Cannot list VMs for resync:" << domains.error().message;
    } else {
        for (const DomainInfo &domain : domains.value()) {
            AdminReply<QList<DeviceKey>> attached = m_admin->attachedDevices(domain.name, devclass);
            if (!attached.isValid()) {
                continue;
            }
            if (attached.value().contains(key)) {
                attachments.insert(domain.name);
            }
        }
    }

    m_registry->setAttachments(key, attachments);
    qCDebug(devtrayCore) << "AttachCoordinator: Resynchronized" << key.toString() << "->" << attachments;
    Q_EMIT attachmentsResynchronized(key);
}
