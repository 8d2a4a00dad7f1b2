// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 devtray Contributors

#include "EventReconciler.h"
#include "AdminDirectory.h"
#include "DeviceRegistry.h"
#include "EventDispatcher.h"
#include "Logging.h"
#include "SnapshotLoader.h"

#include <QMap>
#include <QSet>

#include <utility>

namespace {

// "device-attach:usb" -> usb
bool eventDeviceClass(const QString &eventName, DeviceClass *devclass)
{
    const int separator = eventName.indexOf(QLatin1Char(':'));
    if (separator < 0) {
        return false;
    }
    return parseDeviceClass(eventName.mid(separator + 1), devclass);
}

}

EventReconciler::EventReconciler(DeviceRegistry *registry, AdminDirectory *admin,
                                 const QString &defaultIcon, QObject *parent)
    : QObject(parent)
    , m_registry(registry)
    , m_admin(admin)
    , m_defaultIcon(defaultIcon)
{
}

EventReconciler::~EventReconciler() = default;

void EventReconciler::registerHandlers(EventDispatcher *dispatcher)
{
    for (DeviceClass devclass : allDeviceClasses()) {
        const QString name = deviceClassName(devclass);
        dispatcher->addHandler(QStringLiteral("device-attach:") + name,
                               [this](const AdminEvent &event) { handleDeviceAttach(event); });
        dispatcher->addHandler(QStringLiteral("device-detach:") + name,
                               [this](const AdminEvent &event) { handleDeviceDetach(event); });
        dispatcher->addHandler(QStringLiteral("device-list-change:") + name,
                               [this](const AdminEvent &event) { handleDeviceListChange(event); });
    }

    auto shutdown = [this](const AdminEvent &event) { handleDomainShutdown(event); };
    dispatcher->addHandler(QStringLiteral("domain-shutdown"), shutdown);
    dispatcher->addHandler(QStringLiteral("domain-start-failed"), shutdown);
    dispatcher->addHandler(QStringLiteral("domain-start"),
                           [this](const AdminEvent &event) { handleDomainStart(event); });
    dispatcher->addHandler(QStringLiteral("property-set:label"),
                           [this](const AdminEvent &event) { handleLabelChange(event); });
}

bool EventReconciler::isDomainRunning(const QString &domain)
{
    AdminReply<bool> running = m_admin->isRunning(domain);
    if (!running.isValid()) {
        // we don't have access to VM state
        qCDebug(devtrayEvents) << "Cannot read state of" << domain << "-" << running.error().message;
        return false;
    }
    return running.value();
}

QString EventReconciler::resolveIcon(const QString &domain)
{
    AdminReply<QString> icon = m_admin->domainIcon(domain);
    if (!icon.isValid() || icon.value().isEmpty()) {
        return m_defaultIcon;
    }
    return icon.value();
}

Device EventReconciler::lookupDevice(const DeviceKey &key, DeviceClass devclass)
{
    AdminReply<QList<DeviceInfo>> available = m_admin->availableDevices(key.backendDomain, devclass);
    if (available.isValid()) {
        for (const DeviceInfo &info : available.value()) {
            if (info.key == key) {
                return Device::fromInfo(info, resolveIcon(key.backendDomain));
            }
        }
    }

    // Not (or no longer) listed by its backend; keep what the event told us
    Device device;
    device.key = key;
    device.devclass = devclass;
    device.vmIcon = resolveIcon(key.backendDomain);
    return device;
}

void EventReconciler::handleDeviceListChange(const AdminEvent &event)
{
    if (!event.hasSubject()) {
        return;
    }
    const QString &domain = event.subject;

    // Full refresh of the VM's devices, not just the signalled class
    QList<DeviceInfo> current;
    for (DeviceClass devclass : allDeviceClasses()) {
        AdminReply<QList<DeviceInfo>> available = m_admin->availableDevices(domain, devclass);
        if (!available.isValid()) {
            // VM was removed or is no longer readable
            qCDebug(devtrayEvents) << "Device listing of" << domain << "failed:" << available.error().message;
            current.clear();
            break;
        }
        current.append(available.value());
    }

    QSet<DeviceKey> currentKeys;
    QList<Device> added;
    QString backendIcon;
    for (const DeviceInfo &info : current) {
        currentKeys.insert(info.key);
        if (m_registry->hasDevice(info.key)) {
            continue;
        }
        if (backendIcon.isNull()) {
            backendIcon = resolveIcon(domain);
        }
        Device device = Device::fromInfo(info, backendIcon);
        m_registry->upsertDevice(device);
        added.append(device);
    }

    QList<Device> removed;
    const QList<Device> known = m_registry->devicesOnBackend(domain);
    for (const Device &device : known) {
        if (!currentKeys.contains(device.key)) {
            removed.append(device);
            m_registry->removeDevice(device.key);
        }
    }

    qCDebug(devtrayEvents) << "Device list of" << domain << "changed:" << added.size() << "added,"
                           << removed.size() << "removed";

    if (!added.isEmpty()) {
        Q_EMIT devicesAdded(domain, added);
    }
    if (!removed.isEmpty()) {
        Q_EMIT devicesRemoved(domain, removed);
    }
}

void EventReconciler::handleDeviceAttach(const AdminEvent &event)
{
    DeviceClass devclass;
    if (!event.hasSubject() || !eventDeviceClass(event.name, &devclass)) {
        return;
    }

    const DeviceKey key = DeviceKey::fromString(event.kwargs.value(QStringLiteral("device")));
    if (!key.isValid()) {
        qCWarning(devtrayEvents) << "Ignoring" << event.name << "with malformed device"
                                 << event.kwargs.value(QStringLiteral("device"));
        return;
    }

    if (!isDomainRunning(event.subject)) {
        return;
    }

    if (!m_registry->hasDevice(key)) {
        m_registry->upsertDevice(lookupDevice(key, devclass));
    }

    if (m_registry->attach(key, event.subject)) {
        qCDebug(devtrayEvents) << key.toString() << "attached to" << event.subject;
        Q_EMIT attachmentsChanged(key);
        Q_EMIT deviceAttached(event.subject, m_registry->device(key));
    }
}

void EventReconciler::handleDeviceDetach(const AdminEvent &event)
{
    if (!event.hasSubject()) {
        return;
    }

    const DeviceKey key = DeviceKey::fromString(event.kwargs.value(QStringLiteral("device")));
    if (!key.isValid() || !isDomainRunning(event.subject)) {
        return;
    }

    // Unknown devices are ignored
    if (m_registry->detach(key, event.subject)) {
        qCDebug(devtrayEvents) << key.toString() << "detached from" << event.subject;
        Q_EMIT attachmentsChanged(key);
        Q_EMIT deviceDetached(event.subject, m_registry->device(key));
    }
}

void EventReconciler::handleDomainStart(const AdminEvent &event)
{
    if (!event.hasSubject()) {
        return;
    }
    const QString &name = event.subject;

    m_registry->addDomain(Domain{name, resolveIcon(name)});
    Q_EMIT domainsChanged();

    for (DeviceClass devclass : allDeviceClasses()) {
        AdminReply<QList<DeviceKey>> attached = m_admin->attachedDevices(name, devclass);
        if (!attached.isValid()) {
            // we don't have access to devices
            continue;
        }
        for (const DeviceKey &key : attached.value()) {
            if (m_registry->attach(key, name)) {
                Q_EMIT attachmentsChanged(key);
            }
        }
    }
}

void EventReconciler::handleDomainShutdown(const AdminEvent &event)
{
    if (!event.hasSubject()) {
        return;
    }

    QList<DeviceKey> affected;
    const QList<Device> devices = m_registry->devices();
    for (const Device &device : devices) {
        if (device.attachments.contains(event.subject)) {
            affected.append(device.key);
        }
    }

    const bool wasTracked = m_registry->hasDomain(event.subject);
    m_registry->removeDomain(event.subject);

    if (wasTracked) {
        Q_EMIT domainsChanged();
    }
    for (const DeviceKey &key : affected) {
        Q_EMIT attachmentsChanged(key);
    }
}

void EventReconciler::handleLabelChange(const AdminEvent &event)
{
    if (!event.hasSubject()) {
        // global property changed
        return;
    }

    const QString icon = resolveIcon(event.subject);
    m_registry->setDomainIcon(event.subject, icon);
    m_registry->setBackendIcon(event.subject, icon);

    if (m_registry->hasDomain(event.subject)) {
        Q_EMIT domainsChanged();
    }
}

bool EventReconciler::reloadSnapshot()
{
    DeviceRegistry fresh;
    SnapshotLoader loader(m_admin, m_defaultIcon);
    if (!loader.load(&fresh)) {
        m_errorString = loader.errorString();
        qCWarning(devtrayEvents) << "Cannot reload device state:" << m_errorString;
        return false;
    }
    m_errorString.clear();

    // Group by backend VM, as list-change events would have
    QMap<QString, QList<Device>> added;
    QMap<QString, QList<Device>> removed;
    QList<DeviceKey> attachmentsChangedKeys;

    const QList<Device> freshDevices = fresh.devices();
    for (const Device &device : freshDevices) {
        if (!m_registry->hasDevice(device.key)) {
            added[device.key.backendDomain].append(device);
            if (!device.attachments.isEmpty()) {
                attachmentsChangedKeys.append(device.key);
            }
        } else if (m_registry->device(device.key).attachments != device.attachments) {
            attachmentsChangedKeys.append(device.key);
        }
    }

    const QList<Device> oldDevices = m_registry->devices();
    for (const Device &device : oldDevices) {
        if (!fresh.hasDevice(device.key)) {
            removed[device.key.backendDomain].append(device);
        }
    }

    const bool domainsDiffer = m_registry->domains() != fresh.domains();

    *m_registry = fresh;

    qCDebug(devtrayEvents) << "Reloaded device state:" << fresh.deviceCount() << "devices,"
                           << fresh.domains().size() << "VMs";

    if (domainsDiffer) {
        Q_EMIT domainsChanged();
    }
    for (auto it = added.cbegin(); it != added.cend(); ++it) {
        Q_EMIT devicesAdded(it.key(), it.value());
    }
    for (auto it = removed.cbegin(); it != removed.cend(); ++it) {
        Q_EMIT devicesRemoved(it.key(), it.value());
    }
    for (const DeviceKey &key : std::as_const(attachmentsChangedKeys)) {
        Q_EMIT attachmentsChanged(key);
    }
    return true;
}
