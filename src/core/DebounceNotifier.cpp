// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 devtray Contributors

#include "DebounceNotifier.h"
#include "Logging.h"
#include "NotificationSink.h"
#include "SettingsManager.h"

#include <QStringList>
#include <QTimer>

#include <KLocalizedString>

DebounceNotifier::DebounceNotifier(NotificationSink *sink, QObject *parent)
    : QObject(parent)
    , m_sink(sink)
    , m_interval(SettingsManager::DefaultDebounceInterval)
{
}

DebounceNotifier::~DebounceNotifier() = default;

void DebounceNotifier::setInterval(int msec)
{
    if (msec > 0) {
        m_interval = msec;
    }
}

QHash<QString, QList<Device>> &DebounceNotifier::buffers(Direction direction)
{
    return direction == Added ? m_added : m_removed;
}

const QHash<QString, QList<Device>> &DebounceNotifier::buffers(Direction direction) const
{
    return direction == Added ? m_added : m_removed;
}

QList<Device> DebounceNotifier::pendingDevices(Direction direction, const QString &domain) const
{
    return buffers(direction).value(domain);
}

bool DebounceNotifier::hasPending(Direction direction, const QString &domain) const
{
    return buffers(direction).contains(domain);
}

QString DebounceNotifier::notificationIdentity(Direction direction, const QString &domain)
{
    return (direction == Added ? QStringLiteral("device-added-") : QStringLiteral("device-removed-")) + domain;
}

void DebounceNotifier::notifyDevicesAdded(const QString &domain, const QList<Device> &devices)
{
    insert(Added, domain, devices);
}

void DebounceNotifier::notifyDevicesRemoved(const QString &domain, const QList<Device> &devices)
{
    insert(Removed, domain, devices);
}

void DebounceNotifier::notifyDeviceAttached(const QString &domain, const Device &device)
{
    insert(Added, domain, {device});
}

void DebounceNotifier::notifyDeviceDetached(const QString &domain, const Device &device)
{
    insert(Removed, domain, {device});
}

void DebounceNotifier::insert(Direction direction, const QString &domain, const QList<Device> &devices)
{
    if (devices.isEmpty()) {
        return;
    }

    QList<Device> &known = buffers(direction)[domain];
    for (const Device &device : devices) {
        if (known.contains(device)) {
            continue;
        }
        known.append(device);

        const DeviceKey key = device.key;
        QTimer::singleShot(m_interval, this, [this, direction, domain, key]() {
            evict(direction, domain, key);
        });
    }

    post(direction, domain);
}

void DebounceNotifier::evict(Direction direction, const QString &domain, const DeviceKey &key)
{
    QHash<QString, QList<Device>> &buffer = buffers(direction);
    auto it = buffer.find(domain);
    if (it == buffer.end()) {
        return;
    }

    it->removeIf([&key](const Device &device) { return device.key == key; });
    if (it->isEmpty()) {
        buffer.erase(it);
    }

    qCDebug(devtrayNotify) << "Expired" << key.toString() << "from" << notificationIdentity(direction, domain);
    Q_EMIT deviceExpired(direction, domain, key);
}

void DebounceNotifier::post(Direction direction, const QString &domain)
{
    QStringList lines;
    for (const Device &device : buffers(direction).value(domain)) {
        lines.append(device.description);
    }
    lines.sort();

    const QString title = direction == Added ? i18n("Devices added on %1", domain)
                                             : i18n("Devices removed on %1", domain);

    if (m_sink) {
        m_sink->sendNotification(notificationIdentity(direction, domain), title,
                                 lines.join(QLatin1Char('\n')), NotificationPriority::Low);
    }
}
