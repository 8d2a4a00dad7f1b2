// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 devtray Contributors

#pragma once

#include "DeviceTypes.h"

#include <QHash>
#include <QList>
#include <QObject>
#include <QString>

class NotificationSink;

/**
 * @brief Coalesces bursts of device changes into one notification per VM
 *
 * Each (direction, VM) pair owns a buffer of recently changed devices. A
 * device entering a buffer gets its own one-shot expiry timer; when it fires
 * the device leaves the buffer. Every insertion re-posts the notification
 * with the whole buffer under the same identity, so the user always sees
 * the current batch and the previous notification is replaced.
 */
class DebounceNotifier : public QObject
{
    Q_OBJECT

public:
    enum Direction {
        Added,
        Removed,
    };
    Q_ENUM(Direction)

    explicit DebounceNotifier(NotificationSink *sink, QObject *parent = nullptr);
    ~DebounceNotifier() override;

    /**
     * @brief Expiry time (ms) of a buffered device
     */
    int interval() const { return m_interval; }
    void setInterval(int msec);

    QList<Device> pendingDevices(Direction direction, const QString &domain) const;
    bool hasPending(Direction direction, const QString &domain) const;

    static QString notificationIdentity(Direction direction, const QString &domain);

public Q_SLOTS:
    void notifyDevicesAdded(const QString &domain, const QList<Device> &devices);
    void notifyDevicesRemoved(const QString &domain, const QList<Device> &devices);
    void notifyDeviceAttached(const QString &domain, const Device &device);
    void notifyDeviceDetached(const QString &domain, const Device &device);

Q_SIGNALS:
    /**
     * @brief A device left its buffer after the expiry interval
     */
    void deviceExpired(DebounceNotifier::Direction direction, const QString &domain, const DeviceKey &key);

private:
    void insert(Direction direction, const QString &domain, const QList<Device> &devices);
    void evict(Direction direction, const QString &domain, const DeviceKey &key);
    void post(Direction direction, const QString &domain);

    QHash<QString, QList<Device>> &buffers(Direction direction);
    const QHash<QString, QList<Device>> &buffers(Direction direction) const;

    NotificationSink *m_sink;
    int m_interval;
    QHash<QString, QList<Device>> m_added;
    QHash<QString, QList<Device>> m_removed;
};
