// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 devtray Contributors

#pragma once

#include "DeviceTypes.h"

#include <QObject>
#include <QSet>
#include <QString>

class AdminDirectory;
class AttachmentApi;
class DeviceRegistry;
class NotificationSink;

/**
 * @brief Carries out user requests to move a device between VMs
 *
 * A toggle towards a VM the device is not attached to detaches it from
 * every VM first, then attaches it. A toggle towards a VM it is already
 * attached to just detaches it.
 *
 * On success the registry is left alone: the attach/detach events that
 * follow update it. Only a failed call, which may leave local state out of
 * step with reality, makes the coordinator re-read the device's attachments.
 */
class AttachCoordinator : public QObject
{
    Q_OBJECT

public:
    enum State {
        Detached,
        Attached,
        Transitioning,
    };
    Q_ENUM(State)

    AttachCoordinator(DeviceRegistry *registry, AdminDirectory *admin, AttachmentApi *api,
                      NotificationSink *sink, QObject *parent = nullptr);
    ~AttachCoordinator() override;

    State state(const DeviceKey &key) const;

    /**
     * @brief Toggle the attachment of @p key to @p targetDomain
     * @return false if the device is unknown, busy, or an external call failed
     */
    bool toggle(const DeviceKey &key, const QString &targetDomain);

    /**
     * @brief Re-read which VMs have @p key attached and store the result
     */
    void resynchronize(const DeviceKey &key);

Q_SIGNALS:
    void attachmentsResynchronized(const DeviceKey &key);
    void errorOccurred(const QString &message);

private:
    bool detachAll(const Device &device);
    bool attachTo(const Device &device, const QString &targetDomain);
    void reportError(const Device &device, const QString &message);

    DeviceRegistry *m_registry;
    AdminDirectory *m_admin;
    AttachmentApi *m_api;
    NotificationSink *m_sink;
    QSet<DeviceKey> m_transitioning;
};
