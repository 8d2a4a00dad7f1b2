// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 devtray Contributors

#pragma once

#include "DeviceTypes.h"

#include <QList>
#include <QObject>
#include <QString>

struct AdminEvent;
class AdminDirectory;
class DeviceRegistry;
class EventDispatcher;

/**
 * @brief Keeps the registry in step with the admin event stream
 *
 * Events race with administrative state: a VM or device may vanish or become
 * unreadable between the event and our follow-up queries. Handlers therefore
 * re-read what they need and treat failed reads as reduced visibility,
 * never as errors.
 *
 * Changes are published as signals; the reconciler never calls into
 * notification or presentation code directly.
 */
class EventReconciler : public QObject
{
    Q_OBJECT

public:
    EventReconciler(DeviceRegistry *registry, AdminDirectory *admin, const QString &defaultIcon,
                    QObject *parent = nullptr);
    ~EventReconciler() override;

    /**
     * @brief Subscribe the reconciliation rules to @p dispatcher
     */
    void registerHandlers(EventDispatcher *dispatcher);

    void handleDeviceListChange(const AdminEvent &event);
    void handleDeviceAttach(const AdminEvent &event);
    void handleDeviceDetach(const AdminEvent &event);
    void handleDomainStart(const AdminEvent &event);
    void handleDomainShutdown(const AdminEvent &event);
    void handleLabelChange(const AdminEvent &event);

    /**
     * @brief Rebuild the registry from a fresh snapshot
     *
     * Used after the event stream was interrupted, since events sent while
     * it was down are lost. Differences against the current registry are
     * published through the usual signals.
     *
     * @return false if the VM list could not be read; the registry is left as it was
     */
    bool reloadSnapshot();

    QString errorString() const { return m_errorString; }

Q_SIGNALS:
    /**
     * @brief New devices appeared on backend VM @p domain
     */
    void devicesAdded(const QString &domain, const QList<Device> &devices);

    /**
     * @brief Devices disappeared from backend VM @p domain
     */
    void devicesRemoved(const QString &domain, const QList<Device> &devices);

    void deviceAttached(const QString &domain, const Device &device);
    void deviceDetached(const QString &domain, const Device &device);
    void attachmentsChanged(const DeviceKey &key);
    void domainsChanged();

private:
    bool isDomainRunning(const QString &domain);
    QString resolveIcon(const QString &domain);
    Device lookupDevice(const DeviceKey &key, DeviceClass devclass);

    DeviceRegistry *m_registry;
    AdminDirectory *m_admin;
    QString m_defaultIcon;
    QString m_errorString;
};
