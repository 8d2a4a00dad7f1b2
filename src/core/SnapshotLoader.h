// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 devtray Contributors

#pragma once

#include <QString>

class AdminDirectory;
class DeviceRegistry;

/**
 * @brief Builds the initial registry from the admin directory
 *
 * Only running, non-administrative VMs are tracked. Devices are also listed
 * on administrative VMs (dom0), which serve devices without being tracked.
 * Permission boundaries mean some VMs cannot be read; those simply
 * contribute nothing.
 */
class SnapshotLoader
{
public:
    SnapshotLoader(AdminDirectory *admin, const QString &defaultIcon);

    /**
     * @brief Populate @p registry with tracked VMs, their devices and attachments
     * @return false only if the VM list itself could not be read
     */
    bool load(DeviceRegistry *registry);

    QString errorString() const { return m_errorString; }

private:
    QString resolveIcon(const QString &domain);

    AdminDirectory *m_admin;
    QString m_defaultIcon;
    QString m_errorString;
};
