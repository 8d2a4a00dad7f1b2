// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 devtray Contributors

#pragma once

#include "../core/AdminDirectory.h"

class QubesdConnection;

/**
 * @brief AdminDirectory backed by qubesd admin calls
 */
class QubesAdminDirectory : public AdminDirectory
{
public:
    explicit QubesAdminDirectory(QubesdConnection *connection);

    AdminReply<QList<DomainInfo>> domains() override;
    AdminReply<bool> isRunning(const QString &domain) override;
    AdminReply<QList<DeviceInfo>> availableDevices(const QString &domain, DeviceClass devclass) override;
    AdminReply<QList<DeviceKey>> attachedDevices(const QString &domain, DeviceClass devclass) override;
    AdminReply<QString> domainIcon(const QString &domain) override;

private:
    QubesdConnection *m_connection;
};

/**
 * @brief AttachmentApi backed by admin.vm.device.<class>.Attach / Detach
 */
class QubesAttachmentApi : public AttachmentApi
{
public:
    explicit QubesAttachmentApi(QubesdConnection *connection);

    bool attach(const DeviceKey &device, DeviceClass devclass, const QString &targetDomain,
                AdminError *error) override;
    bool detach(const DeviceKey &device, DeviceClass devclass, const QString &domain,
                AdminError *error) override;

private:
    QubesdConnection *m_connection;
};
