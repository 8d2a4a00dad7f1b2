// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 devtray Contributors

#pragma once

#include "DeviceTypes.h"

#include <QList>
#include <QString>

/**
 * @brief Why an admin query failed
 *
 * None of these are fatal to event handling: callers treat a failed query
 * as "zero visibility" and carry on with what they could read.
 */
struct AdminError {
    enum Kind {
        AccessDenied, // policy refused the call
        Transient,    // VM vanished mid-query, daemon unreachable, timeout
        Other,
    };

    Kind kind = Other;
    QString type;    // exception class name reported by qubesd, if any
    QString message;

    static AdminError accessDenied(const QString &message, const QString &type = QString())
    {
        return AdminError{AccessDenied, type, message};
    }
    static AdminError transient(const QString &message, const QString &type = QString())
    {
        return AdminError{Transient, type, message};
    }
};

/**
 * @brief Result of a fallible admin query, modelled on QDBusReply
 */
template<typename T>
class AdminReply
{
public:
    AdminReply(const T &value)
        : m_value(value)
        , m_valid(true)
    {
    }

    AdminReply(const AdminError &error)
        : m_error(error)
        , m_valid(false)
    {
    }

    bool isValid() const { return m_valid; }
    const T &value() const { return m_value; }
    const AdminError &error() const { return m_error; }

private:
    T m_value{};
    AdminError m_error;
    bool m_valid;
};

/**
 * @brief A VM as listed by the admin directory
 */
struct DomainInfo {
    QString name;
    QString klass; // "AppVM", "AdminVM", ...
};

/**
 * AdminDirectory - Read-only view of the host's VMs and their devices
 *
 * Abstract so the reconciliation code can be driven by a mock in tests.
 * QubesAdminDirectory provides the qubesd implementation.
 */
class AdminDirectory
{
public:
    virtual ~AdminDirectory() = default;

    virtual AdminReply<QList<DomainInfo>> domains() = 0;
    virtual AdminReply<bool> isRunning(const QString &domain) = 0;

    /**
     * @brief Devices of class @p devclass exposed by backend VM @p domain
     */
    virtual AdminReply<QList<DeviceInfo>> availableDevices(const QString &domain, DeviceClass devclass) = 0;

    /**
     * @brief Devices of class @p devclass currently attached to @p domain
     */
    virtual AdminReply<QList<DeviceKey>> attachedDevices(const QString &domain, DeviceClass devclass) = 0;

    /**
     * @brief Icon name of @p domain (its icon property, else derived from its label)
     */
    virtual AdminReply<QString> domainIcon(const QString &domain) = 0;
};

/**
 * AttachmentApi - Privileged attach/detach calls
 *
 * Success is not reflected synchronously; it surfaces later as
 * device-attach / device-detach events.
 */
class AttachmentApi
{
public:
    virtual ~AttachmentApi() = default;

    /**
     * @brief Attach @p device to @p targetDomain as a non-persistent assignment
     * @param error Filled in on failure
     * @return true if the call was accepted
     */
    virtual bool attach(const DeviceKey &device, DeviceClass devclass, const QString &targetDomain,
                        AdminError *error) = 0;

    virtual bool detach(const DeviceKey &device, DeviceClass devclass, const QString &domain,
                        AdminError *error) = 0;
};
