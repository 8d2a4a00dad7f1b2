// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 devtray Contributors

#pragma once

#include "AdminDirectory.h"
#include "NotificationSink.h"

#include <QHash>
#include <QList>
#include <QSet>
#include <QString>
#include <QStringList>

#include <functional>

// Mock AdminDirectory for testing - no qubesd involved
class MockAdminDirectory : public AdminDirectory
{
public:
    MockAdminDirectory() = default;
    ~MockAdminDirectory() override = default;

    // Configuration methods for test setup
    void addDomain(const QString &name, bool running = true, const QString &klass = QStringLiteral("AppVM"))
    {
        m_domains.append(DomainInfo{name, klass});
        m_running[name] = running;
    }
    void removeDomain(const QString &name)
    {
        for (int i = m_domains.size() - 1; i >= 0; --i) {
            if (m_domains.at(i).name == name) {
                m_domains.removeAt(i);
            }
        }
        m_running.remove(name);
    }
    void setRunning(const QString &name, bool running) { m_running[name] = running; }
    void setIcon(const QString &name, const QString &icon) { m_icons[name] = icon; }

    DeviceInfo addDevice(const QString &backend, const QString &ident, DeviceClass devclass,
                         const QString &description)
    {
        DeviceInfo info;
        info.key = DeviceKey{backend, ident};
        info.devclass = devclass;
        info.description = description;
        m_available[slot(backend, devclass)].append(info);
        return info;
    }
    void removeDevice(const QString &backend, const QString &ident)
    {
        for (auto it = m_available.begin(); it != m_available.end(); ++it) {
            it->removeIf([&](const DeviceInfo &info) {
                return info.key.backendDomain == backend && info.key.ident == ident;
            });
        }
    }
    void setAttached(const QString &domain, DeviceClass devclass, const QList<DeviceKey> &keys)
    {
        m_attached[slot(domain, devclass)] = keys;
    }

    // Failure injection
    void setDomainsFail(bool fail) { m_domainsFail = fail; }
    void setRunningFails(const QString &name, bool fail) { setFlag(m_runningFails, name, fail); }
    void setDevicesFail(const QString &name, bool fail) { setFlag(m_devicesFail, name, fail); }
    void setAttachedFail(const QString &name, bool fail) { setFlag(m_attachedFail, name, fail); }
    void setIconFails(const QString &name, bool fail) { setFlag(m_iconFails, name, fail); }

    // Call accounting
    int availableCalls = 0;
    int attachedCalls = 0;
    QStringList attachedQueries; // "domain/class" per attachedDevices() call

    AdminReply<QList<DomainInfo>> domains() override
    {
        if (m_domainsFail) {
            return AdminError::transient(QStringLiteral("qubesd unreachable"));
        }
        return m_domains;
    }

    AdminReply<bool> isRunning(const QString &domain) override
    {
        if (m_runningFails.contains(domain)) {
            return AdminError::accessDenied(QStringLiteral("Got empty response from qubesd"),
                                            QStringLiteral("QubesPropertyAccessError"));
        }
        if (!m_running.contains(domain)) {
            return AdminError::transient(QStringLiteral("No such domain"), QStringLiteral("QubesVMNotFoundError"));
        }
        return m_running.value(domain);
    }

    AdminReply<QList<DeviceInfo>> availableDevices(const QString &domain, DeviceClass devclass) override
    {
        ++availableCalls;
        if (m_devicesFail.contains(domain)) {
            return AdminError::accessDenied(QStringLiteral("Got empty response from qubesd"),
                                            QStringLiteral("QubesDaemonAccessError"));
        }
        return m_available.value(slot(domain, devclass));
    }

    AdminReply<QList<DeviceKey>> attachedDevices(const QString &domain, DeviceClass devclass) override
    {
        ++attachedCalls;
        attachedQueries.append(domain + QLatin1Char('/') + deviceClassName(devclass));
        if (m_attachedFail.contains(domain)) {
            return AdminError::accessDenied(QStringLiteral("Got empty response from qubesd"),
                                            QStringLiteral("QubesDaemonAccessError"));
        }
        return m_attached.value(slot(domain, devclass));
    }

    AdminReply<QString> domainIcon(const QString &domain) override
    {
        if (m_iconFails.contains(domain)) {
            return AdminError::accessDenied(QStringLiteral("Got empty response from qubesd"),
                                            QStringLiteral("QubesPropertyAccessError"));
        }
        return m_icons.value(domain, QStringLiteral("appvm-red"));
    }

private:
    static QString slot(const QString &domain, DeviceClass devclass)
    {
        return domain + QLatin1Char('/') + deviceClassName(devclass);
    }
    static void setFlag(QSet<QString> &set, const QString &name, bool on)
    {
        if (on) {
            set.insert(name);
        } else {
            set.remove(name);
        }
    }

    QList<DomainInfo> m_domains;
    QHash<QString, bool> m_running;
    QHash<QString, QString> m_icons;
    QHash<QString, QList<DeviceInfo>> m_available;
    QHash<QString, QList<DeviceKey>> m_attached;
    bool m_domainsFail = false;
    QSet<QString> m_runningFails;
    QSet<QString> m_devicesFail;
    QSet<QString> m_attachedFail;
    QSet<QString> m_iconFails;
};

// Mock AttachmentApi recording every call in order
class MockAttachmentApi : public AttachmentApi
{
public:
    struct Call {
        QString action; // "attach" or "detach"
        DeviceKey device;
        QString domain;
    };

    QList<Call> calls;
    std::function<void(const Call &)> onCall; // runs while the call is in progress

    void setAttachFails(bool fail) { m_attachFails = fail; }
    void setDetachFailsFor(const QString &domain) { m_detachFailures.insert(domain); }

    bool attach(const DeviceKey &device, DeviceClass devclass, const QString &targetDomain,
                AdminError *error) override
    {
        Q_UNUSED(devclass)
        record({QStringLiteral("attach"), device, targetDomain});
        if (m_attachFails) {
            if (error) {
                *error = AdminError{AdminError::Other, QStringLiteral("QubesException"),
                                    QStringLiteral("Device already attached")};
            }
            return false;
        }
        return true;
    }

    bool detach(const DeviceKey &device, DeviceClass devclass, const QString &domain,
                AdminError *error) override
    {
        Q_UNUSED(devclass)
        record({QStringLiteral("detach"), device, domain});
        if (m_detachFailures.contains(domain)) {
            if (error) {
                *error = AdminError{AdminError::Other, QStringLiteral("QubesException"),
                                    QStringLiteral("Device not attached")};
            }
            return false;
        }
        return true;
    }

    QStringList callLog() const
    {
        QStringList log;
        for (const Call &call : calls) {
            log.append(call.action + QLatin1Char(' ') + call.domain);
        }
        return log;
    }

private:
    void record(const Call &call)
    {
        calls.append(call);
        if (onCall) {
            onCall(call);
        }
    }

    bool m_attachFails = false;
    QSet<QString> m_detachFailures;
};

// Mock NotificationSink keeping what is currently shown, by identity
class MockNotificationSink : public NotificationSink
{
public:
    struct Notification {
        QString identity;
        QString title;
        QString body;
        NotificationPriority priority;
        bool error;
    };

    QList<Notification> sent;

    void sendNotification(const QString &identity, const QString &title, const QString &body,
                          NotificationPriority priority, bool error = false) override
    {
        sent.append({identity, title, body, priority, error});
    }

    int countFor(const QString &identity) const
    {
        int count = 0;
        for (const Notification &notification : sent) {
            if (notification.identity == identity) {
                ++count;
            }
        }
        return count;
    }

    Notification lastFor(const QString &identity) const
    {
        for (int i = sent.size() - 1; i >= 0; --i) {
            if (sent.at(i).identity == identity) {
                return sent.at(i);
            }
        }
        return Notification{QString(), QString(), QString(), NotificationPriority::Low, false};
    }

    QList<Notification> errors() const
    {
        QList<Notification> result;
        for (const Notification &notification : sent) {
            if (notification.error) {
                result.append(notification);
            }
        }
        return result;
    }
};
