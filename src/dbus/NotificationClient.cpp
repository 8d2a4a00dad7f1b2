// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 devtray Contributors

#include "NotificationClient.h"
#include "../core/Logging.h"

#include <QDBusConnection>
#include <QDBusInterface>
#include <QDBusReply>
#include <QStringList>
#include <QVariantMap>

static const QString SERVICE_NAME = QStringLiteral("org.freedesktop.Notifications");
static const QString OBJECT_PATH = QStringLiteral("/org/freedesktop/Notifications");
static const QString INTERFACE_NAME = QStringLiteral("org.freedesktop.Notifications");

namespace {

uchar urgency(NotificationPriority priority)
{
    switch (priority) {
    case NotificationPriority::Low:
        return 0;
    case NotificationPriority::Normal:
        return 1;
    case NotificationPriority::High:
        return 2;
    }
    return 1;
}

}

NotificationClient::NotificationClient(const QString &appName, QObject *parent)
    : QObject(parent)
    , m_appName(appName)
{
    m_interface = new QDBusInterface(
        SERVICE_NAME,
        OBJECT_PATH,
        INTERFACE_NAME,
        QDBusConnection::sessionBus(),
        this
    );

    if (!m_interface->isValid()) {
        qCWarning(devtrayDBus) << "Notification service not available:" << m_interface->lastError().message();
    }

    QDBusConnection::sessionBus().connect(SERVICE_NAME, OBJECT_PATH, INTERFACE_NAME,
                                          QStringLiteral("NotificationClosed"),
                                          this, SLOT(onNotificationClosed(uint,uint)));
}

NotificationClient::~NotificationClient() = default;

bool NotificationClient::isAvailable() const
{
    return m_interface && m_interface->isValid();
}

void NotificationClient::sendNotification(const QString &identity, const QString &title, const QString &body,
                                          NotificationPriority priority, bool error)
{
    QString key = identity;
    QString icon = QStringLiteral("media-removable");
    if (error) {
        icon = QStringLiteral("dialog-error");
        if (!key.isEmpty()) {
            key += QStringLiteral("ERROR");
        }
    }

    QVariantMap hints;
    hints[QStringLiteral("urgency")] = QVariant::fromValue(urgency(priority));

    const uint replacesId = key.isEmpty() ? 0 : m_ids.value(key, 0);

    QDBusReply<uint> reply = m_interface->call(
        QStringLiteral("Notify"),
        m_appName,
        replacesId,
        icon,
        title,
        body,
        QStringList(),
        hints,
        -1
    );

    if (!reply.isValid()) {
        qCWarning(devtrayDBus) << "Notify failed:" << reply.error().message();
        Q_EMIT errorOccurred(reply.error().message());
        return;
    }

    if (!key.isEmpty()) {
        m_ids.insert(key, reply.value());
    }
    qCDebug(devtrayDBus) << "Posted notification" << key << "id" << reply.value();
}

void NotificationClient::onNotificationClosed(uint id, uint reason)
{
    Q_UNUSED(reason)

    for (auto it = m_ids.begin(); it != m_ids.end(); ++it) {
        if (it.value() == id) {
            m_ids.erase(it);
            return;
        }
    }
}
