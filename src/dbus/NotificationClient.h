// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 devtray Contributors

#pragma once

#include "../core/NotificationSink.h"

#include <QHash>
#include <QObject>
#include <QString>

class QDBusInterface;

/**
 * @brief NotificationSink posting to org.freedesktop.Notifications
 *
 * Keeps the server-assigned id for each identity so a later notification
 * with the same identity replaces the one on screen.
 */
class NotificationClient : public QObject, public NotificationSink
{
    Q_OBJECT

public:
    explicit NotificationClient(const QString &appName, QObject *parent = nullptr);
    ~NotificationClient() override;

    bool isAvailable() const;

    void sendNotification(const QString &identity, const QString &title, const QString &body,
                          NotificationPriority priority, bool error = false) override;

Q_SIGNALS:
    void errorOccurred(const QString &message);

private Q_SLOTS:
    void onNotificationClosed(uint id, uint reason);

private:
    QDBusInterface *m_interface = nullptr;
    QString m_appName;
    QHash<QString, uint> m_ids;
};
