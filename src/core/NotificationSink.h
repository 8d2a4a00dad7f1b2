// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 devtray Contributors

#pragma once

#include <QString>

enum class NotificationPriority {
    Low,
    Normal,
    High,
};

/**
 * NotificationSink - Destination for user notifications
 *
 * A notification sent with an identity that is still outstanding replaces
 * the earlier one.
 */
class NotificationSink
{
public:
    virtual ~NotificationSink() = default;

    virtual void sendNotification(const QString &identity, const QString &title, const QString &body,
                                  NotificationPriority priority, bool error = false) = 0;
};
