// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 devtray Contributors

#pragma once

#include <QList>
#include <QMap>
#include <QMetaType>
#include <QObject>
#include <QString>

#include <functional>

/**
 * @brief One event from the admin event stream
 */
struct AdminEvent {
    QString subject; // originating VM name, empty for global events
    QString name;    // e.g. "device-attach:usb", "domain-shutdown"
    QMap<QString, QString> kwargs;

    bool hasSubject() const { return !subject.isEmpty(); }
};

Q_DECLARE_METATYPE(AdminEvent)

/**
 * @brief Routes events to handlers registered by event name
 *
 * Events are handed to handlers synchronously, in arrival order. Nothing is
 * reordered or coalesced here.
 */
class EventDispatcher : public QObject
{
    Q_OBJECT

public:
    using Handler = std::function<void(const AdminEvent &)>;

    explicit EventDispatcher(QObject *parent = nullptr);
    ~EventDispatcher() override;

    /**
     * @brief Register @p handler for events named exactly @p eventName
     */
    void addHandler(const QString &eventName, Handler handler);

    int handlerCount(const QString &eventName) const;

public Q_SLOTS:
    void dispatch(const AdminEvent &event);

Q_SIGNALS:
    /**
     * @brief Emitted for events no handler is registered for
     */
    void unhandledEvent(const AdminEvent &event);

private:
    QMap<QString, QList<Handler>> m_handlers;
};
