// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 devtray Contributors

#include "EventDispatcher.h"
#include "Logging.h"

EventDispatcher::EventDispatcher(QObject *parent)
    : QObject(parent)
{
}

EventDispatcher::~EventDispatcher() = default;

void EventDispatcher::addHandler(const QString &eventName, Handler handler)
{
    if (!handler) {
        return;
    }
    m_handlers[eventName].append(std::move(handler));
}

int EventDispatcher::handlerCount(const QString &eventName) const
{
    return m_handlers.value(eventName).size();
}

void EventDispatcher::dispatch(const AdminEvent &event)
{
    auto it = m_handlers.constFind(event.name);
    if (it == m_handlers.constEnd()) {
        Q_EMIT unhandledEvent(event);
        return;
    }

    qCDebug(devtrayEvents) << "Dispatching" << event.name << "from" << event.subject;

    // Copy: a handler may register further handlers
    const QList<Handler> handlers = it.value();
    for (const Handler &handler : handlers) {
        handler(event);
    }
}
