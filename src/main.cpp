// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 devtray Contributors

#include <QCoreApplication>
#include <QDBusConnection>

#include <KLocalizedString>

#include "core/AttachCoordinator.h"
#include "core/DebounceNotifier.h"
#include "core/DeviceRegistry.h"
#include "core/EventDispatcher.h"
#include "core/EventReconciler.h"
#include "core/Logging.h"
#include "core/SettingsManager.h"
#include "core/SnapshotLoader.h"
#include "dbus/DevicesService.h"
#include "dbus/NotificationClient.h"
#include "qubes/QubesAdminDirectory.h"
#include "qubes/QubesEventStream.h"
#include "qubes/QubesdConnection.h"

static void reportCriticalError(NotificationSink *notifications, const QString &details)
{
    qCCritical(devtrayCore) << "Critical error:" << details;
    notifications->sendNotification(
        QStringLiteral("critical-error"),
        i18n("Houston, we have a problem..."),
        i18n("Whoops. A critical error in the Devices widget has occurred. "
             "This is most likely a bug in the widget. To restart it, run 'devtray' in dom0.\n%1",
             details),
        NotificationPriority::High,
        true);
}

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    // Set application metadata
    KLocalizedString::setApplicationDomain("devtray");
    QCoreApplication::setOrganizationName(QStringLiteral("qubes-os"));
    QCoreApplication::setOrganizationDomain(QStringLiteral("qubes-os.org"));
    QCoreApplication::setApplicationName(QStringLiteral("devtray"));
    QCoreApplication::setApplicationVersion(QStringLiteral("0.1.0"));

    SettingsManager settings;

    QubesdConnection connection(settings.qubesdSocket());
    connection.setTimeout(settings.callTimeout());
    QubesAdminDirectory admin(&connection);
    QubesAttachmentApi attachmentApi(&connection);

    NotificationClient notifications(QStringLiteral("Qubes Devices"));

    // Initial state
    DeviceRegistry registry;
    SnapshotLoader loader(&admin, settings.defaultIcon());
    if (!loader.load(&registry)) {
        reportCriticalError(&notifications, loader.errorString());
        return 1;
    }

    DebounceNotifier notifier(&notifications);
    notifier.setInterval(settings.debounceInterval());

    EventReconciler reconciler(&registry, &admin, settings.defaultIcon());
    QObject::connect(&reconciler, &EventReconciler::devicesAdded, &notifier, &DebounceNotifier::notifyDevicesAdded);
    QObject::connect(&reconciler, &EventReconciler::devicesRemoved, &notifier, &DebounceNotifier::notifyDevicesRemoved);
    QObject::connect(&reconciler, &EventReconciler::deviceAttached, &notifier, &DebounceNotifier::notifyDeviceAttached);
    QObject::connect(&reconciler, &EventReconciler::deviceDetached, &notifier, &DebounceNotifier::notifyDeviceDetached);

    EventDispatcher dispatcher;
    reconciler.registerHandlers(&dispatcher);

    AttachCoordinator coordinator(&registry, &admin, &attachmentApi, &notifications);

    // User-facing entry point for attach/detach requests
    DevicesService service(&registry, &coordinator);
    QObject::connect(&reconciler, &EventReconciler::devicesAdded, &service, &DevicesService::DevicesChanged);
    QObject::connect(&reconciler, &EventReconciler::devicesRemoved, &service, &DevicesService::DevicesChanged);
    QObject::connect(&reconciler, &EventReconciler::attachmentsChanged, &service, &DevicesService::DevicesChanged);
    QObject::connect(&reconciler, &EventReconciler::domainsChanged, &service, &DevicesService::DevicesChanged);
    QObject::connect(&coordinator, &AttachCoordinator::attachmentsResynchronized, &service, &DevicesService::DevicesChanged);
    if (!service.registerOn(QDBusConnection::sessionBus())) {
        qCWarning(devtrayCore) << "Devices service unavailable; running without attach/detach requests";
    }

    QubesEventStream events(settings.qubesdSocket());
    events.setReconnectDelay(settings.reconnectDelay());
    QObject::connect(&events, &QubesEventStream::eventReceived, &dispatcher, &EventDispatcher::dispatch);
    // Events sent before (re)subscribing are lost; catch up from a fresh snapshot
    QObject::connect(&events, &QubesEventStream::connected, &reconciler, [&reconciler]() {
        if (!reconciler.reloadSnapshot()) {
            qCWarning(devtrayCore) << "Keeping device state from before the event stream interruption";
        }
    });
    QObject::connect(&events, &QubesEventStream::failed, &app, [&notifications](const QString &message) {
        reportCriticalError(&notifications, message);
        QCoreApplication::exit(1);
    });
    events.start();

    return app.exec();
}
