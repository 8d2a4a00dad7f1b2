// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 devtray Contributors

#include <QTest>
#include <QSignalSpy>

#include "DeviceRegistry.h"
#include "EventDispatcher.h"
#include "EventReconciler.h"
#include "MockAdmin.h"
#include "SnapshotLoader.h"

class TestEventReconciler : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void init();
    void cleanup();

    void testRegisterHandlers();

    // device-list-change
    void testListChangeRemovesDevice();
    void testListChangeAddsDevice();
    void testListChangeCoversAllClasses();
    void testListChangeUnreadableBackend();
    void testListChangeWithoutChanges();

    // device-attach / device-detach
    void testAttachKnownDevice();
    void testAttachUnknownDeviceLooksItUp();
    void testAttachUnlistedDeviceGetsPlaceholder();
    void testAttachToHaltedDomainIgnored();
    void testAttachTwiceSignalsOnce();
    void testAttachMalformedDeviceIgnored();
    void testDetach();
    void testDetachUnknownDeviceIgnored();

    // domain lifecycle
    void testDomainStart();
    void testDomainStartSkipsUnreadableClass();
    void testDomainShutdownIsIdempotent();
    void testDomainStartFailedActsAsShutdown();

    // property-set:label
    void testLabelChange();
    void testLabelChangeFallsBackToDefaultIcon();

    // catching up after an interrupted event stream
    void testReloadDropsVanishedDomain();
    void testReloadReportsDeviceChanges();
    void testReloadWithoutChanges();
    void testReloadFailureKeepsState();
    void testListChangeAfterReloadOfAdminVm();

private:
    static AdminEvent makeEvent(const QString &subject, const QString &name, const QString &device = QString())
    {
        AdminEvent event;
        event.subject = subject;
        event.name = name;
        if (!device.isEmpty()) {
            event.kwargs.insert(QStringLiteral("device"), device);
        }
        return event;
    }

    const DeviceKey m_mouse{QStringLiteral("sys-usb"), QStringLiteral("2-1")};
    const DeviceKey m_stick{QStringLiteral("sys-usb"), QStringLiteral("sdb")};

    MockAdminDirectory *m_mock = nullptr;
    DeviceRegistry *m_registry = nullptr;
    EventReconciler *m_reconciler = nullptr;
};

void TestEventReconciler::init()
{
    m_mock = new MockAdminDirectory();
    m_mock->addDomain(QStringLiteral("sys-usb"));
    m_mock->addDomain(QStringLiteral("work"));
    m_mock->setIcon(QStringLiteral("sys-usb"), QStringLiteral("servicevm-red"));
    m_mock->setIcon(QStringLiteral("work"), QStringLiteral("appvm-blue"));
    m_mock->addDevice(m_mouse.backendDomain, m_mouse.ident, DeviceClass::Usb, QStringLiteral("Mouse"));
    m_mock->addDevice(m_stick.backendDomain, m_stick.ident, DeviceClass::Block, QStringLiteral("Stick"));

    m_registry = new DeviceRegistry();
    SnapshotLoader loader(m_mock, QStringLiteral("appvm-black"));
    QVERIFY(loader.load(m_registry));

    m_reconciler = new EventReconciler(m_registry, m_mock, QStringLiteral("appvm-black"), this);
}

void TestEventReconciler::cleanup()
{
    delete m_reconciler;
    m_reconciler = nullptr;
    delete m_registry;
    m_registry = nullptr;
    delete m_mock;
    m_mock = nullptr;
}

void TestEventReconciler::testRegisterHandlers()
{
    EventDispatcher dispatcher;
    m_reconciler->registerHandlers(&dispatcher);

    for (const QString &devclass : {QStringLiteral("block"), QStringLiteral("usb"), QStringLiteral("mic")}) {
        QCOMPARE(dispatcher.handlerCount(QStringLiteral("device-attach:") + devclass), 1);
        QCOMPARE(dispatcher.handlerCount(QStringLiteral("device-detach:") + devclass), 1);
        QCOMPARE(dispatcher.handlerCount(QStringLiteral("device-list-change:") + devclass), 1);
    }
    QCOMPARE(dispatcher.handlerCount(QStringLiteral("domain-start")), 1);
    QCOMPARE(dispatcher.handlerCount(QStringLiteral("domain-shutdown")), 1);
    QCOMPARE(dispatcher.handlerCount(QStringLiteral("domain-start-failed")), 1);
    QCOMPARE(dispatcher.handlerCount(QStringLiteral("property-set:label")), 1);

    // Dispatching reaches the reconciler
    m_mock->setAttached(QStringLiteral("work"), DeviceClass::Usb, {m_mouse});
    dispatcher.dispatch(makeEvent(QStringLiteral("work"), QStringLiteral("device-attach:usb"), m_mouse.toString()));
    QCOMPARE(m_registry->device(m_mouse).attachments, QSet<QString>{QStringLiteral("work")});
}

void TestEventReconciler::testListChangeRemovesDevice()
{
    QSignalSpy added(m_reconciler, &EventReconciler::devicesAdded);
    QSignalSpy removed(m_reconciler, &EventReconciler::devicesRemoved);

    m_mock->removeDevice(m_mouse.backendDomain, m_mouse.ident);
    m_reconciler->handleDeviceListChange(makeEvent(QStringLiteral("sys-usb"), QStringLiteral("device-list-change:usb")));

    QVERIFY(!m_registry->hasDevice(m_mouse));
    QVERIFY(m_registry->hasDevice(m_stick));

    QCOMPARE(added.count(), 0);
    QCOMPARE(removed.count(), 1);
    QCOMPARE(removed.at(0).at(0).toString(), QStringLiteral("sys-usb"));
    const QList<Device> devices = removed.at(0).at(1).value<QList<Device>>();
    QCOMPARE(devices.size(), 1);
    QCOMPARE(devices.at(0).key, m_mouse);
    QCOMPARE(devices.at(0).description, QStringLiteral("Mouse"));
}

void TestEventReconciler::testListChangeAddsDevice()
{
    QSignalSpy added(m_reconciler, &EventReconciler::devicesAdded);

    m_mock->addDevice(QStringLiteral("sys-usb"), QStringLiteral("2-2"), DeviceClass::Usb, QStringLiteral("Keyboard"));
    m_reconciler->handleDeviceListChange(makeEvent(QStringLiteral("sys-usb"), QStringLiteral("device-list-change:usb")));

    const DeviceKey keyboard{QStringLiteral("sys-usb"), QStringLiteral("2-2")};
    QVERIFY(m_registry->hasDevice(keyboard));
    QCOMPARE(m_registry->device(keyboard).vmIcon, QStringLiteral("servicevm-red"));

    QCOMPARE(added.count(), 1);
    const QList<Device> devices = added.at(0).at(1).value<QList<Device>>();
    QCOMPARE(devices.size(), 1);
    QCOMPARE(devices.at(0).description, QStringLiteral("Keyboard"));
}

void TestEventReconciler::testListChangeCoversAllClasses()
{
    QSignalSpy removed(m_reconciler, &EventReconciler::devicesRemoved);

    // A usb event also refreshes block devices of the same backend
    m_mock->removeDevice(m_stick.backendDomain, m_stick.ident);
    m_reconciler->handleDeviceListChange(makeEvent(QStringLiteral("sys-usb"), QStringLiteral("device-list-change:usb")));

    QVERIFY(!m_registry->hasDevice(m_stick));
    QCOMPARE(removed.count(), 1);
}

void TestEventReconciler::testListChangeUnreadableBackend()
{
    QSignalSpy removed(m_reconciler, &EventReconciler::devicesRemoved);

    m_mock->setDevicesFail(QStringLiteral("sys-usb"), true);
    m_reconciler->handleDeviceListChange(makeEvent(QStringLiteral("sys-usb"), QStringLiteral("device-list-change:usb")));

    QCOMPARE(m_registry->devicesOnBackend(QStringLiteral("sys-usb")).size(), 0);
    QCOMPARE(removed.count(), 1);
    QCOMPARE(removed.at(0).at(1).value<QList<Device>>().size(), 2);
}

void TestEventReconciler::testListChangeWithoutChanges()
{
    QSignalSpy added(m_reconciler, &EventReconciler::devicesAdded);
    QSignalSpy removed(m_reconciler, &EventReconciler::devicesRemoved);

    m_reconciler->handleDeviceListChange(makeEvent(QStringLiteral("sys-usb"), QStringLiteral("device-list-change:usb")));

    QCOMPARE(m_registry->deviceCount(), 2);
    QCOMPARE(added.count(), 0);
    QCOMPARE(removed.count(), 0);
}

void TestEventReconciler::testAttachKnownDevice()
{
    QSignalSpy attached(m_reconciler, &EventReconciler::deviceAttached);
    QSignalSpy changed(m_reconciler, &EventReconciler::attachmentsChanged);

    m_reconciler->handleDeviceAttach(makeEvent(QStringLiteral("work"), QStringLiteral("device-attach:usb"),
                                               m_mouse.toString()));

    QCOMPARE(m_registry->device(m_mouse).attachments, QSet<QString>{QStringLiteral("work")});
    QCOMPARE(changed.count(), 1);
    QCOMPARE(changed.at(0).at(0).value<DeviceKey>(), m_mouse);
    QCOMPARE(attached.count(), 1);
    QCOMPARE(attached.at(0).at(0).toString(), QStringLiteral("work"));
    QCOMPARE(attached.at(0).at(1).value<Device>().description, QStringLiteral("Mouse"));
}

void TestEventReconciler::testAttachUnknownDeviceLooksItUp()
{
    // Appeared on the backend without a list-change event yet
    m_mock->addDevice(QStringLiteral("sys-usb"), QStringLiteral("4-1"), DeviceClass::Usb, QStringLiteral("Camera"));
    const DeviceKey camera{QStringLiteral("sys-usb"), QStringLiteral("4-1")};

    m_reconciler->handleDeviceAttach(makeEvent(QStringLiteral("work"), QStringLiteral("device-attach:usb"),
                                               camera.toString()));

    QVERIFY(m_registry->hasDevice(camera));
    const Device device = m_registry->device(camera);
    QCOMPARE(device.description, QStringLiteral("Camera"));
    QCOMPARE(device.vmIcon, QStringLiteral("servicevm-red"));
    QCOMPARE(device.attachments, QSet<QString>{QStringLiteral("work")});
}

void TestEventReconciler::testAttachUnlistedDeviceGetsPlaceholder()
{
    const DeviceKey ghost{QStringLiteral("sys-usb"), QStringLiteral("9-9")};

    m_reconciler->handleDeviceAttach(makeEvent(QStringLiteral("work"), QStringLiteral("device-attach:usb"),
                                               ghost.toString()));

    QVERIFY(m_registry->hasDevice(ghost));
    const Device device = m_registry->device(ghost);
    QCOMPARE(device.description, QStringLiteral("unknown"));
    QVERIFY(device.devclass == DeviceClass::Usb);
    QCOMPARE(device.attachments, QSet<QString>{QStringLiteral("work")});
}

void TestEventReconciler::testAttachToHaltedDomainIgnored()
{
    QSignalSpy changed(m_reconciler, &EventReconciler::attachmentsChanged);

    m_mock->setRunning(QStringLiteral("work"), false);
    m_reconciler->handleDeviceAttach(makeEvent(QStringLiteral("work"), QStringLiteral("device-attach:usb"),
                                               m_mouse.toString()));

    // Unreadable state counts as not running
    m_mock->setRunningFails(QStringLiteral("sys-usb"), true);
    m_reconciler->handleDeviceAttach(makeEvent(QStringLiteral("sys-usb"), QStringLiteral("device-attach:usb"),
                                               m_mouse.toString()));

    QVERIFY(m_registry->device(m_mouse).attachments.isEmpty());
    QCOMPARE(changed.count(), 0);
}

void TestEventReconciler::testAttachTwiceSignalsOnce()
{
    QSignalSpy attached(m_reconciler, &EventReconciler::deviceAttached);

    const AdminEvent event = makeEvent(QStringLiteral("work"), QStringLiteral("device-attach:usb"),
                                       m_mouse.toString());
    m_reconciler->handleDeviceAttach(event);
    m_reconciler->handleDeviceAttach(event);

    QCOMPARE(attached.count(), 1);
}

void TestEventReconciler::testAttachMalformedDeviceIgnored()
{
    m_reconciler->handleDeviceAttach(makeEvent(QStringLiteral("work"), QStringLiteral("device-attach:usb"),
                                               QStringLiteral("garbage")));
    m_reconciler->handleDeviceAttach(makeEvent(QStringLiteral("work"), QStringLiteral("device-attach:pci"),
                                               m_mouse.toString()));

    QCOMPARE(m_registry->deviceCount(), 2);
    QVERIFY(m_registry->device(m_mouse).attachments.isEmpty());
}

void TestEventReconciler::testDetach()
{
    m_registry->attach(m_mouse, QStringLiteral("work"));

    QSignalSpy detached(m_reconciler, &EventReconciler::deviceDetached);
    QSignalSpy changed(m_reconciler, &EventReconciler::attachmentsChanged);

    const AdminEvent event = makeEvent(QStringLiteral("work"), QStringLiteral("device-detach:usb"),
                                       m_mouse.toString());
    m_reconciler->handleDeviceDetach(event);
    m_reconciler->handleDeviceDetach(event);

    QVERIFY(m_registry->device(m_mouse).attachments.isEmpty());
    QCOMPARE(changed.count(), 1);
    QCOMPARE(detached.count(), 1);
    QCOMPARE(detached.at(0).at(0).toString(), QStringLiteral("work"));
    QCOMPARE(detached.at(0).at(1).value<Device>().key, m_mouse);
}

void TestEventReconciler::testDetachUnknownDeviceIgnored()
{
    QSignalSpy detached(m_reconciler, &EventReconciler::deviceDetached);

    m_reconciler->handleDeviceDetach(makeEvent(QStringLiteral("work"), QStringLiteral("device-detach:usb"),
                                               QStringLiteral("sys-usb:9-9")));

    QCOMPARE(m_registry->deviceCount(), 2);
    QCOMPARE(detached.count(), 0);
}

void TestEventReconciler::testDomainStart()
{
    QSignalSpy domains(m_reconciler, &EventReconciler::domainsChanged);
    QSignalSpy changed(m_reconciler, &EventReconciler::attachmentsChanged);

    m_mock->addDomain(QStringLiteral("personal"));
    m_mock->setIcon(QStringLiteral("personal"), QStringLiteral("appvm-yellow"));
    m_mock->setAttached(QStringLiteral("personal"), DeviceClass::Block, {m_stick});

    m_reconciler->handleDomainStart(makeEvent(QStringLiteral("personal"), QStringLiteral("domain-start")));

    QVERIFY(m_registry->hasDomain(QStringLiteral("personal")));
    QCOMPARE(m_registry->domain(QStringLiteral("personal")).icon, QStringLiteral("appvm-yellow"));
    QCOMPARE(m_registry->device(m_stick).attachments, QSet<QString>{QStringLiteral("personal")});
    QCOMPARE(domains.count(), 1);
    QCOMPARE(changed.count(), 1);
}

void TestEventReconciler::testDomainStartSkipsUnreadableClass()
{
    m_mock->addDomain(QStringLiteral("personal"));
    m_mock->setAttached(QStringLiteral("personal"), DeviceClass::Usb, {m_mouse});
    m_mock->setAttachedFail(QStringLiteral("personal"), true);

    m_reconciler->handleDomainStart(makeEvent(QStringLiteral("personal"), QStringLiteral("domain-start")));

    // Every class was still tried
    QVERIFY(m_registry->hasDomain(QStringLiteral("personal")));
    QCOMPARE(m_mock->attachedQueries.filter(QStringLiteral("personal/")).size(), 3);
    QVERIFY(m_registry->device(m_mouse).attachments.isEmpty());
}

void TestEventReconciler::testDomainShutdownIsIdempotent()
{
    m_registry->attach(m_mouse, QStringLiteral("work"));
    m_registry->attach(m_stick, QStringLiteral("work"));

    QSignalSpy domains(m_reconciler, &EventReconciler::domainsChanged);
    QSignalSpy changed(m_reconciler, &EventReconciler::attachmentsChanged);

    const AdminEvent event = makeEvent(QStringLiteral("work"), QStringLiteral("domain-shutdown"));
    m_reconciler->handleDomainShutdown(event);

    QVERIFY(!m_registry->hasDomain(QStringLiteral("work")));
    QVERIFY(m_registry->device(m_mouse).attachments.isEmpty());
    QVERIFY(m_registry->device(m_stick).attachments.isEmpty());
    QCOMPARE(domains.count(), 1);
    QCOMPARE(changed.count(), 2);

    m_reconciler->handleDomainShutdown(event);

    QCOMPARE(m_registry->domains().size(), 1);
    QCOMPARE(m_registry->deviceCount(), 2);
    QCOMPARE(domains.count(), 1);
    QCOMPARE(changed.count(), 2);
}

void TestEventReconciler::testDomainStartFailedActsAsShutdown()
{
    EventDispatcher dispatcher;
    m_reconciler->registerHandlers(&dispatcher);

    dispatcher.dispatch(makeEvent(QStringLiteral("work"), QStringLiteral("domain-start-failed")));
    QVERIFY(!m_registry->hasDomain(QStringLiteral("work")));
}

void TestEventReconciler::testLabelChange()
{
    QSignalSpy domains(m_reconciler, &EventReconciler::domainsChanged);

    m_mock->setIcon(QStringLiteral("sys-usb"), QStringLiteral("servicevm-purple"));
    m_reconciler->handleLabelChange(makeEvent(QStringLiteral("sys-usb"), QStringLiteral("property-set:label")));

    QCOMPARE(m_registry->domain(QStringLiteral("sys-usb")).icon, QStringLiteral("servicevm-purple"));
    QCOMPARE(m_registry->device(m_mouse).vmIcon, QStringLiteral("servicevm-purple"));
    QCOMPARE(m_registry->device(m_stick).vmIcon, QStringLiteral("servicevm-purple"));
    QCOMPARE(domains.count(), 1);

    // Global property changes carry no subject
    m_reconciler->handleLabelChange(makeEvent(QString(), QStringLiteral("property-set:label")));
    QCOMPARE(domains.count(), 1);
}

void TestEventReconciler::testLabelChangeFallsBackToDefaultIcon()
{
    m_mock->setIconFails(QStringLiteral("sys-usb"), true);
    m_reconciler->handleLabelChange(makeEvent(QStringLiteral("sys-usb"), QStringLiteral("property-set:label")));

    QCOMPARE(m_registry->domain(QStringLiteral("sys-usb")).icon, QStringLiteral("appvm-black"));
    QCOMPARE(m_registry->device(m_mouse).vmIcon, QStringLiteral("appvm-black"));
}

void TestEventReconciler::testReloadDropsVanishedDomain()
{
    m_registry->attach(m_mouse, QStringLiteral("work"));

    // "work" shut down while no events could be received
    m_mock->setRunning(QStringLiteral("work"), false);

    QSignalSpy domains(m_reconciler, &EventReconciler::domainsChanged);
    QSignalSpy attachments(m_reconciler, &EventReconciler::attachmentsChanged);
    QVERIFY(m_reconciler->reloadSnapshot());

    QVERIFY(!m_registry->hasDomain(QStringLiteral("work")));
    QVERIFY(m_registry->device(m_mouse).attachments.isEmpty());
    QCOMPARE(domains.count(), 1);
    QCOMPARE(attachments.count(), 1);
    QCOMPARE(attachments.at(0).at(0).value<DeviceKey>(), m_mouse);
}

void TestEventReconciler::testReloadReportsDeviceChanges()
{
    m_mock->removeDevice(m_stick.backendDomain, m_stick.ident);
    m_mock->addDevice(QStringLiteral("sys-usb"), QStringLiteral("2-2"), DeviceClass::Usb, QStringLiteral("Keyboard"));

    QSignalSpy added(m_reconciler, &EventReconciler::devicesAdded);
    QSignalSpy removed(m_reconciler, &EventReconciler::devicesRemoved);
    QSignalSpy domains(m_reconciler, &EventReconciler::domainsChanged);
    QVERIFY(m_reconciler->reloadSnapshot());

    QCOMPARE(added.count(), 1);
    QCOMPARE(added.at(0).at(0).toString(), QStringLiteral("sys-usb"));
    const QList<Device> addedDevices = added.at(0).at(1).value<QList<Device>>();
    QCOMPARE(addedDevices.size(), 1);
    QCOMPARE(addedDevices.at(0).description, QStringLiteral("Keyboard"));

    QCOMPARE(removed.count(), 1);
    const QList<Device> removedDevices = removed.at(0).at(1).value<QList<Device>>();
    QCOMPARE(removedDevices.size(), 1);
    QCOMPARE(removedDevices.at(0).key, m_stick);

    QVERIFY(!m_registry->hasDevice(m_stick));
    QVERIFY(m_registry->hasDevice(DeviceKey{QStringLiteral("sys-usb"), QStringLiteral("2-2")}));
    QCOMPARE(domains.count(), 0);
}

void TestEventReconciler::testReloadWithoutChanges()
{
    QSignalSpy added(m_reconciler, &EventReconciler::devicesAdded);
    QSignalSpy removed(m_reconciler, &EventReconciler::devicesRemoved);
    QSignalSpy attachments(m_reconciler, &EventReconciler::attachmentsChanged);
    QSignalSpy domains(m_reconciler, &EventReconciler::domainsChanged);

    QVERIFY(m_reconciler->reloadSnapshot());

    QCOMPARE(added.count(), 0);
    QCOMPARE(removed.count(), 0);
    QCOMPARE(attachments.count(), 0);
    QCOMPARE(domains.count(), 0);
    QCOMPARE(m_registry->deviceCount(), 2);
}

void TestEventReconciler::testReloadFailureKeepsState()
{
    m_mock->setDomainsFail(true);

    QSignalSpy domains(m_reconciler, &EventReconciler::domainsChanged);
    QVERIFY(!m_reconciler->reloadSnapshot());
    QVERIFY(!m_reconciler->errorString().isEmpty());

    QCOMPARE(m_registry->domains().size(), 2);
    QCOMPARE(m_registry->deviceCount(), 2);
    QCOMPARE(domains.count(), 0);
}

void TestEventReconciler::testListChangeAfterReloadOfAdminVm()
{
    // dom0's devices are known from the snapshot, so its first list change adds nothing
    m_mock->addDomain(QStringLiteral("dom0"), true, QStringLiteral("AdminVM"));
    m_mock->addDevice(QStringLiteral("dom0"), QStringLiteral("sda"), DeviceClass::Block, QStringLiteral("Disk"));
    QVERIFY(m_reconciler->reloadSnapshot());

    QSignalSpy added(m_reconciler, &EventReconciler::devicesAdded);
    m_reconciler->handleDeviceListChange(makeEvent(QStringLiteral("dom0"), QStringLiteral("device-list-change:block")));
    QCOMPARE(added.count(), 0);
    QVERIFY(m_registry->hasDevice(DeviceKey{QStringLiteral("dom0"), QStringLiteral("sda")}));
}

QTEST_MAIN(TestEventReconciler)
#include "test_eventreconciler.moc"
