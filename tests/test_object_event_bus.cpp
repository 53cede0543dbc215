#include <QTest>
#include "core/bluetooth/ObjectEventBus.hpp"

using bcore::ObjectEvent;

namespace {

ObjectEvent makeEvent(const QString& interface, const QString& path = "/org/bluez/hci0")
{
    ObjectEvent event;
    event.kind = ObjectEvent::Kind::PropertiesChanged;
    event.path = path;
    event.interface = interface;
    return event;
}

} // namespace

class TestObjectEventBus : public QObject {
    Q_OBJECT
private slots:
    void testDeliveryIsSynchronous()
    {
        bcore::ObjectEventBus bus;
        QString receivedPath;
        int id = bus.subscribe("org.bluez.Adapter1", [&](const ObjectEvent& e) { receivedPath = e.path; });

        bus.publish(makeEvent("org.bluez.Adapter1"));
        // No event loop needed
        QCOMPARE(receivedPath, QString("/org/bluez/hci0"));
        QVERIFY(id > 0);
    }

    void testInterfaceIsolation()
    {
        bcore::ObjectEventBus bus;
        int adapterCount = 0, deviceCount = 0;
        bus.subscribe("org.bluez.Adapter1", [&](const ObjectEvent&) { ++adapterCount; });
        bus.subscribe("org.bluez.Device1", [&](const ObjectEvent&) { ++deviceCount; });

        bus.publish(makeEvent("org.bluez.Device1"));
        QCOMPARE(adapterCount, 0);
        QCOMPARE(deviceCount, 1);
    }

    void testWildcardReceivesEverything()
    {
        bcore::ObjectEventBus bus;
        QStringList seen;
        bus.subscribe(QString(), [&](const ObjectEvent& e) { seen.append(e.interface); });

        bus.publish(makeEvent("org.bluez.Adapter1"));
        bus.publish(makeEvent("org.bluez.obex.Transfer1"));
        QCOMPARE(seen, QStringList({"org.bluez.Adapter1", "org.bluez.obex.Transfer1"}));
    }

    void testSubscriptionOrder()
    {
        bcore::ObjectEventBus bus;
        QList<int> order;
        bus.subscribe("org.bluez.Device1", [&](const ObjectEvent&) { order.append(1); });
        bus.subscribe(QString(), [&](const ObjectEvent&) { order.append(2); });
        bus.subscribe("org.bluez.Device1", [&](const ObjectEvent&) { order.append(3); });

        bus.publish(makeEvent("org.bluez.Device1"));
        QCOMPARE(order, QList<int>({1, 2, 3}));
    }

    void testUnsubscribe()
    {
        bcore::ObjectEventBus bus;
        int count = 0;
        int id = bus.subscribe("org.bluez.Device1", [&](const ObjectEvent&) { ++count; });
        QCOMPARE(bus.subscriberCount(), 1);

        bus.unsubscribe(id);
        bus.publish(makeEvent("org.bluez.Device1"));
        QCOMPARE(count, 0);
        QCOMPARE(bus.subscriberCount(), 0);

        // Unknown ids are ignored
        bus.unsubscribe(12345);
    }

    void testUnsubscribeDuringDelivery()
    {
        bcore::ObjectEventBus bus;
        int second = 0;
        int secondId = 0;
        bus.subscribe("org.bluez.Device1", [&](const ObjectEvent&) { bus.unsubscribe(secondId); });
        secondId = bus.subscribe("org.bluez.Device1", [&](const ObjectEvent&) { ++second; });

        bus.publish(makeEvent("org.bluez.Device1"));
        QCOMPARE(second, 0);
    }
};

QTEST_MAIN(TestObjectEventBus)
#include "test_object_event_bus.moc"
