#include <QTest>
#include <QSignalSpy>
#include <QDBusError>
#include <QDBusMessage>
#include "core/bluetooth/ErrorHandler.hpp"

using bcore::BluetoothError;
using bcore::ErrorCategory;

class TestErrorHandler : public QObject {
    Q_OBJECT
private slots:
    void testReportRecordsHistory()
    {
        bcore::ErrorHandler handler;
        QSignalSpy occurred(&handler, &bcore::ErrorHandler::errorOccurred);

        auto id = handler.report(BluetoothError::timeout("Connect"));
        QVERIFY(id.startsWith("bt_err_timeout_"));
        QCOMPARE(occurred.count(), 1);
        QCOMPARE(handler.history().size(), 1);
        QCOMPARE(handler.mostRecent().category, ErrorCategory::Timeout);
        QVERIFY(handler.activeErrors().contains(id));
    }

    void testHistoryIsBounded()
    {
        bcore::ErrorHandler handler;
        for (int i = 0; i < bcore::ErrorHandler::MaxHistory + 10; ++i)
            handler.report(BluetoothError::precondition(ErrorCategory::Adapter, QString::number(i)));

        QCOMPARE(handler.history().size(), bcore::ErrorHandler::MaxHistory);
        // Oldest entries are dropped first
        QCOMPARE(handler.history().first().message, QString("10"));
        QCOMPARE(handler.mostRecent().message, QString::number(bcore::ErrorHandler::MaxHistory + 9));
    }

    void testCountByCategory()
    {
        bcore::ErrorHandler handler;
        handler.report(BluetoothError::timeout("a"));
        handler.report(BluetoothError::timeout("b"));
        handler.report(BluetoothError::serviceUnavailable());

        QCOMPARE(handler.countByCategory(ErrorCategory::Timeout), 2);
        QCOMPARE(handler.countByCategory(ErrorCategory::Transport), 1);
        QCOMPARE(handler.countByCategory(ErrorCategory::Pairing), 0);
    }

    void testMarkResolved()
    {
        bcore::ErrorHandler handler;
        QSignalSpy resolved(&handler, &bcore::ErrorHandler::errorResolved);

        auto id = handler.report(BluetoothError::serviceUnavailable());
        handler.markResolved(id);
        QCOMPARE(resolved.count(), 1);
        QVERIFY(handler.activeErrors().isEmpty());
        // History keeps the entry
        QCOMPARE(handler.history().size(), 1);

        handler.markResolved(id);
        QCOMPARE(resolved.count(), 1);
    }

    void testClearAll()
    {
        bcore::ErrorHandler handler;
        handler.report(BluetoothError::serviceUnavailable());
        handler.clearAll();
        QVERIFY(handler.history().isEmpty());
        QVERIFY(handler.activeErrors().isEmpty());
        QVERIFY(!handler.mostRecent().isValid());
    }

    void testNotificationPolicy()
    {
        QVERIFY(bcore::ErrorHandler::shouldNotifyUser(BluetoothError::serviceUnavailable()));
        QVERIFY(bcore::ErrorHandler::shouldNotifyUser(BluetoothError::permissionDenied("x")));
        QVERIFY(!bcore::ErrorHandler::shouldNotifyUser(
            BluetoothError::notFound(ErrorCategory::Device, "Device not found: /x")));
        QVERIFY(bcore::ErrorHandler::shouldNotifyUser(
            BluetoothError(ErrorCategory::Device, "NOTAVAILABLE", "Device is not available")));
        QVERIFY(!bcore::ErrorHandler::shouldNotifyUser(
            BluetoothError(ErrorCategory::Unknown, "X", "odd")));
    }

    void testUserNotificationSignal()
    {
        bcore::ErrorHandler handler;
        QSignalSpy notify(&handler, &bcore::ErrorHandler::userNotificationRequired);

        handler.report(BluetoothError::notFound(ErrorCategory::Device, "Device not found: /x"));
        QCOMPARE(notify.count(), 0);

        handler.report(BluetoothError::timeout("Pair"));
        QCOMPARE(notify.count(), 1);
    }

    void testHandleDBusError()
    {
        bcore::ErrorHandler handler;
        QDBusError raw(QDBusMessage::createError("org.bluez.Error.NotReady", "Resource Not Ready"));

        auto error = handler.handleDBusError(raw, "Set power");
        QCOMPARE(error.category, ErrorCategory::Adapter);
        QCOMPARE(error.message, QString("Set power failed: Bluetooth adapter is not ready"));
        QCOMPARE(handler.history().size(), 1);
    }
};

QTEST_MAIN(TestErrorHandler)
#include "test_error_handler.moc"
