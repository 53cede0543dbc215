#include <QTest>
#include "core/bluetooth/BluetoothError.hpp"
#include "core/bluetooth/ErrorClassifier.hpp"

using bcore::ErrorCategory;

class TestErrorClassifier : public QObject {
    Q_OBJECT
private slots:
    void testStructuredNames_data()
    {
        QTest::addColumn<QString>("name");
        QTest::addColumn<int>("category");

        QTest::newRow("auth failed") << "org.bluez.Error.AuthenticationFailed" << int(ErrorCategory::Pairing);
        QTest::newRow("rejected") << "org.bluez.Error.Rejected" << int(ErrorCategory::Pairing);
        QTest::newRow("already connected") << "org.bluez.Error.AlreadyConnected" << int(ErrorCategory::Connection);
        QTest::newRow("not ready") << "org.bluez.Error.NotReady" << int(ErrorCategory::Adapter);
        QTest::newRow("not authorized") << "org.bluez.Error.NotAuthorized" << int(ErrorCategory::Permission);
        QTest::newRow("dbus timeout") << "org.freedesktop.DBus.Error.Timeout" << int(ErrorCategory::Timeout);
        QTest::newRow("service unknown") << "org.freedesktop.DBus.Error.ServiceUnknown" << int(ErrorCategory::Transport);
        QTest::newRow("access denied") << "org.freedesktop.DBus.Error.AccessDenied" << int(ErrorCategory::Permission);
        QTest::newRow("unknown object") << "org.freedesktop.DBus.Error.UnknownObject" << int(ErrorCategory::Device);
        QTest::newRow("obex") << "org.bluez.obex.Error.Failed" << int(ErrorCategory::Transfer);
    }

    void testStructuredNames()
    {
        QFETCH(QString, name);
        QFETCH(int, category);
        QCOMPARE(int(bcore::categorizeError(name, QString())), category);
    }

    void testNameWinsOverMessage()
    {
        // The message mentions a timeout but the structured name is authoritative
        QCOMPARE(bcore::categorizeError("org.bluez.Error.AuthenticationFailed", "Connection timeout"),
                 ErrorCategory::Pairing);
    }

    void testGenericFailedUsesMessage()
    {
        QCOMPARE(bcore::categorizeError("org.bluez.Error.Failed", "Page timeout"), ErrorCategory::Timeout);
        QCOMPARE(bcore::categorizeError("org.bluez.Error.Failed", "br-connection-refused"),
                 ErrorCategory::Connection);
        QCOMPARE(bcore::categorizeError("org.bluez.Error.Failed", ""), ErrorCategory::Device);
    }

    void testMessageOnly()
    {
        QCOMPARE(bcore::categorizeError("", "Permission denied"), ErrorCategory::Permission);
        QCOMPARE(bcore::categorizeError("", "something odd"), ErrorCategory::Unknown);
    }

    void testErrorCode()
    {
        QCOMPARE(bcore::errorCodeFor("org.bluez.Error.AlreadyConnected"), QString("ALREADYCONNECTED"));
        QCOMPARE(bcore::errorCodeFor(""), QString("BLUEZ_ERROR"));
    }

    void testClassifyBuildsMessage()
    {
        auto error = bcore::classifyError("org.bluez.Error.AuthenticationFailed", "raw text", "Pairing");
        QVERIFY(error.isValid());
        QCOMPARE(error.category, ErrorCategory::Pairing);
        QCOMPARE(error.code, QString("AUTHENTICATIONFAILED"));
        QCOMPARE(error.message, QString("Pairing failed: Authentication failed"));
        QCOMPARE(error.details, QString("raw text"));
        QVERIFY(!error.recoverySuggestion.isEmpty());
    }

    void testFallbackCategory()
    {
        auto error = bcore::classifyError("com.example.Weird", "odd", "Send file", ErrorCategory::Transfer);
        QCOMPARE(error.category, ErrorCategory::Transfer);

        auto unknown = bcore::classifyError("com.example.Weird", "odd");
        QCOMPARE(unknown.category, ErrorCategory::Unknown);
    }

    void testDefaultErrorIsSuccess()
    {
        bcore::BluetoothError none;
        QVERIFY(!none.isValid());
    }

    void testFactories()
    {
        auto timeout = bcore::BluetoothError::timeout("Connect");
        QCOMPARE(timeout.category, ErrorCategory::Timeout);
        QCOMPARE(timeout.message, QString("Operation timed out: Connect"));
        QVERIFY(timeout.isRecoverable());

        auto denied = bcore::BluetoothError::permissionDenied("Set adapter power");
        QCOMPARE(denied.category, ErrorCategory::Permission);
        QCOMPARE(denied.code, QString("PERMISSION_DENIED"));
        QVERIFY(!denied.isRecoverable());

        auto unavailable = bcore::BluetoothError::serviceUnavailable();
        QCOMPARE(unavailable.category, ErrorCategory::Transport);
        QVERIFY(unavailable.userMessage().contains("Suggestion:"));
    }
};

QTEST_MAIN(TestErrorClassifier)
#include "test_error_classifier.moc"
