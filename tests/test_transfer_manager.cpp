#include <QTest>
#include <QSignalSpy>
#include <QDBusObjectPath>
#include <QFile>
#include <QTemporaryDir>
#include "FakeBluezTransport.hpp"
#include "core/bluetooth/TransferManager.hpp"

using bcore::BluetoothError;
using bcore::FileTransfer;
using bcore::TransferDirection;
using bcore::TransferStatus;

namespace {

const QString PHONE = QStringLiteral("/org/bluez/hci0/dev_AA_BB_CC_DD_EE_FF");
const QString SESSION = QStringLiteral("/org/bluez/obex/client/session1");
const QString OUT_TRANSFER = QStringLiteral("/org/bluez/obex/client/session1/transfer1");
const QString IN_SESSION = QStringLiteral("/org/bluez/obex/server/session3");
const QString IN_TRANSFER = QStringLiteral("/org/bluez/obex/server/session3/transfer7");

struct Result {
    bool called = false;
    BluetoothError error;
    bcore::Completion completion()
    {
        return [this](const BluetoothError& e) { called = true; error = e; };
    }
};

struct SendResult {
    bool called = false;
    QString path;
    BluetoothError error;
    bcore::TransferManager::SendHandler handler()
    {
        return [this](const QString& p, const BluetoothError& e) { called = true; path = p; error = e; };
    }
};

} // namespace

class TestTransferManager : public QObject {
    Q_OBJECT
private slots:
    void init()
    {
        QVERIFY(dir_.isValid());
        file_ = dir_.filePath("notes.txt");
        QFile f(file_);
        QVERIFY(f.open(QIODevice::WriteOnly));
        f.write("hello world");
        f.close();

        transport_ = new FakeBluezTransport;
        transport_->addObject(PHONE, bcore::DEVICE_INTERFACE, {{"Address", "AA:BB:CC:DD:EE:FF"}}, false);
        transport_->methodResults.insert("CreateSession", {QVariant::fromValue(QDBusObjectPath(SESSION))});
        transport_->methodResults.insert("SendFile", {
            QVariant::fromValue(QDBusObjectPath(OUT_TRANSFER)),
            QVariantMap{{"Status", "queued"}, {"Size", 11}},
        });
        transfers_ = new bcore::TransferManager(transport_);
    }

    void cleanup()
    {
        delete transfers_;
        delete transport_;
    }

    void testSendRequiresInitialize()
    {
        SendResult result;
        transfers_->sendFile(PHONE, file_, result.handler());
        QCOMPARE(result.error.code, QString("PRECONDITION_FAILED"));
        QCOMPARE(transport_->callCount("CreateSession"), 0);
    }

    void testSendMissingFile()
    {
        transfers_->initialize();
        SendResult result;
        transfers_->sendFile(PHONE, dir_.filePath("missing.bin"), result.handler());
        QCOMPARE(result.error.code, QString("NOT_FOUND"));
        QVERIFY(result.error.message.startsWith("File not found"));
    }

    void testSendFile()
    {
        transfers_->initialize();
        QSignalSpy started(transfers_, &bcore::TransferManager::transferStarted);

        SendResult result;
        transfers_->sendFile(PHONE, file_, result.handler());

        QVERIFY(!result.error.isValid());
        QCOMPARE(result.path, OUT_TRANSFER);

        auto session = transport_->lastCall("CreateSession");
        QCOMPARE(session.args[0].toString(), QString("AA:BB:CC:DD:EE:FF"));
        QCOMPARE(session.args[1].toMap().value("Target").toString(), QString("opp"));
        auto push = transport_->lastCall("SendFile");
        QCOMPARE(push.path, SESSION);
        QCOMPARE(push.args[0].toString(), file_);

        QCOMPARE(started.count(), 1);
        auto transfer = transfers_->transfer(OUT_TRANSFER);
        QCOMPARE(transfer.direction, TransferDirection::Sending);
        QCOMPARE(transfer.sessionPath, SESSION);
        QCOMPARE(transfer.devicePath, PHONE);
        QCOMPARE(transfer.filename, QString("notes.txt"));
        QCOMPARE(transfer.size, quint64(11));
        QCOMPARE(transfer.status, TransferStatus::Queued);
    }

    void testProgressAndCompletion()
    {
        transfers_->initialize();
        SendResult result;
        transfers_->sendFile(PHONE, file_, result.handler());

        QSignalSpy progress(transfers_, &bcore::TransferManager::transferProgress);
        QSignalSpy completed(transfers_, &bcore::TransferManager::transferCompleted);

        transport_->changeProperties(OUT_TRANSFER, bcore::OBEX_TRANSFER_INTERFACE,
                                     {{"Status", "active"}, {"Transferred", 4}});
        QCOMPARE(progress.count(), 1);
        QCOMPARE(transfers_->transfer(OUT_TRANSFER).transferred, quint64(4));

        // Counters never go backwards
        transport_->changeProperties(OUT_TRANSFER, bcore::OBEX_TRANSFER_INTERFACE, {{"Transferred", 2}});
        QCOMPARE(progress.count(), 1);
        QCOMPARE(transfers_->transfer(OUT_TRANSFER).transferred, quint64(4));

        transport_->changeProperties(OUT_TRANSFER, bcore::OBEX_TRANSFER_INTERFACE,
                                     {{"Status", "complete"}, {"Transferred", 11}});
        QCOMPARE(completed.count(), 1);
        auto done = completed.first().at(0).value<FileTransfer>();
        QCOMPARE(done.status, TransferStatus::Complete);
        QVERIFY(done.completed.isValid());
        QCOMPARE(done.progressPercentage(), 100.0);
    }

    void testProgressMatchesTransferredBytes()
    {
        transport_->methodResults.insert("SendFile", {
            QVariant::fromValue(QDBusObjectPath(OUT_TRANSFER)),
            QVariantMap{{"Status", "queued"}, {"Size", 1000}},
        });
        transfers_->initialize();
        QSignalSpy started(transfers_, &bcore::TransferManager::transferStarted);
        QSignalSpy progress(transfers_, &bcore::TransferManager::transferProgress);
        QSignalSpy completed(transfers_, &bcore::TransferManager::transferCompleted);

        SendResult result;
        transfers_->sendFile(PHONE, file_, result.handler());
        QCOMPARE(started.count(), 1);
        // The size reported by the daemon wins over the local file size
        auto queued = transfers_->transfer(OUT_TRANSFER);
        QCOMPARE(queued.size, quint64(1000));
        QCOMPARE(queued.transferred, quint64(0));
        QCOMPARE(queued.progressPercentage(), 0.0);

        transport_->changeProperties(OUT_TRANSFER, bcore::OBEX_TRANSFER_INTERFACE,
                                     {{"Status", "active"}, {"Transferred", 250}});
        transport_->changeProperties(OUT_TRANSFER, bcore::OBEX_TRANSFER_INTERFACE, {{"Transferred", 500}});
        transport_->changeProperties(OUT_TRANSFER, bcore::OBEX_TRANSFER_INTERFACE, {{"Transferred", 1000}});
        transport_->changeProperties(OUT_TRANSFER, bcore::OBEX_TRANSFER_INTERFACE, {{"Status", "complete"}});

        const QList<double> expected{25.0, 50.0, 100.0};
        QCOMPARE(progress.count(), expected.size());
        for (int i = 0; i < expected.size(); ++i) {
            auto snapshot = progress.at(i).at(0).value<FileTransfer>();
            QCOMPARE(snapshot.progressPercentage(), expected[i]);
            QCOMPARE(snapshot.progressPercentage(),
                     double(snapshot.transferred) / double(snapshot.size) * 100.0);
        }

        QCOMPARE(completed.count(), 1);
        auto done = completed.first().at(0).value<FileTransfer>();
        QCOMPARE(done.status, TransferStatus::Complete);
        QCOMPARE(done.transferred, quint64(1000));
    }

    void testRemoteErrorFailsTransfer()
    {
        transfers_->initialize();
        SendResult result;
        transfers_->sendFile(PHONE, file_, result.handler());
        QSignalSpy failed(transfers_, &bcore::TransferManager::transferFailed);

        transport_->changeProperties(OUT_TRANSFER, bcore::OBEX_TRANSFER_INTERFACE, {{"Status", "error"}});

        QCOMPARE(failed.count(), 1);
        QCOMPARE(failed.first().at(1).value<BluetoothError>().code, QString("TRANSFER_FAILED"));
        QVERIFY(!transfers_->hasTransfer(OUT_TRANSFER));
        QCOMPARE(transport_->callCount("RemoveSession"), 1);
    }

    void testSendFailureRemovesSession()
    {
        transfers_->initialize();
        transport_->methodErrors.insert("SendFile",
            FakeBluezTransport::makeError("org.bluez.obex.Error.Failed", "Unable to send"));

        SendResult result;
        transfers_->sendFile(PHONE, file_, result.handler());
        QVERIFY(result.error.isValid());
        QCOMPARE(result.error.category, bcore::ErrorCategory::Transfer);
        auto remove = transport_->lastCall("RemoveSession");
        QCOMPARE(remove.args.first().value<QDBusObjectPath>().path(), SESSION);
    }

    void testAnnouncementBeforeReplyIsOutbound()
    {
        transfers_->initialize();
        transport_->deferReplies = true;
        QSignalSpy incoming(transfers_, &bcore::TransferManager::incomingTransfer);
        QSignalSpy started(transfers_, &bcore::TransferManager::transferStarted);

        SendResult result;
        transfers_->sendFile(PHONE, file_, result.handler());
        QVERIFY(transport_->reply("CreateSession", {QVariant::fromValue(QDBusObjectPath(SESSION))}));

        // obexd announces the Transfer1 object before SendFile returns
        transport_->addObject(OUT_TRANSFER, bcore::OBEX_TRANSFER_INTERFACE,
                              {{"Status", "queued"}, {"Name", "notes.txt"}});
        QCOMPARE(incoming.count(), 0);

        QVERIFY(transport_->reply("SendFile", {QVariant::fromValue(QDBusObjectPath(OUT_TRANSFER))}));
        QCOMPARE(started.count(), 1);
        QCOMPARE(transfers_->transfer(OUT_TRANSFER).direction, TransferDirection::Sending);
        QCOMPARE(transfers_->activeTransfers().size(), 1);
    }

    void testIncomingTransfer()
    {
        transfers_->initialize();
        QSignalSpy incoming(transfers_, &bcore::TransferManager::incomingTransfer);

        transport_->addObject(IN_TRANSFER, bcore::OBEX_TRANSFER_INTERFACE, {
            {"Status", "queued"},
            {"Name", "photo.jpg"},
            {"Size", 2048},
            {"Session", QVariant::fromValue(QDBusObjectPath(IN_SESSION))},
        });

        QCOMPARE(incoming.count(), 1);
        auto transfer = incoming.first().at(0).value<FileTransfer>();
        QCOMPARE(transfer.direction, TransferDirection::Receiving);
        QCOMPARE(transfer.filename, QString("photo.jpg"));
        QCOMPARE(transfer.size, quint64(2048));
        QCOMPARE(transfer.sessionPath, IN_SESSION);

        Result accepted;
        const QString target = dir_.filePath("photo.jpg");
        transfers_->acceptTransfer(IN_TRANSFER, target, accepted.completion());
        QVERIFY(!accepted.error.isValid());
        QCOMPARE(transfers_->transfer(IN_TRANSFER).localPath, target);
        QCOMPARE(transfers_->transfer(IN_TRANSFER).status, TransferStatus::Active);
    }

    void testAcceptIntoMissingDirectory()
    {
        transfers_->initialize();
        transport_->addObject(IN_TRANSFER, bcore::OBEX_TRANSFER_INTERFACE, {{"Status", "queued"}});

        Result result;
        transfers_->acceptTransfer(IN_TRANSFER, dir_.filePath("nope/photo.jpg"), result.completion());
        QCOMPARE(result.error.code, QString("NOT_FOUND"));

        Result unknown;
        transfers_->acceptTransfer("/org/bluez/obex/server/session9/transfer1", dir_.filePath("x"),
                                   unknown.completion());
        QVERIFY(unknown.error.message.startsWith("Transfer not found"));
    }

    void testRejectIncoming()
    {
        transfers_->initialize();
        transport_->addObject(IN_TRANSFER, bcore::OBEX_TRANSFER_INTERFACE, {{"Status", "queued"}});
        QSignalSpy failed(transfers_, &bcore::TransferManager::transferFailed);

        Result result;
        transfers_->rejectTransfer(IN_TRANSFER, result.completion());
        QVERIFY(!result.error.isValid());
        QCOMPARE(transport_->lastCall("Cancel").path, IN_TRANSFER);
        QCOMPARE(failed.count(), 1);
        QCOMPARE(failed.first().at(1).value<BluetoothError>().code, QString("CANCELLED"));
        QVERIFY(!transfers_->hasTransfer(IN_TRANSFER));
        // Inbound sessions belong to obexd
        QCOMPARE(transport_->callCount("RemoveSession"), 0);
    }

    void testCancelOutbound()
    {
        transfers_->initialize();
        SendResult sent;
        transfers_->sendFile(PHONE, file_, sent.handler());

        Result result;
        transfers_->cancelTransfer(OUT_TRANSFER, result.completion());
        QVERIFY(!result.error.isValid());
        QCOMPARE(transport_->callCount("RemoveSession"), 1);
        QVERIFY(transfers_->activeTransfers().isEmpty());
    }

    void testPauseAndResume()
    {
        transfers_->initialize();
        SendResult sent;
        transfers_->sendFile(PHONE, file_, sent.handler());

        Result early;
        transfers_->pauseTransfer(OUT_TRANSFER, early.completion());
        QCOMPARE(early.error.message, QString("Transfer is not active"));

        transport_->changeProperties(OUT_TRANSFER, bcore::OBEX_TRANSFER_INTERFACE, {{"Status", "active"}});

        Result paused;
        transfers_->pauseTransfer(OUT_TRANSFER, paused.completion());
        QVERIFY(!paused.error.isValid());
        QCOMPARE(transport_->lastCall("Suspend").path, OUT_TRANSFER);
        QCOMPARE(transfers_->transfer(OUT_TRANSFER).status, TransferStatus::Suspended);

        Result resumed;
        transfers_->resumeTransfer(OUT_TRANSFER, resumed.completion());
        QVERIFY(!resumed.error.isValid());
        QCOMPARE(transfers_->transfer(OUT_TRANSFER).status, TransferStatus::Active);

        Result again;
        transfers_->resumeTransfer(OUT_TRANSFER, again.completion());
        QCOMPARE(again.error.message, QString("Transfer is not suspended"));
    }

    void testRemovedWhileActive()
    {
        transfers_->initialize();
        transport_->addObject(IN_TRANSFER, bcore::OBEX_TRANSFER_INTERFACE, {{"Status", "active"}});
        QSignalSpy failed(transfers_, &bcore::TransferManager::transferFailed);

        transport_->removeObject(IN_TRANSFER, bcore::OBEX_TRANSFER_INTERFACE);
        QCOMPARE(failed.count(), 1);
        QCOMPARE(failed.first().at(1).value<BluetoothError>().code, QString("TRANSFER_REMOVED"));
        QVERIFY(!transfers_->hasTransfer(IN_TRANSFER));
    }

    void testRemovedAfterCompletionIsQuiet()
    {
        transfers_->initialize();
        transport_->addObject(IN_TRANSFER, bcore::OBEX_TRANSFER_INTERFACE, {{"Status", "complete"}});
        QSignalSpy failed(transfers_, &bcore::TransferManager::transferFailed);

        transport_->removeObject(IN_TRANSFER, bcore::OBEX_TRANSFER_INTERFACE);
        QCOMPARE(failed.count(), 0);
    }

    void testSendFilesSkipsFailures()
    {
        transfers_->initialize();
        QStringList started;
        bool finished = false;
        transfers_->sendFiles(PHONE, {file_, dir_.filePath("missing.bin")},
            [&](const QStringList& paths) { started = paths; finished = true; });

        QVERIFY(finished);
        QCOMPARE(started, QStringList{OUT_TRANSFER});
        QCOMPARE(transport_->callCount("SendFile"), 1);
    }

    void testShutdownStopsTracking()
    {
        transfers_->initialize();
        transfers_->shutdown();
        QVERIFY(!transfers_->isInitialized());

        QSignalSpy incoming(transfers_, &bcore::TransferManager::incomingTransfer);
        transport_->addObject(IN_TRANSFER, bcore::OBEX_TRANSFER_INTERFACE, {{"Status", "queued"}});
        QCOMPARE(incoming.count(), 0);
    }

private:
    QTemporaryDir dir_;
    QString file_;
    FakeBluezTransport* transport_ = nullptr;
    bcore::TransferManager* transfers_ = nullptr;
};

QTEST_MAIN(TestTransferManager)
#include "test_transfer_manager.moc"
