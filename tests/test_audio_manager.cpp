#include <QTest>
#include <QSignalSpy>
#include "FakeBluezTransport.hpp"
#include "core/bluetooth/AudioManager.hpp"
#include "core/bluetooth/DeviceManager.hpp"

using bcore::AudioProfileType;
using bcore::BluetoothError;

namespace {

const QString HEADSET = QStringLiteral("/org/bluez/hci0/dev_11_22_33_44_55_66");
const QString KEYBOARD = QStringLiteral("/org/bluez/hci0/dev_22_22_22_22_22_22");

struct Result {
    bool called = false;
    BluetoothError error;
    bcore::Completion completion()
    {
        return [this](const BluetoothError& e) { called = true; error = e; };
    }
};

} // namespace

class TestAudioManager : public QObject {
    Q_OBJECT
private slots:
    void init()
    {
        transport_ = new FakeBluezTransport;
        transport_->addObject(HEADSET, bcore::DEVICE_INTERFACE, {
            {"Address", "11:22:33:44:55:66"},
            {"Alias", "Headset"},
            {"Connected", false},
            {"UUIDs", QStringList{bcore::AVRCP_UUID, bcore::HFP_UUID, bcore::A2DP_SINK_UUID}},
        }, false);
        transport_->addObject(KEYBOARD, bcore::DEVICE_INTERFACE, {
            {"Address", "22:22:22:22:22:22"},
            {"UUIDs", QStringList{bcore::HID_UUID}},
        }, false);
        devices_ = new bcore::DeviceManager(transport_, nullptr);
        devices_->initialize();
        audio_ = new bcore::AudioManager(transport_, devices_);
        audio_->initialize();
    }

    void cleanup()
    {
        delete audio_;
        delete devices_;
        delete transport_;
    }

    void testProfileDetection()
    {
        QVERIFY(audio_->hasAudioProfiles(HEADSET));
        QVERIFY(!audio_->hasAudioProfiles(KEYBOARD));

        auto profiles = audio_->profiles(HEADSET);
        QCOMPARE(profiles.size(), 3);
        QCOMPARE(profiles[0].type, AudioProfileType::Avrcp);
        QCOMPARE(profiles[0].name, QString("Remote Control"));
        QCOMPARE(profiles[1].type, AudioProfileType::Hfp);
        QCOMPARE(profiles[2].type, AudioProfileType::A2dpSink);
    }

    void testPrimaryProfilePriority()
    {
        QCOMPARE(audio_->primaryProfile(HEADSET), bcore::A2DP_SINK_UUID);
        QVERIFY(audio_->primaryProfile(KEYBOARD).isEmpty());
    }

    void testProfileForUuid()
    {
        QCOMPARE(bcore::AudioManager::profileForUuid(bcore::A2DP_SOURCE_UUID.toUpper()).type,
                 AudioProfileType::A2dpSource);
        QCOMPARE(bcore::AudioManager::profileForUuid(bcore::HSP_UUID).name, QString("Headset"));
        QCOMPARE(bcore::AudioManager::profileForUuid(bcore::HID_UUID).type, AudioProfileType::Unknown);
    }

    void testNewDeviceDetected()
    {
        const QString speaker = "/org/bluez/hci0/dev_33_33_33_33_33_33";
        QSignalSpy changed(audio_, &bcore::AudioManager::profilesChanged);
        transport_->addObject(speaker, bcore::DEVICE_INTERFACE, {
            {"Address", "33:33:33:33:33:33"},
            {"UUIDs", QStringList{bcore::A2DP_SINK_UUID}},
        });
        QCOMPARE(changed.count(), 1);
        QVERIFY(audio_->hasAudioProfiles(speaker));

        transport_->removeObject(speaker, bcore::DEVICE_INTERFACE);
        QVERIFY(!audio_->hasAudioProfiles(speaker));
    }

    void testUuidChangeRedetects()
    {
        transport_->changeProperties(KEYBOARD, bcore::DEVICE_INTERFACE,
                                     {{"UUIDs", QStringList{bcore::HID_UUID, bcore::HSP_UUID}}});
        QVERIFY(audio_->hasAudioProfiles(KEYBOARD));
        QCOMPARE(audio_->primaryProfile(KEYBOARD), bcore::HSP_UUID);
    }

    void testConnectionTracking()
    {
        QSignalSpy connected(audio_, &bcore::AudioManager::audioDeviceConnected);
        QSignalSpy disconnected(audio_, &bcore::AudioManager::audioDeviceDisconnected);

        transport_->changeProperties(HEADSET, bcore::DEVICE_INTERFACE, {{"Connected", true}});
        QCOMPARE(connected.count(), 1);
        QCOMPARE(connected.first().at(1).toString(), bcore::A2DP_SINK_UUID);
        QCOMPARE(audio_->connectedAudioDeviceCount(), 1);
        QVERIFY(audio_->isAudioDeviceConnected(HEADSET));

        // Non-audio devices are ignored
        transport_->changeProperties(KEYBOARD, bcore::DEVICE_INTERFACE, {{"Connected", true}});
        QCOMPARE(connected.count(), 1);

        transport_->changeProperties(HEADSET, bcore::DEVICE_INTERFACE, {{"Connected", false}});
        QCOMPARE(disconnected.count(), 1);
        QCOMPARE(audio_->connectedAudioDeviceCount(), 0);
    }

    void testDeviceAppearingConnectedIsTracked()
    {
        QSignalSpy connected(audio_, &bcore::AudioManager::audioDeviceConnected);
        QSignalSpy disconnected(audio_, &bcore::AudioManager::audioDeviceDisconnected);

        // The daemon restarts while the headset stays connected
        transport_->removeObject(HEADSET, bcore::DEVICE_INTERFACE);
        transport_->addObject(HEADSET, bcore::DEVICE_INTERFACE, {
            {"Address", "11:22:33:44:55:66"},
            {"Connected", true},
            {"UUIDs", QStringList{bcore::A2DP_SINK_UUID}},
        });

        QVERIFY(audio_->isAudioDeviceConnected(HEADSET));
        QCOMPARE(connected.count(), 1);
        QCOMPARE(connected.first().at(1).toString(), bcore::A2DP_SINK_UUID);

        Result result;
        audio_->connectProfile(HEADSET, bcore::A2DP_SINK_UUID, result.completion());
        QVERIFY(audio_->profiles(HEADSET)[0].connected);

        transport_->changeProperties(HEADSET, bcore::DEVICE_INTERFACE, {{"Connected", false}});
        QCOMPARE(disconnected.count(), 1);
        QVERIFY(!audio_->profiles(HEADSET)[0].connected);
    }

    void testConnectProfile()
    {
        QSignalSpy changed(audio_, &bcore::AudioManager::profileChanged);
        Result result;
        audio_->connectProfile(HEADSET, bcore::HFP_UUID, result.completion());

        QVERIFY(!result.error.isValid());
        auto call = transport_->lastCall("ConnectProfile");
        QCOMPARE(call.path, HEADSET);
        QCOMPARE(call.args.first().toString(), bcore::HFP_UUID);
        QCOMPARE(changed.count(), 1);
        QVERIFY(audio_->profiles(HEADSET)[1].connected);

        Result off;
        audio_->disconnectProfile(HEADSET, bcore::HFP_UUID, off.completion());
        QVERIFY(!off.error.isValid());
        QVERIFY(!audio_->profiles(HEADSET)[1].connected);
    }

    void testUnsupportedProfile()
    {
        Result result;
        audio_->connectProfile(HEADSET, bcore::HSP_UUID, result.completion());
        QCOMPARE(result.error.code, QString("INVALID_ARGUMENT"));
        QCOMPARE(transport_->callCount("ConnectProfile"), 0);

        Result none;
        audio_->connectProfile(KEYBOARD, bcore::HSP_UUID, none.completion());
        QCOMPARE(none.error.code, QString("NOT_FOUND"));
    }

    void testConnectProfileFailure()
    {
        transport_->methodErrors.insert("ConnectProfile",
            FakeBluezTransport::makeError("org.bluez.Error.NotAvailable", "Not Available"));
        Result result;
        audio_->connectProfile(HEADSET, bcore::A2DP_SINK_UUID, result.completion());
        QVERIFY(result.error.isValid());
        QVERIFY(result.error.message.startsWith("Profile connection failed"));
        QVERIFY(!audio_->profiles(HEADSET)[2].connected);
    }

    void testSetActiveProfileToleratesConnectError()
    {
        transport_->methodErrors.insert("ConnectProfile",
            FakeBluezTransport::makeError("org.bluez.Error.AlreadyConnected", "Already Connected"));
        Result result;
        audio_->setActiveProfile(HEADSET, bcore::A2DP_SINK_UUID, result.completion());
        QVERIFY(result.called);
        QVERIFY(!result.error.isValid());
        QVERIFY(audio_->profiles(HEADSET)[2].connected);

        Result invalid;
        audio_->setActiveProfile(HEADSET, bcore::HSP_UUID, invalid.completion());
        QCOMPARE(invalid.error.code, QString("INVALID_ARGUMENT"));
    }

    void testSetActiveProfilePropagatesOtherErrors()
    {
        QSignalSpy changed(audio_, &bcore::AudioManager::profileChanged);
        transport_->methodErrors.insert("ConnectProfile",
            FakeBluezTransport::makeError("org.bluez.Error.NotAvailable", "Not Available"));

        Result result;
        audio_->setActiveProfile(HEADSET, bcore::HFP_UUID, result.completion());
        QVERIFY(result.error.isValid());
        QCOMPARE(result.error.code, QString("NOTAVAILABLE"));
        QVERIFY(!audio_->profiles(HEADSET)[1].connected);
        QCOMPARE(changed.count(), 0);
    }

private:
    FakeBluezTransport* transport_ = nullptr;
    bcore::DeviceManager* devices_ = nullptr;
    bcore::AudioManager* audio_ = nullptr;
};

QTEST_MAIN(TestAudioManager)
#include "test_audio_manager.moc"
