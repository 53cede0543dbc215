#pragma once

#include <QDateTime>
#include <QString>
#include <QStringList>
#include <QVariantMap>
#include <cstdint>

namespace bcore {

// BlueZ well-known names
inline const QString BLUEZ_SERVICE = QStringLiteral("org.bluez");
inline const QString OBEX_SERVICE = QStringLiteral("org.bluez.obex");
inline const QString ADAPTER_INTERFACE = QStringLiteral("org.bluez.Adapter1");
inline const QString DEVICE_INTERFACE = QStringLiteral("org.bluez.Device1");
inline const QString AGENT_INTERFACE = QStringLiteral("org.bluez.Agent1");
inline const QString AGENT_MANAGER_INTERFACE = QStringLiteral("org.bluez.AgentManager1");
inline const QString OBEX_CLIENT_INTERFACE = QStringLiteral("org.bluez.obex.Client1");
inline const QString OBEX_SESSION_INTERFACE = QStringLiteral("org.bluez.obex.Session1");
inline const QString OBEX_TRANSFER_INTERFACE = QStringLiteral("org.bluez.obex.Transfer1");
inline const QString OBEX_OBJECT_PUSH_INTERFACE = QStringLiteral("org.bluez.obex.ObjectPush1");
inline const QString PROPERTIES_INTERFACE = QStringLiteral("org.freedesktop.DBus.Properties");
inline const QString OBJECT_MANAGER_INTERFACE = QStringLiteral("org.freedesktop.DBus.ObjectManager");

// Service identifiers
inline const QString A2DP_SOURCE_UUID = QStringLiteral("0000110a-0000-1000-8000-00805f9b34fb");
inline const QString A2DP_SINK_UUID = QStringLiteral("0000110b-0000-1000-8000-00805f9b34fb");
inline const QString AVRCP_UUID = QStringLiteral("0000110e-0000-1000-8000-00805f9b34fb");
inline const QString HFP_UUID = QStringLiteral("0000111e-0000-1000-8000-00805f9b34fb");
inline const QString HSP_UUID = QStringLiteral("00001108-0000-1000-8000-00805f9b34fb");
inline const QString HID_UUID = QStringLiteral("00001124-0000-1000-8000-00805f9b34fb");
inline const QString OBEX_PUSH_UUID = QStringLiteral("00001105-0000-1000-8000-00805f9b34fb");

enum class BluetoothState {
    Off,
    On,
    Connected,
    Discovering,
    Unavailable
};

enum class DeviceCategory {
    Audio,
    Input,
    Phone,
    Computer,
    Peripheral,
    Wearable,
    Unknown
};

enum class ConnectionState {
    Disconnected,
    Connecting,
    Connected,
    Disconnecting
};

enum class SignalStrength {
    Excellent,  // > -50 dBm
    Good,       // > -60 dBm
    Fair,       // > -70 dBm
    Weak,       // > -80 dBm
    VeryWeak
};

enum class AudioProfileType {
    A2dpSink,
    A2dpSource,
    Hfp,
    Hsp,
    Avrcp,
    Unknown
};

enum class TransferStatus {
    Queued,
    Active,
    Suspended,
    Complete,
    Error
};

enum class TransferDirection {
    Sending,
    Receiving
};

enum class PairingMethod {
    PinCode,
    PasskeyEntry,
    PasskeyDisplay,
    PasskeyConfirmation,
    Authorization,
    ServiceAuthorization
};

struct BluetoothAdapter {
    QString objectPath;
    QString address;
    QString alias;
    QString name;
    QString modalias;
    bool powered = false;
    bool discoverable = false;
    bool pairable = false;
    bool discovering = false;
    uint32_t discoverableTimeout = 0;
    uint32_t pairableTimeout = 0;
    QStringList uuids;

    bool isDefault = false;
    int deviceCount = 0;
    int connectedDeviceCount = 0;

    QString displayName() const;
    QString statusText() const;
};

struct BluetoothDevice {
    QString objectPath;
    QString adapterPath;
    QString address;
    QString alias;
    QString name;
    QString icon;
    QString modalias;
    uint32_t deviceClass = 0;
    uint16_t appearance = 0;
    QStringList uuids;
    bool paired = false;
    bool connected = false;
    bool trusted = false;
    bool blocked = false;
    bool servicesResolved = false;
    int16_t rssi = 0;
    int8_t txPower = 0;
    int batteryPercentage = -1;  // -1 = not reported

    DeviceCategory category = DeviceCategory::Unknown;
    ConnectionState connectionState = ConnectionState::Disconnected;
    SignalStrength signalStrength = SignalStrength::Weak;
    QDateTime lastSeen;

    QString displayName() const;
    bool hasBattery() const { return batteryPercentage >= 0; }
    bool hasAudioProfile() const;
    bool hasInputProfile() const;
    bool supportsFileTransfer() const;

    void updateSignalStrength();
    void updateConnectionState();
    void updateCategory();

    /// Applies a Device1 property map (full or partial) and refreshes the
    /// derived fields. Returns the keys that were recognised.
    QStringList applyProperties(const QVariantMap& properties);

    /// "/org/bluez/hci0/dev_AA_BB_..." -> "/org/bluez/hci0"
    static QString adapterPathFor(const QString& devicePath);
};

struct AudioProfile {
    QString uuid;
    QString name;
    AudioProfileType type = AudioProfileType::Unknown;
    bool connected = false;
    QString codec;
};

struct FileTransfer {
    QString objectPath;
    QString sessionPath;
    QString devicePath;
    QString filename;
    QString localPath;
    quint64 size = 0;
    quint64 transferred = 0;
    TransferStatus status = TransferStatus::Queued;
    TransferDirection direction = TransferDirection::Sending;
    QDateTime started = QDateTime::currentDateTime();
    QDateTime completed;

    double progressPercentage() const;
    // Average throughput since the transfer started
    quint64 bytesPerSecond() const;
    qint64 estimatedSecondsRemaining() const;

    /// Records a new byte count. Counts lower than the current one are
    /// ignored so that the transferred total never decreases.
    bool updateProgress(quint64 newTransferred);

    QString statusText() const;
    QString progressText() const;
    static QString formatTimeSpan(qint64 seconds);
    static TransferStatus parseStatus(const QString& status);
};

struct PairingRequest {
    QString devicePath;
    QString deviceName;
    PairingMethod method = PairingMethod::Authorization;
    uint32_t passkey = 0;
    bool hasPasskey = false;
    QString pinCode;
    QString serviceUuid;
    QDateTime requested = QDateTime::currentDateTime();

    QString promptText() const;
    QString dialogTitle() const;
    bool requiresUserInput() const;
};

QString toString(ConnectionState state);
QString toString(TransferStatus status);
QString toString(PairingMethod method);
QString toString(DeviceCategory category);

} // namespace bcore

Q_DECLARE_METATYPE(bcore::BluetoothAdapter)
Q_DECLARE_METATYPE(bcore::BluetoothDevice)
Q_DECLARE_METATYPE(bcore::FileTransfer)
Q_DECLARE_METATYPE(bcore::PairingRequest)
Q_DECLARE_METATYPE(bcore::ConnectionState)
