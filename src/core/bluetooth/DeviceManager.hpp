#pragma once

#include "BluetoothError.hpp"
#include "BluetoothTypes.hpp"
#include <QHash>
#include <QList>
#include <QObject>
#include <QSet>
#include <QTimer>

namespace bcore {

class AdapterManager;
class IBluezTransport;
struct ObjectEvent;

/// Tracks remote devices of every adapter and drives pairing, connection and
/// trust state against the daemon.
class DeviceManager : public QObject {
    Q_OBJECT
public:
    static constexpr int ConnectTimeoutMs = 30000;
    static constexpr int DisconnectTimeoutMs = 10000;
    static constexpr int PairTimeoutMs = 60000;
    static constexpr int DefaultRssiRefreshMs = 30000;

    DeviceManager(IBluezTransport* transport, AdapterManager* adapters, QObject* parent = nullptr);
    ~DeviceManager() override;

    void initialize();
    void shutdown();

    /// Loads devices from the transport's object cache. An empty path scans every adapter.
    void scanDevices(const QString& adapterPath = {});

    void startDiscovery(const QString& adapterPath, Completion done);
    void stopDiscovery(const QString& adapterPath, Completion done);

    void pair(const QString& devicePath, Completion done);
    void unpair(const QString& devicePath, Completion done);
    void connectDevice(const QString& devicePath, Completion done);
    void disconnectDevice(const QString& devicePath, Completion done);
    void setTrusted(const QString& devicePath, bool trusted, Completion done);
    void setBlocked(const QString& devicePath, bool blocked, Completion done);

    QList<BluetoothDevice> devices() const;
    QList<BluetoothDevice> devicesForAdapter(const QString& adapterPath) const;
    QList<BluetoothDevice> connectedDevices() const;
    QList<BluetoothDevice> pairedDevices() const;
    bool hasDevice(const QString& devicePath) const { return devices_.contains(devicePath); }
    BluetoothDevice device(const QString& devicePath) const { return devices_.value(devicePath); }
    QString devicePathForAddress(const QString& address) const;

    bool isTrusted(const QString& devicePath) const { return trusted_.contains(devicePath); }
    bool isBlocked(const QString& devicePath) const { return blocked_.contains(devicePath); }
    QStringList trustedDevices() const;
    QStringList blockedDevices() const;

    void setRssiRefreshInterval(int ms);
    int rssiRefreshInterval() const { return rssiTimer_.interval(); }

    /// Re-reads the signal level of every connected device.
    void refreshSignalStrength();

signals:
    void deviceFound(const bcore::BluetoothDevice& device);
    void deviceRemoved(const QString& devicePath);
    void devicePropertiesChanged(const bcore::BluetoothDevice& device, const QStringList& changed);
    void connectionStateChanged(const QString& devicePath, bcore::ConnectionState state);
    void deviceConnected(const QString& devicePath);
    void deviceDisconnected(const QString& devicePath);
    void pairingCompleted(const QString& devicePath, bool success);

private:
    void onDeviceEvent(const ObjectEvent& event);
    void materialize(const QString& path, const QVariantMap& properties);
    void removeDevice(const QString& path);
    void applyChanges(const QString& path, const QVariantMap& changed, const QStringList& invalidated);
    void setConnectionState(BluetoothDevice& device, ConnectionState state);
    void moveToConnected(BluetoothDevice& device);
    void updateIndexes(const BluetoothDevice& device);
    void updateAdapterCounts(const QString& adapterPath);
    void writeFlag(const QString& devicePath, const QString& property, bool value, Completion done);
    BluetoothError checkDevice(const QString& devicePath) const;

    IBluezTransport* transport_;
    AdapterManager* adapters_;
    int subscriptionId_ = 0;
    QHash<QString, BluetoothDevice> devices_;
    QSet<QString> trusted_;
    QSet<QString> blocked_;
    QTimer rssiTimer_;
};

} // namespace bcore
