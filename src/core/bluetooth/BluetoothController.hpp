#pragma once

#include "BluetoothError.hpp"
#include "BluetoothTypes.hpp"
#include "TransferManager.hpp"
#include <QList>
#include <QObject>
#include <QStringList>
#include <QTimer>
#include <functional>

namespace bcore {

class AdapterManager;
class AgentManager;
class AudioManager;
class DeviceManager;
class ErrorHandler;
class IAuthorizationPolicy;
class IBluezTransport;
class IConfigService;
class INotificationService;

/// Composition root of the Bluetooth core. Owns the transport and every
/// manager, re-emits their events for the UI layer, gates privileged
/// operations behind the authorization policy and keeps the persisted
/// preferences (trusted/blocked devices, adapter aliases) in step.
///
/// Every failure passed to a completion is also reported to errorHandler().
class BluetoothController : public QObject {
    Q_OBJECT
public:
    /// Takes ownership of @p transport. The policy, config and notification
    /// collaborators are borrowed and may be null (no gate, defaults, silent).
    BluetoothController(IBluezTransport* transport, IAuthorizationPolicy* policy,
                        IConfigService* config, INotificationService* notifications = nullptr,
                        QObject* parent = nullptr);
    ~BluetoothController() override;

    void initialize();
    void shutdown();
    bool isInitialized() const { return initialized_; }

    // Adapters
    QList<BluetoothAdapter> adapters() const;
    BluetoothAdapter defaultAdapter() const;
    void setAdapterPowered(const QString& adapterPath, bool powered, Completion done);
    void setAdapterDiscoverable(const QString& adapterPath, bool discoverable, uint32_t timeout, Completion done);
    void setAdapterPairable(const QString& adapterPath, bool pairable, uint32_t timeout, Completion done);
    void setAdapterAlias(const QString& adapterPath, const QString& alias, Completion done);
    void startDiscovery(const QString& adapterPath, Completion done);
    void stopDiscovery(const QString& adapterPath, Completion done);

    // Devices
    QList<BluetoothDevice> devices(const QString& adapterPath = {}) const;
    QList<BluetoothDevice> connectedDevices() const;
    QList<BluetoothDevice> pairedDevices() const;
    BluetoothDevice device(const QString& devicePath) const;
    void pairDevice(const QString& devicePath, Completion done);
    void unpairDevice(const QString& devicePath, Completion done);
    void connectDevice(const QString& devicePath, Completion done);
    void disconnectDevice(const QString& devicePath, Completion done);
    void trustDevice(const QString& devicePath, bool trusted, Completion done);
    void blockDevice(const QString& devicePath, bool blocked, Completion done);

    // Audio
    QList<AudioProfile> audioProfiles(const QString& devicePath) const;
    bool isAudioDevice(const QString& devicePath) const;
    void setAudioProfile(const QString& devicePath, const QString& uuid, Completion done);

    // Transfers
    void sendFile(const QString& devicePath, const QString& localPath, TransferManager::SendHandler done);
    void sendFiles(const QString& devicePath, const QStringList& localPaths, TransferManager::SendManyHandler done);
    void cancelTransfer(const QString& transferPath, Completion done);
    void pauseTransfer(const QString& transferPath, Completion done);
    void resumeTransfer(const QString& transferPath, Completion done);
    void acceptTransfer(const QString& transferPath, const QString& savePath, Completion done);
    void rejectTransfer(const QString& transferPath, Completion done);
    QList<FileTransfer> activeTransfers() const;

    // Pairing responses
    void providePinCode(const QString& pinCode);
    void providePasskey(uint32_t passkey);
    void confirmPairing(bool confirmed);
    void authorizeService(bool authorized);
    void cancelPairing();

    IBluezTransport* transport() const { return transport_; }
    ErrorHandler* errorHandler() const { return errorHandler_; }
    AdapterManager* adapterManager() const { return adapters_; }
    DeviceManager* deviceManager() const { return devices_; }
    AgentManager* agentManager() const { return agent_; }
    AudioManager* audioManager() const { return audio_; }
    TransferManager* transferManager() const { return transfers_; }

signals:
    void adapterAdded(const bcore::BluetoothAdapter& adapter);
    void adapterRemoved(const QString& adapterPath);
    void adapterStateChanged(const bcore::BluetoothAdapter& adapter);
    void deviceFound(const bcore::BluetoothDevice& device);
    void deviceRemoved(const QString& devicePath);
    void deviceChanged(const bcore::BluetoothDevice& device);
    void deviceConnected(const bcore::BluetoothDevice& device);
    void deviceDisconnected(const bcore::BluetoothDevice& device);
    void pairingRequested(const bcore::PairingRequest& request);
    void pairingCompleted(const QString& devicePath, bool success);
    void audioProfileChanged(const QString& devicePath, const QString& uuid);
    void transferStarted(const bcore::FileTransfer& transfer);
    void transferProgress(const bcore::FileTransfer& transfer);
    void transferCompleted(const bcore::FileTransfer& transfer);
    void transferFailed(const bcore::FileTransfer& transfer, const bcore::BluetoothError& error);
    void errorOccurred(const bcore::BluetoothError& error);

private:
    void connectManagerSignals();
    void applyConfiguration();
    void onTransportConnectionChanged(bool connected);
    void onAdapterAdded(const BluetoothAdapter& adapter);
    void autoStartDiscovery();
    void stopAutoDiscovery();

    /// Runs @p proceed once @p actionId is allowed; otherwise fails @p done with a Permission error.
    void authorize(const QString& actionId, const QString& message, const QString& operation,
                   std::function<void()> proceed, Completion done);
    bool checkInitialized(const Completion& done) const;

    /// Wraps @p done so failures are also recorded by the error handler.
    Completion reporting(Completion done);

    QVariant configValue(const QString& key, const QVariant& fallback) const;
    void persistAdapterSetting(const QString& adapterPath, const QString& key, const QVariant& value);
    void persistAddress(const QString& listKey, const QString& devicePath, bool present);
    void setAddressListed(const QString& listKey, const QString& address, bool present);
    void notify(const QString& preference, const QString& kind, const QString& title,
                const QString& message, const QString& devicePath = {}, int ttlMs = 5000);

    IBluezTransport* transport_;
    IAuthorizationPolicy* policy_;
    IConfigService* config_;
    INotificationService* notifications_;

    ErrorHandler* errorHandler_;
    AdapterManager* adapters_;
    DeviceManager* devices_;
    AgentManager* agent_;
    AudioManager* audio_;
    TransferManager* transfers_;

    bool initialized_ = false;
    bool agentStarted_ = false;
    bool autoDiscoveryDone_ = false;
    QStringList autoDiscoveryPaths_;
    QTimer autoDiscoveryTimer_;
};

} // namespace bcore
