#include "BluetoothController.hpp"
#include "AdapterManager.hpp"
#include "AgentManager.hpp"
#include "AudioManager.hpp"
#include "DeviceManager.hpp"
#include "ErrorHandler.hpp"
#include "IBluezTransport.hpp"
#include "core/services/IAuthorizationPolicy.hpp"
#include "core/services/IConfigService.hpp"
#include "core/services/INotificationService.hpp"
#include <QDebug>
#include <QPointer>

namespace bcore {

namespace {

QString adapterName(const QString& adapterPath)
{
    return adapterPath.section(QLatin1Char('/'), -1);
}

} // namespace

BluetoothController::BluetoothController(IBluezTransport* transport, IAuthorizationPolicy* policy,
                                         IConfigService* config, INotificationService* notifications,
                                         QObject* parent)
    : QObject(parent)
    , transport_(transport)
    , policy_(policy)
    , config_(config)
    , notifications_(notifications)
{
    transport_->setParent(this);

    errorHandler_ = new ErrorHandler(this);
    adapters_ = new AdapterManager(transport_, this);
    devices_ = new DeviceManager(transport_, adapters_, this);
    agent_ = new AgentManager(transport_, this);
    audio_ = new AudioManager(transport_, devices_, this);
    transfers_ = new TransferManager(transport_, this);

    autoDiscoveryTimer_.setSingleShot(true);
    connect(&autoDiscoveryTimer_, &QTimer::timeout, this, &BluetoothController::stopAutoDiscovery);
}

BluetoothController::~BluetoothController()
{
    // Managers unsubscribe from the transport's event bus, so they go before it
    delete transfers_;
    delete audio_;
    delete agent_;
    delete devices_;
    delete adapters_;
}

void BluetoothController::initialize()
{
    if (initialized_) {
        qWarning() << "[BtController] Already initialized";
        return;
    }

    qInfo() << "[BtController] Initializing";
    applyConfiguration();

    // Signals first so events raised by the initial scans reach the UI
    connectManagerSignals();

    adapters_->initialize();
    devices_->initialize();
    audio_->initialize();
    transfers_->initialize();

    connect(transport_, &IBluezTransport::connectionStateChanged,
            this, &BluetoothController::onTransportConnectionChanged);
    connect(transport_, &IBluezTransport::transportError, this, [this](const QString& message) {
        BluetoothError error = BluetoothError::serviceUnavailable();
        error.details = message;
        errorHandler_->report(error);
    });

    initialized_ = true;

    if (transport_->isConnected())
        onTransportConnectionChanged(true);
    else
        transport_->start();
}

void BluetoothController::shutdown()
{
    if (!initialized_) return;

    qInfo() << "[BtController] Shutting down";
    autoDiscoveryTimer_.stop();
    autoDiscoveryPaths_.clear();

    if (config_)
        config_->save();

    agent_->shutdown();
    transfers_->shutdown();
    audio_->shutdown();
    devices_->shutdown();
    disconnect(transport_, nullptr, this, nullptr);
    transport_->stop();

    initialized_ = false;
    agentStarted_ = false;
}

void BluetoothController::applyConfiguration()
{
    agent_->setCapability(configValue(QStringLiteral("bluetooth.agent_capability"),
                                      QStringLiteral("KeyboardDisplay")).toString());
    agent_->setResponseTimeout(configValue(QStringLiteral("bluetooth.pairing_timeout_ms"),
                                           AgentManager::DefaultResponseTimeoutMs).toInt());
    devices_->setRssiRefreshInterval(configValue(QStringLiteral("bluetooth.rssi_refresh_ms"),
                                                 DeviceManager::DefaultRssiRefreshMs).toInt());
}

void BluetoothController::connectManagerSignals()
{
    // Adapters
    connect(adapters_, &AdapterManager::adapterAdded, this, &BluetoothController::onAdapterAdded);
    connect(adapters_, &AdapterManager::adapterRemoved, this, &BluetoothController::adapterRemoved);
    connect(adapters_, &AdapterManager::adapterStateChanged, this, &BluetoothController::adapterStateChanged);

    // Devices
    connect(devices_, &DeviceManager::deviceFound, this, &BluetoothController::deviceFound);
    connect(devices_, &DeviceManager::deviceRemoved, this, [this](const QString& path) {
        // Nothing left to act on once the device is gone
        if (notifications_) notifications_->dismissForDevice(path);
        emit deviceRemoved(path);
    });
    connect(devices_, &DeviceManager::devicePropertiesChanged, this,
            [this](const BluetoothDevice& device, const QStringList&) { emit deviceChanged(device); });
    connect(devices_, &DeviceManager::deviceConnected, this, [this](const QString& path) {
        const BluetoothDevice device = devices_->device(path);
        emit deviceConnected(device);
        notify(QStringLiteral("ui.notify_on_connect"), QStringLiteral("device_connected"),
               QStringLiteral("Device Connected"),
               QStringLiteral("%1 connected").arg(device.displayName()), path);
    });
    connect(devices_, &DeviceManager::deviceDisconnected, this, [this](const QString& path) {
        const BluetoothDevice device = devices_->device(path);
        emit deviceDisconnected(device);
        notify(QStringLiteral("ui.notify_on_disconnect"), QStringLiteral("device_disconnected"),
               QStringLiteral("Device Disconnected"),
               QStringLiteral("%1 disconnected").arg(device.displayName()), path);
    });
    connect(devices_, &DeviceManager::pairingCompleted, this, [this](const QString& path, bool success) {
        emit pairingCompleted(path, success);
        const QString name = devices_->device(path).displayName();
        notify(QStringLiteral("ui.notify_on_pairing"), QStringLiteral("pairing"),
               success ? QStringLiteral("Pairing Successful") : QStringLiteral("Pairing Failed"),
               success ? QStringLiteral("Paired with %1").arg(name)
                       : QStringLiteral("Could not pair with %1").arg(name), path);
    });

    // Pairing agent
    connect(agent_, &AgentManager::pairingRequested, this, &BluetoothController::pairingRequested);
    connect(agent_, &AgentManager::pairingCompleted, this, &BluetoothController::pairingCompleted);

    // Audio
    connect(audio_, &AudioManager::profileChanged, this, &BluetoothController::audioProfileChanged);

    // Transfers
    connect(transfers_, &TransferManager::transferStarted, this, &BluetoothController::transferStarted);
    connect(transfers_, &TransferManager::incomingTransfer, this, &BluetoothController::transferStarted);
    connect(transfers_, &TransferManager::transferProgress, this, &BluetoothController::transferProgress);
    connect(transfers_, &TransferManager::transferCompleted, this, [this](const FileTransfer& transfer) {
        emit transferCompleted(transfer);
        notify(QStringLiteral("ui.notify_on_transfer"), QStringLiteral("transfer"),
               QStringLiteral("Transfer Complete"),
               QStringLiteral("%1 transferred").arg(transfer.filename), transfer.devicePath);
    });
    connect(transfers_, &TransferManager::transferFailed, this,
            [this](const FileTransfer& transfer, const BluetoothError& error) {
        emit transferFailed(transfer, error);
        if (error.code == QLatin1String("CANCELLED")) return;
        errorHandler_->report(error);
    });

    // Errors
    connect(errorHandler_, &ErrorHandler::errorOccurred, this, &BluetoothController::errorOccurred);
    connect(errorHandler_, &ErrorHandler::userNotificationRequired, this, [this](const BluetoothError& error) {
        notify(QString(), QStringLiteral("error"), error.categoryName(), error.message, {}, 10000);
    });
}

void BluetoothController::onTransportConnectionChanged(bool connected)
{
    if (!connected) {
        qInfo() << "[BtController] Bluetooth daemon unavailable";
        autoDiscoveryTimer_.stop();
        autoDiscoveryPaths_.clear();
        return;
    }

    qInfo() << "[BtController] Bluetooth daemon available";
    adapters_->scanAdapters();
    devices_->scanDevices();

    // Later reconnects are handled by the agent itself
    if (!agentStarted_) {
        agentStarted_ = true;
        agent_->registerAgent();
    }

    if (!autoDiscoveryDone_) {
        autoDiscoveryDone_ = true;
        autoStartDiscovery();
    }
}

void BluetoothController::onAdapterAdded(const BluetoothAdapter& adapter)
{
    emit adapterAdded(adapter);

    const QString stored = configValue(QStringLiteral("adapters.%1.alias").arg(adapterName(adapter.objectPath)),
                                       QString()).toString();
    if (stored.isEmpty() || stored == adapter.alias) return;

    qInfo() << "[BtController] Restoring alias" << stored << "on" << adapter.objectPath;
    adapters_->setAlias(adapter.objectPath, stored, [path = adapter.objectPath](const BluetoothError& error) {
        if (error.isValid())
            qWarning() << "[BtController] Could not restore alias on" << path << ":" << error.message;
    });
}

// --- Auto discovery ---

void BluetoothController::autoStartDiscovery()
{
    const int seconds = configValue(QStringLiteral("bluetooth.auto_discovery_seconds"), 15).toInt();
    if (seconds <= 0) return;

    for (const auto& adapter : adapters_->adapters()) {
        if (!adapter.powered || adapter.discovering) continue;
        const QString path = adapter.objectPath;
        adapters_->startDiscovery(path, [this, path, seconds](const BluetoothError& error) {
            if (error.isValid()) {
                qDebug() << "[BtController] Could not auto-start discovery on" << path << ":" << error.message;
                return;
            }
            qDebug() << "[BtController] Auto-started discovery on" << path;
            autoDiscoveryPaths_.append(path);
            if (!autoDiscoveryTimer_.isActive())
                autoDiscoveryTimer_.start(seconds * 1000);
        });
    }
}

void BluetoothController::stopAutoDiscovery()
{
    const QStringList paths = autoDiscoveryPaths_;
    autoDiscoveryPaths_.clear();
    for (const auto& path : paths) {
        adapters_->stopDiscovery(path, [path](const BluetoothError& error) {
            // The adapter may be gone or discovery already stopped
            if (error.isValid())
                qDebug() << "[BtController] Auto-discovery stop on" << path << ":" << error.message;
        });
    }
}

// --- Helpers ---

bool BluetoothController::checkInitialized(const Completion& done) const
{
    if (initialized_) return true;
    done(BluetoothError::precondition(ErrorCategory::Transport,
                                      QStringLiteral("Bluetooth controller not initialized")));
    return false;
}

Completion BluetoothController::reporting(Completion done)
{
    QPointer<ErrorHandler> handler(errorHandler_);
    return [handler, done](const BluetoothError& error) {
        if (error.isValid() && handler)
            handler->report(error);
        done(error);
    };
}

void BluetoothController::authorize(const QString& actionId, const QString& message, const QString& operation,
                                    std::function<void()> proceed, Completion done)
{
    if (!policy_) {
        proceed();
        return;
    }

    QPointer<BluetoothController> self(this);
    policy_->checkAuthorization(actionId, message,
        [self, operation, proceed, done](IAuthorizationPolicy::Decision decision) {
            if (!self) return;
            if (decision == IAuthorizationPolicy::Decision::Allowed) {
                proceed();
                return;
            }

            BluetoothError error = BluetoothError::permissionDenied(operation);
            if (decision == IAuthorizationPolicy::Decision::Cancelled) {
                error.code = QStringLiteral("AUTHORIZATION_CANCELLED");
                error.message = QStringLiteral("Authorization cancelled: %1").arg(operation);
            }
            qInfo() << "[BtController]" << operation << "not authorized:" << toString(decision);
            self->errorHandler_->report(error);
            done(error);
        });
}

QVariant BluetoothController::configValue(const QString& key, const QVariant& fallback) const
{
    if (!config_) return fallback;
    const QVariant v = config_->value(key);
    return v.isValid() ? v : fallback;
}

void BluetoothController::persistAdapterSetting(const QString& adapterPath, const QString& key, const QVariant& value)
{
    if (!config_) return;
    config_->setValue(QStringLiteral("adapters.%1.%2").arg(adapterName(adapterPath), key), value);
}

void BluetoothController::persistAddress(const QString& listKey, const QString& devicePath, bool present)
{
    if (!devices_->hasDevice(devicePath)) return;
    setAddressListed(listKey, devices_->device(devicePath).address, present);
}

void BluetoothController::setAddressListed(const QString& listKey, const QString& address, bool present)
{
    if (!config_ || address.isEmpty()) return;

    QStringList list = config_->value(listKey).toStringList();
    const bool contained = list.contains(address, Qt::CaseInsensitive);
    if (present == contained) return;
    if (present) {
        list.append(address);
    } else {
        list.removeIf([&address](const QString& entry) {
            return entry.compare(address, Qt::CaseInsensitive) == 0;
        });
    }
    config_->setValue(listKey, list);
}

void BluetoothController::notify(const QString& preference, const QString& kind, const QString& title,
                                 const QString& message, const QString& devicePath, int ttlMs)
{
    if (!notifications_) return;
    if (!configValue(QStringLiteral("ui.notifications_enabled"), true).toBool()) return;
    if (!preference.isEmpty() && !configValue(preference, true).toBool()) return;

    QVariantMap n;
    n.insert(QStringLiteral("kind"), kind);
    n.insert(QStringLiteral("title"), title);
    n.insert(QStringLiteral("message"), message);
    n.insert(QStringLiteral("devicePath"), devicePath);
    n.insert(QStringLiteral("ttlMs"), ttlMs);
    notifications_->post(n);
}

// --- Adapters ---

QList<BluetoothAdapter> BluetoothController::adapters() const
{
    return adapters_->adapters();
}

BluetoothAdapter BluetoothController::defaultAdapter() const
{
    return adapters_->defaultAdapter();
}

void BluetoothController::setAdapterPowered(const QString& adapterPath, bool powered, Completion done)
{
    if (!checkInitialized(done)) return;
    qInfo() << "[BtController] Set powered" << powered << "on" << adapterPath;
    Completion reported = reporting(std::move(done));
    authorize(ACTION_POWER, QStringLiteral("Change Bluetooth adapter power state"),
              QStringLiteral("Set adapter power"),
              [this, adapterPath, powered, reported]() { adapters_->setPowered(adapterPath, powered, reported); },
              reported);
}

void BluetoothController::setAdapterDiscoverable(const QString& adapterPath, bool discoverable, uint32_t timeout,
                                                 Completion done)
{
    if (!checkInitialized(done)) return;
    Completion reported = reporting(std::move(done));
    authorize(ACTION_CONFIGURE, QStringLiteral("Change Bluetooth adapter visibility"),
              QStringLiteral("Set adapter discoverable"),
              [this, adapterPath, discoverable, timeout, reported]() {
                  adapters_->setDiscoverable(adapterPath, discoverable, timeout,
                      [this, adapterPath, timeout, reported](const BluetoothError& error) {
                          if (!error.isValid() && timeout > 0)
                              persistAdapterSetting(adapterPath, QStringLiteral("discoverable_timeout"),
                                                    static_cast<int>(timeout));
                          reported(error);
                      });
              },
              reported);
}

void BluetoothController::setAdapterPairable(const QString& adapterPath, bool pairable, uint32_t timeout,
                                             Completion done)
{
    if (!checkInitialized(done)) return;
    Completion reported = reporting(std::move(done));
    authorize(ACTION_CONFIGURE, QStringLiteral("Change Bluetooth adapter pairing mode"),
              QStringLiteral("Set adapter pairable"),
              [this, adapterPath, pairable, timeout, reported]() {
                  adapters_->setPairable(adapterPath, pairable, timeout,
                      [this, adapterPath, timeout, reported](const BluetoothError& error) {
                          if (!error.isValid() && timeout > 0)
                              persistAdapterSetting(adapterPath, QStringLiteral("pairable_timeout"),
                                                    static_cast<int>(timeout));
                          reported(error);
                      });
              },
              reported);
}

void BluetoothController::setAdapterAlias(const QString& adapterPath, const QString& alias, Completion done)
{
    if (!checkInitialized(done)) return;
    Completion reported = reporting(std::move(done));
    authorize(ACTION_CONFIGURE, QStringLiteral("Rename Bluetooth adapter"),
              QStringLiteral("Set adapter alias"),
              [this, adapterPath, alias, reported]() {
                  adapters_->setAlias(adapterPath, alias,
                      [this, adapterPath, alias, reported](const BluetoothError& error) {
                          if (!error.isValid())
                              persistAdapterSetting(adapterPath, QStringLiteral("alias"), alias);
                          reported(error);
                      });
              },
              reported);
}

void BluetoothController::startDiscovery(const QString& adapterPath, Completion done)
{
    if (!checkInitialized(done)) return;
    // A manual scan outlives the automatic one
    autoDiscoveryPaths_.removeAll(adapterPath);
    devices_->startDiscovery(adapterPath, reporting(std::move(done)));
}

void BluetoothController::stopDiscovery(const QString& adapterPath, Completion done)
{
    if (!checkInitialized(done)) return;
    autoDiscoveryPaths_.removeAll(adapterPath);
    devices_->stopDiscovery(adapterPath, reporting(std::move(done)));
}

// --- Devices ---

QList<BluetoothDevice> BluetoothController::devices(const QString& adapterPath) const
{
    return adapterPath.isEmpty() ? devices_->devices() : devices_->devicesForAdapter(adapterPath);
}

QList<BluetoothDevice> BluetoothController::connectedDevices() const
{
    return devices_->connectedDevices();
}

QList<BluetoothDevice> BluetoothController::pairedDevices() const
{
    return devices_->pairedDevices();
}

BluetoothDevice BluetoothController::device(const QString& devicePath) const
{
    return devices_->device(devicePath);
}

void BluetoothController::pairDevice(const QString& devicePath, Completion done)
{
    if (!checkInitialized(done)) return;
    Completion reported = reporting(std::move(done));
    authorize(ACTION_PAIR, QStringLiteral("Pair with Bluetooth device"), QStringLiteral("Pair device"),
              [this, devicePath, reported]() {
                  devices_->pair(devicePath, [this, devicePath, reported](const BluetoothError& error) {
                      if (!error.isValid())
                          persistAddress(QStringLiteral("devices.trusted"), devicePath, true);
                      reported(error);
                  });
              },
              reported);
}

void BluetoothController::unpairDevice(const QString& devicePath, Completion done)
{
    if (!checkInitialized(done)) return;
    // The device object is gone by the time RemoveDevice succeeds
    const QString address = devices_->device(devicePath).address;
    Completion reported = reporting(std::move(done));
    devices_->unpair(devicePath, [this, address, reported](const BluetoothError& error) {
        if (!error.isValid())
            setAddressListed(QStringLiteral("devices.trusted"), address, false);
        reported(error);
    });
}

void BluetoothController::connectDevice(const QString& devicePath, Completion done)
{
    if (!checkInitialized(done)) return;
    devices_->connectDevice(devicePath, reporting(std::move(done)));
}

void BluetoothController::disconnectDevice(const QString& devicePath, Completion done)
{
    if (!checkInitialized(done)) return;
    devices_->disconnectDevice(devicePath, reporting(std::move(done)));
}

void BluetoothController::trustDevice(const QString& devicePath, bool trusted, Completion done)
{
    if (!checkInitialized(done)) return;
    Completion reported = reporting(std::move(done));
    devices_->setTrusted(devicePath, trusted, [this, devicePath, trusted, reported](const BluetoothError& error) {
        if (!error.isValid())
            persistAddress(QStringLiteral("devices.trusted"), devicePath, trusted);
        reported(error);
    });
}

void BluetoothController::blockDevice(const QString& devicePath, bool blocked, Completion done)
{
    if (!checkInitialized(done)) return;
    Completion reported = reporting(std::move(done));
    devices_->setBlocked(devicePath, blocked, [this, devicePath, blocked, reported](const BluetoothError& error) {
        if (!error.isValid())
            persistAddress(QStringLiteral("devices.blocked"), devicePath, blocked);
        reported(error);
    });
}

// --- Audio ---

QList<AudioProfile> BluetoothController::audioProfiles(const QString& devicePath) const
{
    return audio_->profiles(devicePath);
}

bool BluetoothController::isAudioDevice(const QString& devicePath) const
{
    return audio_->hasAudioProfiles(devicePath);
}

void BluetoothController::setAudioProfile(const QString& devicePath, const QString& uuid, Completion done)
{
    if (!checkInitialized(done)) return;
    audio_->setActiveProfile(devicePath, uuid, reporting(std::move(done)));
}

// --- Transfers ---

void BluetoothController::sendFile(const QString& devicePath, const QString& localPath,
                                   TransferManager::SendHandler done)
{
    QPointer<ErrorHandler> handler(errorHandler_);
    transfers_->sendFile(devicePath, localPath,
        [handler, done](const QString& transferPath, const BluetoothError& error) {
            if (error.isValid() && handler)
                handler->report(error);
            done(transferPath, error);
        });
}

void BluetoothController::sendFiles(const QString& devicePath, const QStringList& localPaths,
                                    TransferManager::SendManyHandler done)
{
    transfers_->sendFiles(devicePath, localPaths, std::move(done));
}

void BluetoothController::cancelTransfer(const QString& transferPath, Completion done)
{
    transfers_->cancelTransfer(transferPath, reporting(std::move(done)));
}

void BluetoothController::pauseTransfer(const QString& transferPath, Completion done)
{
    transfers_->pauseTransfer(transferPath, reporting(std::move(done)));
}

void BluetoothController::resumeTransfer(const QString& transferPath, Completion done)
{
    transfers_->resumeTransfer(transferPath, reporting(std::move(done)));
}

void BluetoothController::acceptTransfer(const QString& transferPath, const QString& savePath, Completion done)
{
    transfers_->acceptTransfer(transferPath, savePath, reporting(std::move(done)));
}

void BluetoothController::rejectTransfer(const QString& transferPath, Completion done)
{
    transfers_->rejectTransfer(transferPath, reporting(std::move(done)));
}

QList<FileTransfer> BluetoothController::activeTransfers() const
{
    return transfers_->activeTransfers();
}

// --- Pairing responses ---

void BluetoothController::providePinCode(const QString& pinCode)
{
    agent_->providePinCode(pinCode);
}

void BluetoothController::providePasskey(uint32_t passkey)
{
    agent_->providePasskey(passkey);
}

void BluetoothController::confirmPairing(bool confirmed)
{
    agent_->confirm(confirmed);
}

void BluetoothController::authorizeService(bool authorized)
{
    agent_->authorize(authorized);
}

void BluetoothController::cancelPairing()
{
    agent_->cancel();
}

} // namespace bcore
