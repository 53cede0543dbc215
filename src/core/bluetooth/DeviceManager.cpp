#include "DeviceManager.hpp"
#include "AdapterManager.hpp"
#include "ErrorClassifier.hpp"
#include "IBluezTransport.hpp"
#include <QDBusObjectPath>
#include <QDebug>
#include <algorithm>
#include <utility>

namespace bcore {

namespace {

QList<BluetoothDevice> sortedByPath(QList<BluetoothDevice> list)
{
    std::sort(list.begin(), list.end(), [](const BluetoothDevice& a, const BluetoothDevice& b) {
        return a.objectPath < b.objectPath;
    });
    return list;
}

} // namespace

DeviceManager::DeviceManager(IBluezTransport* transport, AdapterManager* adapters, QObject* parent)
    : QObject(parent)
    , transport_(transport)
    , adapters_(adapters)
{
    rssiTimer_.setInterval(DefaultRssiRefreshMs);
    connect(&rssiTimer_, &QTimer::timeout, this, &DeviceManager::refreshSignalStrength);
}

DeviceManager::~DeviceManager()
{
    if (subscriptionId_)
        transport_->events().unsubscribe(subscriptionId_);
}

void DeviceManager::initialize()
{
    if (!subscriptionId_) {
        subscriptionId_ = transport_->events().subscribe(DEVICE_INTERFACE,
            [this](const ObjectEvent& event) { onDeviceEvent(event); });
    }
    scanDevices();
    rssiTimer_.start();
}

void DeviceManager::shutdown()
{
    rssiTimer_.stop();
}

void DeviceManager::setRssiRefreshInterval(int ms)
{
    rssiTimer_.setInterval(ms);
}

void DeviceManager::scanDevices(const QString& adapterPath)
{
    const QStringList paths = transport_->objectsWithInterface(DEVICE_INTERFACE);
    for (const auto& path : paths) {
        if (!adapterPath.isEmpty() && BluetoothDevice::adapterPathFor(path) != adapterPath)
            continue;

        const QVariantMap props = transport_->cachedProperties(path, DEVICE_INTERFACE);
        if (!props.isEmpty()) {
            materialize(path, props);
            continue;
        }
        transport_->getAllProperties(path, DEVICE_INTERFACE,
            [this, path](const QVariantMap& fetched, const QDBusError& error) {
                if (error.isValid()) {
                    qWarning() << "[DeviceMgr] Failed to load" << path << ":" << error.message();
                    return;
                }
                materialize(path, fetched);
            });
    }
    qInfo() << "[DeviceMgr] Known devices:" << devices_.size();
}

// --- Events ---

void DeviceManager::onDeviceEvent(const ObjectEvent& event)
{
    switch (event.kind) {
    case ObjectEvent::Kind::ObjectAdded:
        materialize(event.path, event.changed);
        break;
    case ObjectEvent::Kind::ObjectRemoved:
        removeDevice(event.path);
        break;
    case ObjectEvent::Kind::PropertiesChanged:
        applyChanges(event.path, event.changed, event.invalidated);
        break;
    }
}

void DeviceManager::materialize(const QString& path, const QVariantMap& properties)
{
    if (devices_.contains(path)) {
        applyChanges(path, properties, {});
        return;
    }

    BluetoothDevice device;
    device.objectPath = path;
    device.adapterPath = BluetoothDevice::adapterPathFor(path);
    device.applyProperties(properties);

    devices_.insert(path, device);
    updateIndexes(device);
    updateAdapterCounts(device.adapterPath);

    qInfo() << "[DeviceMgr] Device found:" << device.displayName() << device.address;
    emit deviceFound(device);
}

void DeviceManager::removeDevice(const QString& path)
{
    auto it = devices_.find(path);
    if (it == devices_.end()) return;

    const QString adapterPath = it->adapterPath;
    qInfo() << "[DeviceMgr] Device removed:" << it->displayName();
    devices_.erase(it);
    trusted_.remove(path);
    blocked_.remove(path);
    updateAdapterCounts(adapterPath);
    emit deviceRemoved(path);
}

void DeviceManager::applyChanges(const QString& path, const QVariantMap& changed, const QStringList& invalidated)
{
    auto it = devices_.find(path);
    if (it == devices_.end()) return;
    BluetoothDevice& device = *it;

    const bool wasConnected = device.connected;
    const ConnectionState previousState = device.connectionState;

    QStringList keys = device.applyProperties(changed);
    for (const auto& key : invalidated) {
        if (key == "RSSI") { device.rssi = 0; device.updateSignalStrength(); }
        else if (key == "BatteryPercentage") device.batteryPercentage = -1;
        else continue;
        keys.append(key);
    }
    // applyProperties derives the state from the flag; transitions are driven below
    device.connectionState = previousState;

    if (device.connected != wasConnected) {
        if (device.connected) {
            moveToConnected(device);
            emit deviceConnected(path);
        } else {
            // External drop collapses straight to Disconnected
            setConnectionState(device, ConnectionState::Disconnected);
            emit deviceDisconnected(path);
        }
        updateAdapterCounts(device.adapterPath);
    }

    updateIndexes(device);
    if (!keys.isEmpty())
        emit devicePropertiesChanged(device, keys);
}

void DeviceManager::setConnectionState(BluetoothDevice& device, ConnectionState state)
{
    if (device.connectionState == state) return;
    device.connectionState = state;
    emit connectionStateChanged(device.objectPath, state);
}

void DeviceManager::moveToConnected(BluetoothDevice& device)
{
    // Connected is only ever entered through Connecting
    if (device.connectionState == ConnectionState::Disconnected)
        setConnectionState(device, ConnectionState::Connecting);
    setConnectionState(device, ConnectionState::Connected);
}

void DeviceManager::updateIndexes(const BluetoothDevice& device)
{
    if (device.trusted) trusted_.insert(device.objectPath);
    else trusted_.remove(device.objectPath);
    if (device.blocked) blocked_.insert(device.objectPath);
    else blocked_.remove(device.objectPath);
}

void DeviceManager::updateAdapterCounts(const QString& adapterPath)
{
    if (!adapters_) return;
    int total = 0;
    int connected = 0;
    for (const auto& d : devices_) {
        if (d.adapterPath != adapterPath) continue;
        ++total;
        if (d.connected) ++connected;
    }
    adapters_->updateDeviceCounts(adapterPath, total, connected);
}

BluetoothError DeviceManager::checkDevice(const QString& devicePath) const
{
    if (!devices_.contains(devicePath))
        return BluetoothError::notFound(ErrorCategory::Device,
                                        QStringLiteral("Device not found: %1").arg(devicePath));
    return {};
}

// --- Discovery ---

void DeviceManager::startDiscovery(const QString& adapterPath, Completion done)
{
    adapters_->startDiscovery(adapterPath, std::move(done));
}

void DeviceManager::stopDiscovery(const QString& adapterPath, Completion done)
{
    adapters_->stopDiscovery(adapterPath, std::move(done));
}

// --- Pairing ---

void DeviceManager::pair(const QString& devicePath, Completion done)
{
    BluetoothError err = checkDevice(devicePath);
    if (err.isValid()) { done(err); return; }

    if (devices_.value(devicePath).paired) {
        done({});
        return;
    }

    qInfo() << "[DeviceMgr] Pairing" << devicePath;
    transport_->callMethod(devicePath, DEVICE_INTERFACE, QStringLiteral("Pair"), {},
        [this, devicePath, done](const QVariantList&, const QDBusError& error) {
            if (error.isValid()) {
                qWarning() << "[DeviceMgr] Pair failed:" << error.name() << error.message();
                emit pairingCompleted(devicePath, false);
                done(classifyDBusError(error, QStringLiteral("Pairing"), ErrorCategory::Pairing));
                return;
            }

            auto it = devices_.find(devicePath);
            if (it != devices_.end() && !it->paired) {
                it->paired = true;
                emit devicePropertiesChanged(*it, {QStringLiteral("Paired")});
            }
            qInfo() << "[DeviceMgr] Paired" << devicePath;
            emit pairingCompleted(devicePath, true);

            // A paired device is always trusted
            setTrusted(devicePath, true, done);
        }, PairTimeoutMs);
}

void DeviceManager::unpair(const QString& devicePath, Completion done)
{
    BluetoothError err = checkDevice(devicePath);
    if (err.isValid()) { done(err); return; }

    const BluetoothDevice device = devices_.value(devicePath);
    if (!device.paired) {
        done({});
        return;
    }

    qInfo() << "[DeviceMgr] Removing device" << devicePath << "from" << device.adapterPath;
    // The removal notification from the daemon deletes the local entry
    transport_->callMethod(device.adapterPath, ADAPTER_INTERFACE, QStringLiteral("RemoveDevice"),
        {QVariant::fromValue(QDBusObjectPath(devicePath))},
        [done](const QVariantList&, const QDBusError& error) {
            if (error.isValid()) {
                qWarning() << "[DeviceMgr] RemoveDevice failed:" << error.message();
                done(classifyDBusError(error, QStringLiteral("Remove device"), ErrorCategory::Device));
                return;
            }
            done({});
        });
}

// --- Connection ---

void DeviceManager::connectDevice(const QString& devicePath, Completion done)
{
    BluetoothError err = checkDevice(devicePath);
    if (err.isValid()) { done(err); return; }

    BluetoothDevice& device = devices_[devicePath];
    if (device.connectionState == ConnectionState::Connected) {
        done({});
        return;
    }
    if (device.connectionState != ConnectionState::Disconnected) {
        done(BluetoothError::precondition(ErrorCategory::Connection,
             QStringLiteral("Operation already in progress for %1").arg(device.displayName())));
        return;
    }

    qInfo() << "[DeviceMgr] Connecting" << device.displayName();
    setConnectionState(device, ConnectionState::Connecting);

    transport_->callMethod(devicePath, DEVICE_INTERFACE, QStringLiteral("Connect"), {},
        [this, devicePath, done](const QVariantList&, const QDBusError& error) {
            auto it = devices_.find(devicePath);
            if (error.isValid()) {
                qWarning() << "[DeviceMgr] Connect failed:" << error.message();
                if (it != devices_.end() && it->connectionState == ConnectionState::Connecting)
                    setConnectionState(*it, it->connected ? ConnectionState::Connected
                                                         : ConnectionState::Disconnected);
                done(classifyDBusError(error, QStringLiteral("Connection"), ErrorCategory::Connection));
                return;
            }

            if (it != devices_.end() && !it->connected) {
                it->connected = true;
                moveToConnected(*it);
                updateAdapterCounts(it->adapterPath);
                emit deviceConnected(devicePath);
            } else if (it != devices_.end()) {
                moveToConnected(*it);
            }
            done({});
        }, ConnectTimeoutMs);
}

void DeviceManager::disconnectDevice(const QString& devicePath, Completion done)
{
    BluetoothError err = checkDevice(devicePath);
    if (err.isValid()) { done(err); return; }

    BluetoothDevice& device = devices_[devicePath];
    if (device.connectionState == ConnectionState::Disconnected) {
        done({});
        return;
    }
    if (device.connectionState != ConnectionState::Connected) {
        done(BluetoothError::precondition(ErrorCategory::Connection,
             QStringLiteral("Operation already in progress for %1").arg(device.displayName())));
        return;
    }

    qInfo() << "[DeviceMgr] Disconnecting" << device.displayName();
    setConnectionState(device, ConnectionState::Disconnecting);

    transport_->callMethod(devicePath, DEVICE_INTERFACE, QStringLiteral("Disconnect"), {},
        [this, devicePath, done](const QVariantList&, const QDBusError& error) {
            auto it = devices_.find(devicePath);
            if (error.isValid()) {
                qWarning() << "[DeviceMgr] Disconnect failed:" << error.message();
                if (it != devices_.end() && it->connectionState == ConnectionState::Disconnecting)
                    setConnectionState(*it, it->connected ? ConnectionState::Connected
                                                         : ConnectionState::Disconnected);
                done(classifyDBusError(error, QStringLiteral("Disconnection"), ErrorCategory::Connection));
                return;
            }

            if (it != devices_.end() && it->connected) {
                it->connected = false;
                setConnectionState(*it, ConnectionState::Disconnected);
                updateAdapterCounts(it->adapterPath);
                emit deviceDisconnected(devicePath);
            } else if (it != devices_.end()) {
                setConnectionState(*it, ConnectionState::Disconnected);
            }
            done({});
        }, DisconnectTimeoutMs);
}

// --- Trust / block ---

void DeviceManager::setTrusted(const QString& devicePath, bool trusted, Completion done)
{
    BluetoothError err = checkDevice(devicePath);
    if (err.isValid()) { done(err); return; }
    if (devices_.value(devicePath).trusted == trusted) {
        done({});
        return;
    }
    writeFlag(devicePath, QStringLiteral("Trusted"), trusted, std::move(done));
}

void DeviceManager::setBlocked(const QString& devicePath, bool blocked, Completion done)
{
    BluetoothError err = checkDevice(devicePath);
    if (err.isValid()) { done(err); return; }
    if (devices_.value(devicePath).blocked == blocked) {
        done({});
        return;
    }
    writeFlag(devicePath, QStringLiteral("Blocked"), blocked, std::move(done));
}

void DeviceManager::writeFlag(const QString& devicePath, const QString& property, bool value, Completion done)
{
    auto apply = [this, devicePath, property](bool v) {
        auto it = devices_.find(devicePath);
        if (it == devices_.end()) return;
        if (property == QLatin1String("Trusted")) it->trusted = v;
        else it->blocked = v;
        updateIndexes(*it);
        emit devicePropertiesChanged(*it, {property});
    };

    // Applied up front so a repeated request while this one is in flight is a no-op
    apply(value);
    qInfo() << "[DeviceMgr] Setting" << property << "=" << value << "on" << devicePath;

    transport_->setProperty(devicePath, DEVICE_INTERFACE, property, value,
        [apply, value, property, done](const QDBusError& error) {
            if (error.isValid()) {
                apply(!value);
                done(classifyDBusError(error, QStringLiteral("Set %1").arg(property.toLower()),
                                       ErrorCategory::Device));
                return;
            }
            done({});
        });
}

// --- Signal refresh ---

void DeviceManager::refreshSignalStrength()
{
    for (const auto& device : std::as_const(devices_)) {
        if (!device.connected) continue;
        const QString path = device.objectPath;
        transport_->getProperty(path, DEVICE_INTERFACE, QStringLiteral("RSSI"),
            [this, path](const QVariant& value, const QDBusError& error) {
                // Many connected devices do not expose RSSI at all
                if (error.isValid() || !value.isValid()) {
                    qDebug() << "[DeviceMgr] No RSSI for" << path;
                    return;
                }
                auto it = devices_.find(path);
                if (it == devices_.end()) return;
                it->rssi = static_cast<int16_t>(value.toInt());
                it->updateSignalStrength();
                emit devicePropertiesChanged(*it, {QStringLiteral("RSSI")});
            });
    }
}

// --- Queries ---

QList<BluetoothDevice> DeviceManager::devices() const
{
    return sortedByPath(devices_.values());
}

QList<BluetoothDevice> DeviceManager::devicesForAdapter(const QString& adapterPath) const
{
    QList<BluetoothDevice> list;
    for (const auto& d : devices_) {
        if (d.adapterPath == adapterPath) list.append(d);
    }
    return sortedByPath(list);
}

QList<BluetoothDevice> DeviceManager::connectedDevices() const
{
    QList<BluetoothDevice> list;
    for (const auto& d : devices_) {
        if (d.connected) list.append(d);
    }
    return sortedByPath(list);
}

QList<BluetoothDevice> DeviceManager::pairedDevices() const
{
    QList<BluetoothDevice> list;
    for (const auto& d : devices_) {
        if (d.paired) list.append(d);
    }
    return sortedByPath(list);
}

QString DeviceManager::devicePathForAddress(const QString& address) const
{
    for (const auto& d : devices_) {
        if (d.address.compare(address, Qt::CaseInsensitive) == 0)
            return d.objectPath;
    }
    return {};
}

QStringList DeviceManager::trustedDevices() const
{
    QStringList list(trusted_.begin(), trusted_.end());
    list.sort();
    return list;
}

QStringList DeviceManager::blockedDevices() const
{
    QStringList list(blocked_.begin(), blocked_.end());
    list.sort();
    return list;
}

} // namespace bcore
