#include "AdapterManager.hpp"
#include "ErrorClassifier.hpp"
#include "IBluezTransport.hpp"
#include <QDebug>
#include <algorithm>

namespace bcore {

AdapterManager::AdapterManager(IBluezTransport* transport, QObject* parent)
    : QObject(parent)
    , transport_(transport)
{
}

AdapterManager::~AdapterManager()
{
    if (subscriptionId_)
        transport_->events().unsubscribe(subscriptionId_);
}

void AdapterManager::initialize()
{
    if (!subscriptionId_) {
        subscriptionId_ = transport_->events().subscribe(ADAPTER_INTERFACE,
            [this](const ObjectEvent& event) { onAdapterEvent(event); });
    }
    scanAdapters();
}

void AdapterManager::scanAdapters()
{
    const QStringList paths = transport_->objectsWithInterface(ADAPTER_INTERFACE);
    for (const auto& path : paths)
        loadAdapter(path, transport_->cachedProperties(path, ADAPTER_INTERFACE));

    qInfo() << "[AdapterMgr] Found" << adapters_.size() << "adapter(s), default:" << defaultAdapterPath_;
}

QList<BluetoothAdapter> AdapterManager::adapters() const
{
    QList<BluetoothAdapter> list = adapters_.values();
    std::sort(list.begin(), list.end(), [](const BluetoothAdapter& a, const BluetoothAdapter& b) {
        return a.objectPath < b.objectPath;
    });
    return list;
}

void AdapterManager::setDefaultAdapter(const QString& adapterPath)
{
    if (adapterPath == defaultAdapterPath_) return;
    if (!adapterPath.isEmpty() && !adapters_.contains(adapterPath)) return;

    auto old = adapters_.find(defaultAdapterPath_);
    if (old != adapters_.end())
        old->isDefault = false;

    defaultAdapterPath_ = adapterPath;
    auto it = adapters_.find(adapterPath);
    if (it != adapters_.end())
        it->isDefault = true;

    qInfo() << "[AdapterMgr] Default adapter:" << (adapterPath.isEmpty() ? QStringLiteral("(none)") : adapterPath);
    emit defaultAdapterChanged(adapterPath);
}

void AdapterManager::loadAdapter(const QString& path, const QVariantMap& properties)
{
    const bool isNew = !adapters_.contains(path);
    BluetoothAdapter& adapter = adapters_[path];
    adapter.objectPath = path;
    for (auto it = properties.constBegin(); it != properties.constEnd(); ++it)
        applyProperty(adapter, it.key(), it.value());

    if (defaultAdapterPath_.isEmpty())
        setDefaultAdapter(path);

    if (isNew) {
        qInfo() << "[AdapterMgr] Adapter added:" << path << adapter.address;
        emit adapterAdded(adapters_.value(path));
    }
}

void AdapterManager::removeAdapter(const QString& path)
{
    if (!adapters_.contains(path)) return;
    qInfo() << "[AdapterMgr] Adapter removed:" << path;

    adapters_.remove(path);

    if (defaultAdapterPath_ == path) {
        defaultAdapterPath_.clear();
        QStringList remaining = adapters_.keys();
        remaining.sort();
        if (!remaining.isEmpty()) {
            setDefaultAdapter(remaining.first());
        } else {
            emit defaultAdapterChanged(QString());
        }
    }

    emit adapterRemoved(path);
}

bool AdapterManager::applyProperty(BluetoothAdapter& adapter, const QString& key, const QVariant& value)
{
    bool stateChanged = false;
    if (key == "Address") adapter.address = value.toString();
    else if (key == "Alias") adapter.alias = value.toString();
    else if (key == "Name") adapter.name = value.toString();
    else if (key == "Modalias") adapter.modalias = value.toString();
    else if (key == "UUIDs") adapter.uuids = value.toStringList();
    else if (key == "Pairable") adapter.pairable = value.toBool();
    else if (key == "DiscoverableTimeout") adapter.discoverableTimeout = value.toUInt();
    else if (key == "PairableTimeout") adapter.pairableTimeout = value.toUInt();
    else if (key == "Powered") {
        stateChanged = adapter.powered != value.toBool();
        adapter.powered = value.toBool();
    } else if (key == "Discoverable") {
        stateChanged = adapter.discoverable != value.toBool();
        adapter.discoverable = value.toBool();
    } else if (key == "Discovering") {
        stateChanged = adapter.discovering != value.toBool();
        adapter.discovering = value.toBool();
    }
    return stateChanged;
}

void AdapterManager::onAdapterEvent(const ObjectEvent& event)
{
    switch (event.kind) {
    case ObjectEvent::Kind::ObjectAdded:
        loadAdapter(event.path, event.changed);
        break;
    case ObjectEvent::Kind::ObjectRemoved:
        removeAdapter(event.path);
        break;
    case ObjectEvent::Kind::PropertiesChanged: {
        auto it = adapters_.find(event.path);
        if (it == adapters_.end()) return;

        bool stateChanged = false;
        for (auto prop = event.changed.constBegin(); prop != event.changed.constEnd(); ++prop) {
            if (applyProperty(*it, prop.key(), prop.value()))
                stateChanged = true;
            emit adapterPropertyChanged(event.path, prop.key(), prop.value());
        }
        if (stateChanged)
            emit adapterStateChanged(adapters_.value(event.path));
        break;
    }
    }
}

BluetoothError AdapterManager::checkAdapter(const QString& adapterPath) const
{
    if (!adapters_.contains(adapterPath))
        return BluetoothError::notFound(ErrorCategory::Adapter,
                                        QStringLiteral("Adapter not found: %1").arg(adapterPath));
    return {};
}

BluetoothError AdapterManager::validateConfiguration(const QString& property, const QVariant& value)
{
    if (property == "Alias") {
        const int length = value.toString().length();
        if (length < 1 || length > MaxAliasLength)
            return BluetoothError::invalidArgument(ErrorCategory::Adapter,
                QStringLiteral("Invalid adapter alias: must be 1-%1 characters").arg(MaxAliasLength));
        return {};
    }
    if (property == "DiscoverableTimeout" || property == "PairableTimeout") {
        bool ok = false;
        const qlonglong timeout = value.toLongLong(&ok);
        if (!ok || timeout < 0 || timeout > MaxTimeoutSeconds)
            return BluetoothError::invalidArgument(ErrorCategory::Adapter,
                QStringLiteral("Invalid %1: must be 0-%2 seconds").arg(property).arg(MaxTimeoutSeconds));
        return {};
    }
    if (property == "Powered" || property == "Discoverable" || property == "Pairable")
        return {};

    qWarning() << "[AdapterMgr] Unknown property for validation:" << property;
    return BluetoothError::invalidArgument(ErrorCategory::Adapter,
                                           QStringLiteral("Unknown adapter property: %1").arg(property));
}

void AdapterManager::writeProperty(const QString& adapterPath, const QString& property,
                                   const QVariant& value, const QString& operation, Completion done)
{
    transport_->setProperty(adapterPath, ADAPTER_INTERFACE, property, value,
        [this, adapterPath, property, value, operation, done](const QDBusError& error) {
            if (error.isValid()) {
                qWarning() << "[AdapterMgr]" << operation << "failed on" << adapterPath << ":" << error.message();
                done(classifyDBusError(error, operation, ErrorCategory::Adapter));
                return;
            }
            // Reflect the confirmed value now; the daemon's own notification is then a no-op
            auto it = adapters_.find(adapterPath);
            if (it != adapters_.end() && applyProperty(*it, property, value))
                emit adapterStateChanged(*it);
            done({});
        });
}

void AdapterManager::setPowered(const QString& adapterPath, bool powered, Completion done)
{
    BluetoothError err = checkAdapter(adapterPath);
    if (err.isValid()) { done(err); return; }

    qInfo() << "[AdapterMgr] Setting" << adapterPath << "powered:" << powered;
    writeProperty(adapterPath, QStringLiteral("Powered"), powered, QStringLiteral("Set power"), std::move(done));
}

void AdapterManager::setDiscoverable(const QString& adapterPath, bool discoverable,
                                     uint32_t timeout, Completion done)
{
    BluetoothError err = checkAdapter(adapterPath);
    if (!err.isValid())
        err = validateConfiguration(QStringLiteral("DiscoverableTimeout"), timeout);
    if (err.isValid()) { done(err); return; }

    qInfo() << "[AdapterMgr] Setting" << adapterPath << "discoverable:" << discoverable << "timeout:" << timeout;

    auto apply = [this, adapterPath, discoverable, done]() {
        writeProperty(adapterPath, QStringLiteral("Discoverable"), discoverable,
                      QStringLiteral("Set discoverable"), done);
    };
    if (timeout == 0) {
        apply();
        return;
    }
    // Timeout first so the window opens with the requested length
    writeProperty(adapterPath, QStringLiteral("DiscoverableTimeout"), QVariant::fromValue(timeout),
                  QStringLiteral("Set discoverable timeout"),
                  [apply, done](const BluetoothError& error) {
                      if (error.isValid()) { done(error); return; }
                      apply();
                  });
}

void AdapterManager::setPairable(const QString& adapterPath, bool pairable,
                                 uint32_t timeout, Completion done)
{
    BluetoothError err = checkAdapter(adapterPath);
    if (!err.isValid())
        err = validateConfiguration(QStringLiteral("PairableTimeout"), timeout);
    if (err.isValid()) { done(err); return; }

    qInfo() << "[AdapterMgr] Setting" << adapterPath << "pairable:" << pairable << "timeout:" << timeout;

    auto apply = [this, adapterPath, pairable, done]() {
        writeProperty(adapterPath, QStringLiteral("Pairable"), pairable,
                      QStringLiteral("Set pairable"), done);
    };
    if (timeout == 0) {
        apply();
        return;
    }
    writeProperty(adapterPath, QStringLiteral("PairableTimeout"), QVariant::fromValue(timeout),
                  QStringLiteral("Set pairable timeout"),
                  [apply, done](const BluetoothError& error) {
                      if (error.isValid()) { done(error); return; }
                      apply();
                  });
}

void AdapterManager::setAlias(const QString& adapterPath, const QString& alias, Completion done)
{
    BluetoothError err = checkAdapter(adapterPath);
    if (!err.isValid())
        err = validateConfiguration(QStringLiteral("Alias"), alias);
    if (err.isValid()) { done(err); return; }

    writeProperty(adapterPath, QStringLiteral("Alias"), alias, QStringLiteral("Set alias"), std::move(done));
}

void AdapterManager::startDiscovery(const QString& adapterPath, Completion done)
{
    BluetoothError err = checkAdapter(adapterPath);
    if (err.isValid()) { done(err); return; }

    if (!adapters_.value(adapterPath).powered) {
        done(BluetoothError::precondition(ErrorCategory::Adapter,
             QStringLiteral("Adapter must be powered on to start discovery")));
        return;
    }

    qInfo() << "[AdapterMgr] Starting discovery on" << adapterPath;
    transport_->callMethod(adapterPath, ADAPTER_INTERFACE, QStringLiteral("StartDiscovery"), {},
        [adapterPath, done](const QVariantList&, const QDBusError& error) {
            if (error.isValid()) {
                qWarning() << "[AdapterMgr] StartDiscovery failed:" << error.message();
                done(classifyDBusError(error, QStringLiteral("Start discovery"), ErrorCategory::Adapter));
                return;
            }
            done({});
        });
}

void AdapterManager::stopDiscovery(const QString& adapterPath, Completion done)
{
    BluetoothError err = checkAdapter(adapterPath);
    if (err.isValid()) { done(err); return; }

    qInfo() << "[AdapterMgr] Stopping discovery on" << adapterPath;
    transport_->callMethod(adapterPath, ADAPTER_INTERFACE, QStringLiteral("StopDiscovery"), {},
        [done](const QVariantList&, const QDBusError& error) {
            if (error.isValid()) {
                qWarning() << "[AdapterMgr] StopDiscovery failed:" << error.message();
                done(classifyDBusError(error, QStringLiteral("Stop discovery"), ErrorCategory::Adapter));
                return;
            }
            done({});
        });
}

void AdapterManager::updateDeviceCounts(const QString& adapterPath, int total, int connected)
{
    auto it = adapters_.find(adapterPath);
    if (it == adapters_.end()) return;
    it->deviceCount = total;
    it->connectedDeviceCount = connected;
}

} // namespace bcore
