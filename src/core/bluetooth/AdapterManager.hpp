#pragma once

#include "BluetoothError.hpp"
#include "BluetoothTypes.hpp"
#include <QHash>
#include <QList>
#include <QObject>

namespace bcore {

class IBluezTransport;
struct ObjectEvent;

class AdapterManager : public QObject {
    Q_OBJECT
public:
    static constexpr int MaxAliasLength = 248;
    static constexpr uint32_t MaxTimeoutSeconds = 65535;

    explicit AdapterManager(IBluezTransport* transport, QObject* parent = nullptr);
    ~AdapterManager() override;

    /// Subscribes to adapter events and loads the adapters already on the bus.
    void initialize();

    /// Re-reads every adapter from the transport's object cache.
    void scanAdapters();

    QList<BluetoothAdapter> adapters() const;
    bool hasAdapter(const QString& adapterPath) const { return adapters_.contains(adapterPath); }
    BluetoothAdapter adapter(const QString& adapterPath) const { return adapters_.value(adapterPath); }
    QString defaultAdapterPath() const { return defaultAdapterPath_; }
    BluetoothAdapter defaultAdapter() const { return adapters_.value(defaultAdapterPath_); }
    void setDefaultAdapter(const QString& adapterPath);

    void setPowered(const QString& adapterPath, bool powered, Completion done);
    void setDiscoverable(const QString& adapterPath, bool discoverable, uint32_t timeout, Completion done);
    void setPairable(const QString& adapterPath, bool pairable, uint32_t timeout, Completion done);
    void setAlias(const QString& adapterPath, const QString& alias, Completion done);
    void startDiscovery(const QString& adapterPath, Completion done);
    void stopDiscovery(const QString& adapterPath, Completion done);

    /// Checks a writable adapter property before it is sent.
    /// Returns an invalid error when @p value is acceptable.
    static BluetoothError validateConfiguration(const QString& property, const QVariant& value);

    /// Device totals are owned by the device layer and mirrored here for display.
    void updateDeviceCounts(const QString& adapterPath, int total, int connected);

signals:
    void adapterAdded(const bcore::BluetoothAdapter& adapter);
    void adapterRemoved(const QString& adapterPath);
    void adapterPropertyChanged(const QString& adapterPath, const QString& property, const QVariant& value);
    /// Powered, Discoverable or Discovering actually changed.
    void adapterStateChanged(const bcore::BluetoothAdapter& adapter);
    void defaultAdapterChanged(const QString& adapterPath);

private:
    void onAdapterEvent(const ObjectEvent& event);
    void loadAdapter(const QString& path, const QVariantMap& properties);
    void removeAdapter(const QString& path);
    bool applyProperty(BluetoothAdapter& adapter, const QString& key, const QVariant& value);
    void writeProperty(const QString& adapterPath, const QString& property,
                       const QVariant& value, const QString& operation, Completion done);
    BluetoothError checkAdapter(const QString& adapterPath) const;

    IBluezTransport* transport_;
    int subscriptionId_ = 0;
    QHash<QString, BluetoothAdapter> adapters_;
    QString defaultAdapterPath_;
};

} // namespace bcore
