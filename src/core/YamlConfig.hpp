#pragma once

#include <QString>
#include <QStringList>
#include <QVariant>
#include <cstdint>
#include <yaml-cpp/yaml.h>

namespace bcore {

/// Stored preferences of one adapter, keyed by its interface name ("hci0").
struct AdapterConfig {
    QString alias;
    uint32_t discoverableTimeout = 180;
    uint32_t pairableTimeout = 0;

    bool isValid() const;
};

class YamlConfig {
public:
    YamlConfig();

    void load(const QString& filePath);
    void save(const QString& filePath) const;

    // Adapters
    QStringList configuredAdapters() const;
    bool hasAdapterConfig(const QString& adapterName) const;
    AdapterConfig adapterConfig(const QString& adapterName) const;
    void setAdapterConfig(const QString& adapterName, const AdapterConfig& config);

    // Devices, by hardware address
    QStringList trustedDevices() const;
    void setTrustedDevices(const QStringList& addresses);
    QStringList blockedDevices() const;
    void setBlockedDevices(const QStringList& addresses);

    // UI
    QString filter() const;
    void setFilter(const QString& v);
    QString sortOrder() const;
    void setSortOrder(const QString& v);
    bool showOnlyPaired() const;
    void setShowOnlyPaired(bool v);
    bool showOnlyConnected() const;
    void setShowOnlyConnected(bool v);
    bool notificationsEnabled() const;
    void setNotificationsEnabled(bool v);
    bool notifyOnConnect() const;
    bool notifyOnDisconnect() const;
    bool notifyOnPairing() const;
    bool notifyOnTransfer() const;

    // Bluetooth
    QString agentCapability() const;
    void setAgentCapability(const QString& v);
    int autoDiscoverySeconds() const;
    void setAutoDiscoverySeconds(int v);
    int rssiRefreshMs() const;
    void setRssiRefreshMs(int v);
    int pairingTimeoutMs() const;
    void setPairingTimeoutMs(int v);

    // Generic dot-path access (e.g. "ui.notify_on_connect", "adapters.hci0.alias")
    QVariant valueByPath(const QString& dottedKey) const;
    bool setValueByPath(const QString& dottedKey, const QVariant& value);

private:
    YAML::Node root_;  // Single source of truth

    void initDefaults();
    static YAML::Node buildDefaultsNode();
    static YAML::Node buildAdapterDefaults();
    static QStringList readList(const YAML::Node& node);
    static YAML::Node writeList(const QStringList& values);
};

} // namespace bcore
