#pragma once

#include "IBluezTransport.hpp"
#include <QDBusConnection>
#include <QDBusMessage>
#include <QHash>
#include <QTimer>

class QDBusServiceWatcher;

namespace bcore {

/// QtDBus transport. Talks to org.bluez on the system bus and to
/// org.bluez.obex on the session bus, mirrors both object trees and
/// reconnects with exponential backoff when the daemon goes away.
class BluezClient : public IBluezTransport {
    Q_OBJECT
public:
    static constexpr int ReconnectBaseDelayMs = 1000;
    static constexpr int ReconnectMaxDelayMs = 30000;
    static constexpr int MaxReconnectAttempts = 10;

    explicit BluezClient(QObject* parent = nullptr);
    ~BluezClient() override;

    void start() override;
    void stop() override;
    bool isConnected() const override { return connected_; }

    void callMethod(const QString& path, const QString& interface, const QString& method,
                    const QVariantList& args, ReplyHandler handler,
                    int timeoutMs = DefaultCallTimeoutMs) override;
    void getProperty(const QString& path, const QString& interface,
                     const QString& name, PropertyHandler handler) override;
    void setProperty(const QString& path, const QString& interface,
                     const QString& name, const QVariant& value, DoneHandler handler) override;
    void getAllProperties(const QString& path, const QString& interface,
                          PropertiesHandler handler) override;

    QStringList objectsWithInterface(const QString& interface) const override;
    QVariantMap cachedProperties(const QString& path, const QString& interface) const override;

    bool exportObject(const QString& path, QObject* object) override;
    void unexportObject(const QString& path) override;

    int reconnectAttempts() const { return reconnectAttempts_; }

    /// Delay before reconnect attempt @p attempt (0-based).
    static int reconnectDelayMs(int attempt);

    /// Converts QtDBus wire containers (QDBusVariant, a{sv}, as) into plain QVariants.
    static QVariant normalizeArgument(const QVariant& value);

private slots:
    void onPropertiesChanged(const QDBusMessage& msg);
    void onInterfacesAdded(const QDBusMessage& msg);
    void onInterfacesRemoved(const QDBusMessage& msg);
    void onServiceRegistered();
    void onServiceUnregistered();
    void onObexServiceUnregistered();

private:
    using InterfaceMap = QHash<QString, QVariantMap>;

    static bool isObexInterface(const QString& interface);
    static QString serviceFor(const QString& interface);
    QDBusConnection busFor(const QString& interface) const;

    void loadManagedObjects();
    void loadObexObjects();
    static QHash<QString, InterfaceMap> parseManagedObjects(const QDBusMessage& reply);
    void subscribeSignals();
    void handleServiceLost();
    void scheduleReconnect();
    void setConnected(bool connected);
    void removeObjectInterfaces(const QString& path, const QStringList& interfaces);
    void dropCache(bool obex);

    QDBusConnection systemBus_;
    QDBusConnection sessionBus_;
    QDBusServiceWatcher* serviceWatcher_ = nullptr;
    QDBusServiceWatcher* obexWatcher_ = nullptr;
    QTimer reconnectTimer_;
    int reconnectAttempts_ = 0;
    bool connected_ = false;
    bool starting_ = false;
    bool signalsSubscribed_ = false;

    // path -> interface -> properties
    QHash<QString, InterfaceMap> objects_;
};

} // namespace bcore
