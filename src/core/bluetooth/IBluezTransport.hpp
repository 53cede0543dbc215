#pragma once

#include "ObjectEventBus.hpp"
#include <QDBusError>
#include <QObject>
#include <QString>
#include <QStringList>
#include <QVariant>
#include <QVariantList>
#include <QVariantMap>
#include <functional>

namespace bcore {

/// Asynchronous access to the daemon's object tree. Every handler is invoked
/// exactly once on the event loop; an invalid QDBusError means success.
class IBluezTransport : public QObject {
    Q_OBJECT
public:
    using QObject::QObject;
    ~IBluezTransport() override = default;

    static constexpr int DefaultCallTimeoutMs = 30000;

    using ReplyHandler = std::function<void(const QVariantList& results, const QDBusError& error)>;
    using PropertyHandler = std::function<void(const QVariant& value, const QDBusError& error)>;
    using PropertiesHandler = std::function<void(const QVariantMap& properties, const QDBusError& error)>;
    using DoneHandler = std::function<void(const QDBusError& error)>;

    virtual void start() = 0;
    virtual void stop() = 0;
    virtual bool isConnected() const = 0;

    virtual void callMethod(const QString& path, const QString& interface, const QString& method,
                            const QVariantList& args, ReplyHandler handler,
                            int timeoutMs = DefaultCallTimeoutMs) = 0;

    virtual void getProperty(const QString& path, const QString& interface,
                             const QString& name, PropertyHandler handler) = 0;
    virtual void setProperty(const QString& path, const QString& interface,
                             const QString& name, const QVariant& value, DoneHandler handler) = 0;
    virtual void getAllProperties(const QString& path, const QString& interface,
                                  PropertiesHandler handler) = 0;

    /// Object paths currently known to implement @p interface.
    virtual QStringList objectsWithInterface(const QString& interface) const = 0;

    /// Last known property values of @p interface on @p path (empty if unknown).
    virtual QVariantMap cachedProperties(const QString& path, const QString& interface) const = 0;

    /// Publishes a local object (the pairing agent) on the system bus.
    virtual bool exportObject(const QString& path, QObject* object) = 0;
    virtual void unexportObject(const QString& path) = 0;

    ObjectEventBus& events() { return events_; }

signals:
    void connectionStateChanged(bool connected);
    /// Reconnection gave up; the daemon stays unreachable until it reappears.
    void transportError(const QString& message);

private:
    ObjectEventBus events_;
};

} // namespace bcore
