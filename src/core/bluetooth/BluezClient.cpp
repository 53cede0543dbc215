#include "BluezClient.hpp"
#include "BluetoothTypes.hpp"
#include <QDebug>
#include <QDBusArgument>
#include <QDBusMetaType>
#include <QDBusObjectPath>
#include <QDBusPendingCall>
#include <QDBusPendingCallWatcher>
#include <QDBusServiceWatcher>
#include <QDBusVariant>
#include <algorithm>

namespace bcore {

BluezClient::BluezClient(QObject* parent)
    : IBluezTransport(parent)
    , systemBus_(QDBusConnection::systemBus())
    , sessionBus_(QDBusConnection::sessionBus())
{
    reconnectTimer_.setSingleShot(true);
    connect(&reconnectTimer_, &QTimer::timeout, this, [this]() {
        qInfo() << "[BluezClient] Reconnect attempt" << reconnectAttempts_
                << "/" << MaxReconnectAttempts;
        start();
    });
}

BluezClient::~BluezClient()
{
    stop();
}

int BluezClient::reconnectDelayMs(int attempt)
{
    if (attempt < 0) attempt = 0;
    // 1s, 2s, 4s ... capped; the shift is clamped so it cannot overflow
    const int shift = std::min(attempt, 15);
    return std::min(ReconnectBaseDelayMs << shift, ReconnectMaxDelayMs);
}

QVariant BluezClient::normalizeArgument(const QVariant& value)
{
    if (value.userType() == qMetaTypeId<QDBusVariant>())
        return normalizeArgument(value.value<QDBusVariant>().variant());

    if (value.userType() != qMetaTypeId<QDBusArgument>())
        return value;

    const QDBusArgument arg = value.value<QDBusArgument>();
    const QString signature = arg.currentSignature();
    if (signature == QLatin1String("a{sv}")) {
        QVariantMap map = qdbus_cast<QVariantMap>(arg);
        for (auto it = map.begin(); it != map.end(); ++it)
            it.value() = normalizeArgument(it.value());
        return map;
    }
    if (signature == QLatin1String("as"))
        return qdbus_cast<QStringList>(arg);
    if (signature == QLatin1String("ao")) {
        QStringList paths;
        const auto list = qdbus_cast<QList<QDBusObjectPath>>(arg);
        for (const auto& p : list)
            paths.append(p.path());
        return paths;
    }
    return value;
}

bool BluezClient::isObexInterface(const QString& interface)
{
    return interface.startsWith(QLatin1String("org.bluez.obex."));
}

QString BluezClient::serviceFor(const QString& interface)
{
    return isObexInterface(interface) ? OBEX_SERVICE : BLUEZ_SERVICE;
}

QDBusConnection BluezClient::busFor(const QString& interface) const
{
    return isObexInterface(interface) ? sessionBus_ : systemBus_;
}

// --- Connection lifecycle ---

void BluezClient::start()
{
    if (starting_) return;

    if (!systemBus_.isConnected()) {
        qWarning() << "[BluezClient] System bus not available:" << systemBus_.lastError().message();
        scheduleReconnect();
        return;
    }

    if (!serviceWatcher_) {
        serviceWatcher_ = new QDBusServiceWatcher(BLUEZ_SERVICE, systemBus_,
            QDBusServiceWatcher::WatchForRegistration | QDBusServiceWatcher::WatchForUnregistration,
            this);
        connect(serviceWatcher_, &QDBusServiceWatcher::serviceRegistered,
                this, &BluezClient::onServiceRegistered);
        connect(serviceWatcher_, &QDBusServiceWatcher::serviceUnregistered,
                this, &BluezClient::onServiceUnregistered);
    }
    if (!obexWatcher_ && sessionBus_.isConnected()) {
        obexWatcher_ = new QDBusServiceWatcher(OBEX_SERVICE, sessionBus_,
            QDBusServiceWatcher::WatchForUnregistration, this);
        connect(obexWatcher_, &QDBusServiceWatcher::serviceUnregistered,
                this, &BluezClient::onObexServiceUnregistered);
    }

    subscribeSignals();
    loadManagedObjects();
}

void BluezClient::stop()
{
    reconnectTimer_.stop();
    if (signalsSubscribed_) {
        systemBus_.disconnect(BLUEZ_SERVICE, QString(), PROPERTIES_INTERFACE, "PropertiesChanged",
                              this, SLOT(onPropertiesChanged(QDBusMessage)));
        systemBus_.disconnect(BLUEZ_SERVICE, QString(), OBJECT_MANAGER_INTERFACE, "InterfacesAdded",
                              this, SLOT(onInterfacesAdded(QDBusMessage)));
        systemBus_.disconnect(BLUEZ_SERVICE, QString(), OBJECT_MANAGER_INTERFACE, "InterfacesRemoved",
                              this, SLOT(onInterfacesRemoved(QDBusMessage)));
        if (sessionBus_.isConnected()) {
            sessionBus_.disconnect(OBEX_SERVICE, QString(), PROPERTIES_INTERFACE, "PropertiesChanged",
                                   this, SLOT(onPropertiesChanged(QDBusMessage)));
            sessionBus_.disconnect(OBEX_SERVICE, QString(), OBJECT_MANAGER_INTERFACE, "InterfacesAdded",
                                   this, SLOT(onInterfacesAdded(QDBusMessage)));
            sessionBus_.disconnect(OBEX_SERVICE, QString(), OBJECT_MANAGER_INTERFACE, "InterfacesRemoved",
                                   this, SLOT(onInterfacesRemoved(QDBusMessage)));
        }
        signalsSubscribed_ = false;
    }
    objects_.clear();
    starting_ = false;
    setConnected(false);
}

void BluezClient::subscribeSignals()
{
    if (signalsSubscribed_) return;

    // One global subscription per signal; managers filter through the event bus
    systemBus_.connect(BLUEZ_SERVICE, QString(), PROPERTIES_INTERFACE, "PropertiesChanged",
                       this, SLOT(onPropertiesChanged(QDBusMessage)));
    systemBus_.connect(BLUEZ_SERVICE, QString(), OBJECT_MANAGER_INTERFACE, "InterfacesAdded",
                       this, SLOT(onInterfacesAdded(QDBusMessage)));
    systemBus_.connect(BLUEZ_SERVICE, QString(), OBJECT_MANAGER_INTERFACE, "InterfacesRemoved",
                       this, SLOT(onInterfacesRemoved(QDBusMessage)));

    if (sessionBus_.isConnected()) {
        sessionBus_.connect(OBEX_SERVICE, QString(), PROPERTIES_INTERFACE, "PropertiesChanged",
                            this, SLOT(onPropertiesChanged(QDBusMessage)));
        sessionBus_.connect(OBEX_SERVICE, QString(), OBJECT_MANAGER_INTERFACE, "InterfacesAdded",
                            this, SLOT(onInterfacesAdded(QDBusMessage)));
        sessionBus_.connect(OBEX_SERVICE, QString(), OBJECT_MANAGER_INTERFACE, "InterfacesRemoved",
                            this, SLOT(onInterfacesRemoved(QDBusMessage)));
    } else {
        qInfo() << "[BluezClient] Session bus not available, file transfer disabled";
    }
    signalsSubscribed_ = true;
}

void BluezClient::loadManagedObjects()
{
    starting_ = true;

    QDBusMessage msg = QDBusMessage::createMethodCall(
        BLUEZ_SERVICE, QStringLiteral("/"), OBJECT_MANAGER_INTERFACE, QStringLiteral("GetManagedObjects"));
    auto* watcher = new QDBusPendingCallWatcher(systemBus_.asyncCall(msg, DefaultCallTimeoutMs), this);
    connect(watcher, &QDBusPendingCallWatcher::finished, this, [this, watcher]() {
        watcher->deleteLater();
        starting_ = false;

        if (watcher->isError()) {
            qWarning() << "[BluezClient] GetManagedObjects failed:" << watcher->error().message();
            scheduleReconnect();
            return;
        }

        const auto tree = parseManagedObjects(watcher->reply());
        for (auto it = tree.constBegin(); it != tree.constEnd(); ++it)
            objects_[it.key()] = it.value();

        reconnectTimer_.stop();
        reconnectAttempts_ = 0;
        qInfo() << "[BluezClient] Connected to" << BLUEZ_SERVICE << "-" << tree.size() << "objects";
        setConnected(true);

        loadObexObjects();
    });
}

void BluezClient::loadObexObjects()
{
    if (!sessionBus_.isConnected()) return;

    QDBusMessage msg = QDBusMessage::createMethodCall(
        OBEX_SERVICE, QStringLiteral("/"), OBJECT_MANAGER_INTERFACE, QStringLiteral("GetManagedObjects"));
    auto* watcher = new QDBusPendingCallWatcher(sessionBus_.asyncCall(msg, DefaultCallTimeoutMs), this);
    connect(watcher, &QDBusPendingCallWatcher::finished, this, [this, watcher]() {
        watcher->deleteLater();
        if (watcher->isError()) {
            // obexd is activated on demand by CreateSession
            qDebug() << "[BluezClient] OBEX daemon not running:" << watcher->error().message();
            return;
        }
        const auto tree = parseManagedObjects(watcher->reply());
        for (auto it = tree.constBegin(); it != tree.constEnd(); ++it) {
            for (auto iface = it->constBegin(); iface != it->constEnd(); ++iface) {
                objects_[it.key()][iface.key()] = iface.value();
                ObjectEvent event;
                event.kind = ObjectEvent::Kind::ObjectAdded;
                event.path = it.key();
                event.interface = iface.key();
                event.changed = iface.value();
                events().publish(event);
            }
        }
    });
}

QHash<QString, BluezClient::InterfaceMap> BluezClient::parseManagedObjects(const QDBusMessage& reply)
{
    QHash<QString, InterfaceMap> tree;
    if (reply.arguments().isEmpty())
        return tree;

    // a{oa{sa{sv}}}: object path -> interface -> properties
    const QDBusArgument arg = reply.arguments().first().value<QDBusArgument>();
    arg.beginMap();
    while (!arg.atEnd()) {
        arg.beginMapEntry();
        QDBusObjectPath objPath;
        arg >> objPath;

        InterfaceMap interfaces;
        arg.beginMap();
        while (!arg.atEnd()) {
            arg.beginMapEntry();
            QString ifaceName;
            arg >> ifaceName;
            QVariantMap props;
            arg.beginMap();
            while (!arg.atEnd()) {
                arg.beginMapEntry();
                QString key;
                arg >> key;
                QDBusVariant val;
                arg >> val;
                props.insert(key, normalizeArgument(val.variant()));
                arg.endMapEntry();
            }
            arg.endMap();
            interfaces.insert(ifaceName, props);
            arg.endMapEntry();
        }
        arg.endMap();
        arg.endMapEntry();

        tree.insert(objPath.path(), interfaces);
    }
    arg.endMap();
    return tree;
}

void BluezClient::setConnected(bool connected)
{
    if (connected_ == connected) return;
    connected_ = connected;
    emit connectionStateChanged(connected);
}

void BluezClient::scheduleReconnect()
{
    if (reconnectAttempts_ >= MaxReconnectAttempts) {
        qWarning() << "[BluezClient] Giving up after" << reconnectAttempts_ << "reconnect attempts";
        emit transportError(QStringLiteral("Bluetooth service is not available"));
        return;
    }

    int delay = reconnectDelayMs(reconnectAttempts_);
    ++reconnectAttempts_;
    qInfo() << "[BluezClient] Reconnecting in" << delay << "ms";
    // start() re-arms, so at most one reconnect is ever pending
    reconnectTimer_.start(delay);
}

void BluezClient::onServiceRegistered()
{
    qInfo() << "[BluezClient] BlueZ appeared on the bus, re-initializing";
    reconnectTimer_.stop();
    reconnectAttempts_ = 0;
    start();
}

void BluezClient::onServiceUnregistered()
{
    handleServiceLost();
}

void BluezClient::onObexServiceUnregistered()
{
    // Transfers and sessions die with obexd; BlueZ objects are unaffected
    qWarning() << "[BluezClient] OBEX daemon left the bus";
    dropCache(true);
}

void BluezClient::handleServiceLost()
{
    qWarning() << "[BluezClient] BlueZ disappeared from the bus";
    dropCache(false);
    setConnected(false);
    scheduleReconnect();
}

void BluezClient::dropCache(bool obex)
{
    const QStringList paths = objects_.keys();
    for (const auto& path : paths) {
        QStringList interfaces;
        for (const auto& iface : objects_.value(path).keys()) {
            if (isObexInterface(iface) == obex)
                interfaces.append(iface);
        }
        if (!interfaces.isEmpty())
            removeObjectInterfaces(path, interfaces);
    }
}

// --- Signal fan-out ---

void BluezClient::onPropertiesChanged(const QDBusMessage& msg)
{
    const QVariantList args = msg.arguments();
    if (args.size() < 2) return;

    ObjectEvent event;
    event.kind = ObjectEvent::Kind::PropertiesChanged;
    event.path = msg.path();
    event.interface = args.at(0).toString();
    event.changed = normalizeArgument(args.at(1)).toMap();
    if (args.size() > 2)
        event.invalidated = args.at(2).toStringList();

    // Only cache objects the tree already announced
    auto obj = objects_.find(event.path);
    if (obj != objects_.end() && obj->contains(event.interface)) {
        QVariantMap& props = (*obj)[event.interface];
        for (auto it = event.changed.constBegin(); it != event.changed.constEnd(); ++it)
            props.insert(it.key(), it.value());
        for (const auto& key : event.invalidated)
            props.remove(key);
    }

    events().publish(event);
}

void BluezClient::onInterfacesAdded(const QDBusMessage& msg)
{
    const QVariantList args = msg.arguments();
    if (args.size() < 2) return;

    const QString path = args.at(0).value<QDBusObjectPath>().path();

    InterfaceMap added;
    if (args.at(1).userType() == qMetaTypeId<QDBusArgument>()) {
        // a{sa{sv}}
        const QDBusArgument arg = args.at(1).value<QDBusArgument>();
        arg.beginMap();
        while (!arg.atEnd()) {
            arg.beginMapEntry();
            QString ifaceName;
            QVariantMap props;
            arg >> ifaceName >> props;
            for (auto it = props.begin(); it != props.end(); ++it)
                it.value() = normalizeArgument(it.value());
            added.insert(ifaceName, props);
            arg.endMapEntry();
        }
        arg.endMap();
    } else {
        // Locally delivered messages carry the map already demarshalled
        const QVariantMap ifaces = args.at(1).toMap();
        for (auto it = ifaces.constBegin(); it != ifaces.constEnd(); ++it)
            added.insert(it.key(), normalizeArgument(it.value()).toMap());
    }

    for (auto it = added.constBegin(); it != added.constEnd(); ++it) {
        objects_[path][it.key()] = it.value();
        ObjectEvent event;
        event.kind = ObjectEvent::Kind::ObjectAdded;
        event.path = path;
        event.interface = it.key();
        event.changed = it.value();
        events().publish(event);
    }
}

void BluezClient::onInterfacesRemoved(const QDBusMessage& msg)
{
    const QVariantList args = msg.arguments();
    if (args.size() < 2) return;
    removeObjectInterfaces(args.at(0).value<QDBusObjectPath>().path(), args.at(1).toStringList());
}

void BluezClient::removeObjectInterfaces(const QString& path, const QStringList& interfaces)
{
    auto obj = objects_.find(path);
    if (obj != objects_.end()) {
        for (const auto& iface : interfaces)
            obj->remove(iface);
        if (obj->isEmpty())
            objects_.erase(obj);
    }

    for (const auto& iface : interfaces) {
        ObjectEvent event;
        event.kind = ObjectEvent::Kind::ObjectRemoved;
        event.path = path;
        event.interface = iface;
        events().publish(event);
    }

    if (objects_.contains(path))
        return;

    // The object is gone entirely: anything addressed below it is stale too
    const QString prefix = path + QLatin1Char('/');
    const QStringList paths = objects_.keys();
    for (const auto& child : paths) {
        if (child.startsWith(prefix) && objects_.contains(child))
            removeObjectInterfaces(child, objects_.value(child).keys());
    }
}

// --- Remote calls ---

void BluezClient::callMethod(const QString& path, const QString& interface, const QString& method,
                             const QVariantList& args, ReplyHandler handler, int timeoutMs)
{
    QDBusMessage msg = QDBusMessage::createMethodCall(serviceFor(interface), path, interface, method);
    msg.setArguments(args);

    auto* watcher = new QDBusPendingCallWatcher(busFor(interface).asyncCall(msg, timeoutMs), this);
    connect(watcher, &QDBusPendingCallWatcher::finished, this, [watcher, handler, method]() {
        watcher->deleteLater();
        if (watcher->isError()) {
            qDebug() << "[BluezClient]" << method << "failed:" << watcher->error().name()
                     << watcher->error().message();
            handler({}, watcher->error());
            return;
        }
        QVariantList results;
        for (const auto& v : watcher->reply().arguments())
            results.append(normalizeArgument(v));
        handler(results, QDBusError());
    });
}

void BluezClient::getProperty(const QString& path, const QString& interface,
                              const QString& name, PropertyHandler handler)
{
    QDBusMessage msg = QDBusMessage::createMethodCall(serviceFor(interface), path,
                                                      PROPERTIES_INTERFACE, QStringLiteral("Get"));
    msg << interface << name;

    auto* watcher = new QDBusPendingCallWatcher(busFor(interface).asyncCall(msg, DefaultCallTimeoutMs), this);
    connect(watcher, &QDBusPendingCallWatcher::finished, this, [watcher, handler]() {
        watcher->deleteLater();
        if (watcher->isError()) {
            handler({}, watcher->error());
            return;
        }
        const QVariantList args = watcher->reply().arguments();
        handler(args.isEmpty() ? QVariant() : normalizeArgument(args.first()), QDBusError());
    });
}

void BluezClient::setProperty(const QString& path, const QString& interface,
                              const QString& name, const QVariant& value, DoneHandler handler)
{
    QDBusMessage msg = QDBusMessage::createMethodCall(serviceFor(interface), path,
                                                      PROPERTIES_INTERFACE, QStringLiteral("Set"));
    msg << interface << name << QVariant::fromValue(QDBusVariant(value));

    auto* watcher = new QDBusPendingCallWatcher(busFor(interface).asyncCall(msg, DefaultCallTimeoutMs), this);
    connect(watcher, &QDBusPendingCallWatcher::finished, this, [watcher, handler, name]() {
        watcher->deleteLater();
        if (watcher->isError())
            qWarning() << "[BluezClient] Failed to set" << name << ":" << watcher->error().message();
        handler(watcher->isError() ? watcher->error() : QDBusError());
    });
}

void BluezClient::getAllProperties(const QString& path, const QString& interface,
                                   PropertiesHandler handler)
{
    QDBusMessage msg = QDBusMessage::createMethodCall(serviceFor(interface), path,
                                                      PROPERTIES_INTERFACE, QStringLiteral("GetAll"));
    msg << interface;

    auto* watcher = new QDBusPendingCallWatcher(busFor(interface).asyncCall(msg, DefaultCallTimeoutMs), this);
    connect(watcher, &QDBusPendingCallWatcher::finished, this, [watcher, handler]() {
        watcher->deleteLater();
        if (watcher->isError()) {
            handler({}, watcher->error());
            return;
        }
        const QVariantList args = watcher->reply().arguments();
        handler(args.isEmpty() ? QVariantMap() : normalizeArgument(args.first()).toMap(), QDBusError());
    });
}

// --- Object cache ---

QStringList BluezClient::objectsWithInterface(const QString& interface) const
{
    QStringList paths;
    for (auto it = objects_.constBegin(); it != objects_.constEnd(); ++it) {
        if (it->contains(interface))
            paths.append(it.key());
    }
    paths.sort();
    return paths;
}

QVariantMap BluezClient::cachedProperties(const QString& path, const QString& interface) const
{
    return objects_.value(path).value(interface);
}

bool BluezClient::exportObject(const QString& path, QObject* object)
{
    if (!systemBus_.registerObject(path, object, QDBusConnection::ExportAllSlots)) {
        qWarning() << "[BluezClient] Failed to export" << path << ":" << systemBus_.lastError().message();
        return false;
    }
    return true;
}

void BluezClient::unexportObject(const QString& path)
{
    systemBus_.unregisterObject(path);
}

} // namespace bcore
