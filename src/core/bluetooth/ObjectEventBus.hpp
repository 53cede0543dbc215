#pragma once

#include <QHash>
#include <QMultiHash>
#include <QString>
#include <QStringList>
#include <QVariantMap>
#include <functional>

namespace bcore {

struct ObjectEvent {
    enum class Kind {
        ObjectAdded,       // an interface appeared on a path
        ObjectRemoved,     // an interface disappeared from a path
        PropertiesChanged
    };

    Kind kind = Kind::PropertiesChanged;
    QString path;
    QString interface;
    QVariantMap changed;       // full property set for ObjectAdded
    QStringList invalidated;
};

/// Fan-out channel for normalized bus events. The transport publishes once,
/// each manager subscribes to the interfaces it cares about.
/// Delivery is synchronous on the calling (event loop) thread.
class ObjectEventBus {
public:
    using Callback = std::function<void(const ObjectEvent& event)>;

    /// Subscribe to events for one interface name. An empty name receives
    /// events for every interface. Returns a subscription ID for unsubscribe.
    int subscribe(const QString& interface, Callback callback);
    void unsubscribe(int subscriptionId);

    void publish(const ObjectEvent& event);

    int subscriberCount() const { return subscriptions_.size(); }

private:
    struct Subscription {
        QString interface;
        Callback callback;
    };

    int nextId_ = 1;
    QHash<int, Subscription> subscriptions_;
    QMultiHash<QString, int> interfaceIndex_;
};

} // namespace bcore
