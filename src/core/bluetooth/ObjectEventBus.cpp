#include "ObjectEventBus.hpp"
#include <algorithm>

namespace bcore {

int ObjectEventBus::subscribe(const QString& interface, Callback callback)
{
    int id = nextId_++;
    subscriptions_[id] = {interface, std::move(callback)};
    interfaceIndex_.insert(interface, id);
    return id;
}

void ObjectEventBus::unsubscribe(int subscriptionId)
{
    auto it = subscriptions_.find(subscriptionId);
    if (it == subscriptions_.end()) return;
    interfaceIndex_.remove(it->interface, subscriptionId);
    subscriptions_.erase(it);
}

void ObjectEventBus::publish(const ObjectEvent& event)
{
    QList<int> ids = interfaceIndex_.values(event.interface);
    if (!event.interface.isEmpty())
        ids += interfaceIndex_.values(QString());
    // Subscription order, not hash order
    std::sort(ids.begin(), ids.end());

    for (int id : ids) {
        // A callback may unsubscribe itself or others
        auto it = subscriptions_.find(id);
        if (it == subscriptions_.end()) continue;
        auto cb = it->callback;
        cb(event);
    }
}

} // namespace bcore
