#include "NotificationService.hpp"
#include <QStringList>
#include <QTimer>
#include <QUuid>

namespace bcore {

NotificationService::NotificationService(QObject* parent) : QObject(parent) {}

QString NotificationService::post(const QVariantMap& data)
{
    Notification n;
    n.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    n.kind = data.value("kind").toString();
    n.title = data.value("title").toString();
    n.message = data.value("message").toString();
    n.devicePath = data.value("devicePath").toString();
    n.priority = qBound(0, data.value("priority", 50).toInt(), 100);
    n.ttlMs = data.value("ttlMs", 0).toInt();

    if (!n.devicePath.isEmpty()) {
        int existing = indexOf(n.kind, n.devicePath);
        if (existing >= 0)
            dismiss(notifications_.at(existing).id);
    }

    while (notifications_.size() >= MaxActive)
        dismiss(notifications_.at(evictionCandidate()).id);

    notifications_.append(n);
    emit notificationAdded(n);

    if (n.ttlMs > 0) {
        QString id = n.id;
        QTimer::singleShot(n.ttlMs, this, [this, id]() { dismiss(id); });
    }

    return n.id;
}

void NotificationService::dismiss(const QString& notificationId)
{
    for (int i = 0; i < notifications_.size(); ++i) {
        if (notifications_[i].id == notificationId) {
            notifications_.removeAt(i);
            emit notificationRemoved(notificationId);
            return;
        }
    }
}

void NotificationService::dismissForDevice(const QString& devicePath)
{
    if (devicePath.isEmpty()) return;
    QStringList ids;
    for (const auto& n : notifications_) {
        if (n.devicePath == devicePath)
            ids.append(n.id);
    }
    for (const auto& id : ids)
        dismiss(id);
}

void NotificationService::dismissAll()
{
    while (!notifications_.isEmpty())
        dismiss(notifications_.first().id);
}

int NotificationService::indexOf(const QString& kind, const QString& devicePath) const
{
    for (int i = 0; i < notifications_.size(); ++i) {
        if (notifications_[i].kind == kind && notifications_[i].devicePath == devicePath)
            return i;
    }
    return -1;
}

int NotificationService::evictionCandidate() const
{
    // Strict comparison keeps the oldest of equal priority
    int candidate = 0;
    for (int i = 1; i < notifications_.size(); ++i) {
        if (notifications_[i].priority < notifications_[candidate].priority)
            candidate = i;
    }
    return candidate;
}

} // namespace bcore
