#pragma once

#include "INotificationService.hpp"
#include <QObject>
#include <QList>

namespace bcore {

struct Notification {
    QString id;
    QString kind;       // "device_connected", "pairing", "transfer", "error", ...
    QString title;
    QString message;
    QString devicePath;
    int priority = 50;
    int ttlMs = 0;      // 0 = persistent until dismissed
};

/// In-app notification queue. Posting with a TTL schedules the dismissal.
/// A device keeps at most one entry per kind: reposting replaces the old one.
/// When the queue is full the lowest priority entry is evicted, oldest first.
class NotificationService : public QObject, public INotificationService {
    Q_OBJECT
public:
    static constexpr int MaxActive = 20;

    explicit NotificationService(QObject* parent = nullptr);

    QString post(const QVariantMap& notification) override;
    void dismiss(const QString& notificationId) override;
    void dismissForDevice(const QString& devicePath) override;
    void dismissAll();

    QList<Notification> active() const { return notifications_; }

signals:
    void notificationAdded(const bcore::Notification& n);
    void notificationRemoved(const QString& id);

private:
    int indexOf(const QString& kind, const QString& devicePath) const;
    int evictionCandidate() const;

    QList<Notification> notifications_;
};

} // namespace bcore

Q_DECLARE_METATYPE(bcore::Notification)
