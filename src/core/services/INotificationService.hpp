#pragma once

#include <QVariantMap>
#include <QString>

namespace bcore {

class INotificationService {
public:
    virtual ~INotificationService() = default;

    /// Post a notification. Required fields: kind, title, message.
    /// Optional: devicePath, priority (0-100), ttlMs (0 = persistent).
    /// Returns notification ID.
    virtual QString post(const QVariantMap& notification) = 0;

    /// Dismiss a notification by ID.
    virtual void dismiss(const QString& notificationId) = 0;

    /// Dismiss everything posted about @p devicePath.
    virtual void dismissForDevice(const QString& devicePath) = 0;
};

} // namespace bcore
