#pragma once

#include "BluetoothError.hpp"
#include <QDateTime>
#include <QHash>
#include <QList>
#include <QObject>
#include <QTimer>

class QDBusError;

namespace bcore {

/// Collects every classified failure: keeps a bounded history plus a table of
/// still-active errors, writes diagnostics and decides which errors reach the user.
class ErrorHandler : public QObject {
    Q_OBJECT
public:
    static constexpr int MaxHistory = 100;
    static constexpr qint64 ActiveErrorExpiryMs = 30 * 60 * 1000;
    static constexpr int CleanupIntervalMs = 5 * 60 * 1000;

    explicit ErrorHandler(QObject* parent = nullptr);

    /// Records @p error and returns the id it is tracked under.
    QString report(const BluetoothError& error);

    /// Classifies a remote failure, records it and returns it.
    BluetoothError handleDBusError(const QDBusError& error, const QString& operation = {});

    QList<BluetoothError> history() const { return history_; }
    BluetoothError mostRecent() const;
    QHash<QString, BluetoothError> activeErrors() const;
    int countByCategory(ErrorCategory category) const;

    void markResolved(const QString& errorId);
    void clearAll();

    /// Drops active errors older than ActiveErrorExpiryMs.
    void purgeExpired();

    static bool shouldNotifyUser(const BluetoothError& error);

signals:
    void errorOccurred(const bcore::BluetoothError& error);
    void userNotificationRequired(const bcore::BluetoothError& error);
    void errorResolved(const QString& errorId);

private:
    struct ActiveError {
        BluetoothError error;
        QDateTime recorded;
    };

    void logDiagnostics(const BluetoothError& error) const;

    QList<BluetoothError> history_;
    QHash<QString, ActiveError> active_;
    QTimer cleanupTimer_;
    quint64 nextId_ = 1;
};

} // namespace bcore
