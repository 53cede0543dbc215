#include "ErrorHandler.hpp"
#include "ErrorClassifier.hpp"
#include <QDBusError>
#include <boost/log/trivial.hpp>

namespace bcore {

ErrorHandler::ErrorHandler(QObject* parent)
    : QObject(parent)
{
    cleanupTimer_.setInterval(CleanupIntervalMs);
    connect(&cleanupTimer_, &QTimer::timeout, this, &ErrorHandler::purgeExpired);
    cleanupTimer_.start();
}

QString ErrorHandler::report(const BluetoothError& error)
{
    const QString id = QStringLiteral("bt_err_%1_%2")
        .arg(toString(error.category))
        .arg(nextId_++);

    history_.append(error);
    while (history_.size() > MaxHistory)
        history_.removeFirst();

    active_.insert(id, {error, QDateTime::currentDateTime()});

    logDiagnostics(error);
    emit errorOccurred(error);
    if (shouldNotifyUser(error))
        emit userNotificationRequired(error);
    return id;
}

BluetoothError ErrorHandler::handleDBusError(const QDBusError& error, const QString& operation)
{
    BluetoothError classified = classifyDBusError(error, operation);
    report(classified);
    return classified;
}

BluetoothError ErrorHandler::mostRecent() const
{
    if (history_.isEmpty())
        return {};
    return history_.last();
}

QHash<QString, BluetoothError> ErrorHandler::activeErrors() const
{
    QHash<QString, BluetoothError> result;
    for (auto it = active_.constBegin(); it != active_.constEnd(); ++it)
        result.insert(it.key(), it->error);
    return result;
}

int ErrorHandler::countByCategory(ErrorCategory category) const
{
    int count = 0;
    for (const auto& e : history_) {
        if (e.category == category)
            ++count;
    }
    return count;
}

void ErrorHandler::markResolved(const QString& errorId)
{
    if (active_.remove(errorId) > 0)
        emit errorResolved(errorId);
}

void ErrorHandler::clearAll()
{
    history_.clear();
    active_.clear();
}

void ErrorHandler::purgeExpired()
{
    const QDateTime now = QDateTime::currentDateTime();
    for (auto it = active_.begin(); it != active_.end();) {
        if (it->recorded.msecsTo(now) > ActiveErrorExpiryMs)
            it = active_.erase(it);
        else
            ++it;
    }
}

bool ErrorHandler::shouldNotifyUser(const BluetoothError& error)
{
    switch (error.category) {
    case ErrorCategory::Transport:
    case ErrorCategory::Permission:
    case ErrorCategory::Adapter:
    case ErrorCategory::Pairing:
    case ErrorCategory::Connection:
    case ErrorCategory::Transfer:
    case ErrorCategory::Timeout:
        return true;
    case ErrorCategory::Device:
        // Routine lookups of vanished devices are not worth a popup
        return error.code != QLatin1String("NOT_FOUND")
            && !error.message.contains(QLatin1String("not found"), Qt::CaseInsensitive);
    case ErrorCategory::Unknown:
        break;
    }
    return false;
}

void ErrorHandler::logDiagnostics(const BluetoothError& error) const
{
    std::string line = "[ErrorHandler] " + error.message.toStdString()
        + " | category: " + toString(error.category).toStdString()
        + " | code: " + error.code.toStdString();
    if (!error.details.isEmpty())
        line += " | details: " + error.details.toStdString();

    switch (error.category) {
    case ErrorCategory::Transport:
    case ErrorCategory::Permission:
        BOOST_LOG_TRIVIAL(warning) << line;
        break;
    case ErrorCategory::Adapter:
    case ErrorCategory::Connection:
        BOOST_LOG_TRIVIAL(info) << line;
        break;
    default:
        BOOST_LOG_TRIVIAL(debug) << line;
        break;
    }
}

} // namespace bcore
