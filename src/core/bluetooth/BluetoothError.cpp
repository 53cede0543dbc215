#include "BluetoothError.hpp"

namespace bcore {

BluetoothError::BluetoothError(ErrorCategory category, const QString& code,
                               const QString& message, const QString& details)
    : category(category)
    , code(code)
    , message(message)
    , details(details)
    , recoverySuggestion(suggestionFor(category))
    , occurred(QDateTime::currentDateTime())
{
}

bool BluetoothError::isRecoverable() const
{
    switch (category) {
    case ErrorCategory::Timeout:
    case ErrorCategory::Connection:
    case ErrorCategory::Device:
    case ErrorCategory::Adapter:
    case ErrorCategory::Pairing:
    case ErrorCategory::Transfer:
        return true;
    case ErrorCategory::Permission:
    case ErrorCategory::Transport:
    case ErrorCategory::Unknown:
        return false;
    }
    return false;
}

QString BluetoothError::categoryName() const
{
    switch (category) {
    case ErrorCategory::Adapter: return QStringLiteral("Adapter Error");
    case ErrorCategory::Device: return QStringLiteral("Device Error");
    case ErrorCategory::Pairing: return QStringLiteral("Pairing Error");
    case ErrorCategory::Connection: return QStringLiteral("Connection Error");
    case ErrorCategory::Transfer: return QStringLiteral("Transfer Error");
    case ErrorCategory::Transport: return QStringLiteral("Service Error");
    case ErrorCategory::Permission: return QStringLiteral("Permission Error");
    case ErrorCategory::Timeout: return QStringLiteral("Timeout Error");
    case ErrorCategory::Unknown: break;
    }
    return QStringLiteral("Unknown Error");
}

QString BluetoothError::userMessage() const
{
    QString text = message;
    if (!details.isEmpty())
        text += QStringLiteral("\n\n") + details;
    if (!recoverySuggestion.isEmpty())
        text += QStringLiteral("\n\nSuggestion: ") + recoverySuggestion;
    return text;
}

QString BluetoothError::suggestionFor(ErrorCategory category)
{
    switch (category) {
    case ErrorCategory::Adapter:
        return QStringLiteral("Check that your Bluetooth adapter is properly connected and powered on.");
    case ErrorCategory::Device:
        return QStringLiteral("Ensure the device is powered on, in range, and not connected to another system.");
    case ErrorCategory::Pairing:
        return QStringLiteral("Try pairing again. Make sure the device is in pairing mode and the PIN/passkey is correct.");
    case ErrorCategory::Connection:
        return QStringLiteral("Verify the device is paired and powered on. Try removing and re-pairing the device.");
    case ErrorCategory::Transfer:
        return QStringLiteral("Check that both devices have sufficient storage space and the file is accessible.");
    case ErrorCategory::Transport:
        return QStringLiteral("The Bluetooth service may not be running. Try restarting the bluetooth.service.");
    case ErrorCategory::Permission:
        return QStringLiteral("You don't have permission to perform this operation. Contact your system administrator.");
    case ErrorCategory::Timeout:
        return QStringLiteral("The operation took too long. Check the device is responsive and try again.");
    case ErrorCategory::Unknown:
        break;
    }
    return QStringLiteral("Try the operation again. If the problem persists, restart Bluetooth or your system.");
}

BluetoothError BluetoothError::timeout(const QString& operation)
{
    return BluetoothError(ErrorCategory::Timeout, QStringLiteral("TIMEOUT"),
                          QStringLiteral("Operation timed out: %1").arg(operation),
                          QStringLiteral("The operation did not complete within the expected time."));
}

BluetoothError BluetoothError::serviceUnavailable()
{
    return BluetoothError(ErrorCategory::Transport, QStringLiteral("SERVICE_UNAVAILABLE"),
                          QStringLiteral("Bluetooth service is not available"),
                          QStringLiteral("The BlueZ daemon is not running or not accessible."));
}

BluetoothError BluetoothError::permissionDenied(const QString& operation)
{
    return BluetoothError(ErrorCategory::Permission, QStringLiteral("PERMISSION_DENIED"),
                          QStringLiteral("Permission denied: %1").arg(operation),
                          QStringLiteral("You don't have the required permissions to perform this operation."));
}

BluetoothError BluetoothError::precondition(ErrorCategory category, const QString& message)
{
    return BluetoothError(category, QStringLiteral("PRECONDITION_FAILED"), message);
}

BluetoothError BluetoothError::invalidArgument(ErrorCategory category, const QString& message)
{
    return BluetoothError(category, QStringLiteral("INVALID_ARGUMENT"), message);
}

BluetoothError BluetoothError::notFound(ErrorCategory category, const QString& message)
{
    return BluetoothError(category, QStringLiteral("NOT_FOUND"), message);
}

BluetoothError BluetoothError::cancelled(ErrorCategory category, const QString& message)
{
    return BluetoothError(category, QStringLiteral("CANCELLED"), message);
}

QString toString(ErrorCategory category)
{
    switch (category) {
    case ErrorCategory::Adapter: return QStringLiteral("adapter");
    case ErrorCategory::Device: return QStringLiteral("device");
    case ErrorCategory::Pairing: return QStringLiteral("pairing");
    case ErrorCategory::Connection: return QStringLiteral("connection");
    case ErrorCategory::Transfer: return QStringLiteral("transfer");
    case ErrorCategory::Transport: return QStringLiteral("transport");
    case ErrorCategory::Permission: return QStringLiteral("permission");
    case ErrorCategory::Timeout: return QStringLiteral("timeout");
    case ErrorCategory::Unknown: break;
    }
    return QStringLiteral("unknown");
}

} // namespace bcore
