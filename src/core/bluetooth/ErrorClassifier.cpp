#include "ErrorClassifier.hpp"
#include <QHash>

namespace bcore {

namespace {

const QString BLUEZ_ERROR_PREFIX = QStringLiteral("org.bluez.error.");
const QString OBEX_ERROR_PREFIX = QStringLiteral("org.bluez.obex.error.");
const QString DBUS_ERROR_PREFIX = QStringLiteral("org.freedesktop.dbus.error.");

struct NamedError {
    ErrorCategory category;
    const char* text;
};

// Keyed by the lower-cased last component of an org.bluez.Error.* name
const QHash<QString, NamedError>& bluezErrors()
{
    static const QHash<QString, NamedError> table = {
        {QStringLiteral("authenticationfailed"), {ErrorCategory::Pairing, "Authentication failed"}},
        {QStringLiteral("authenticationcanceled"), {ErrorCategory::Pairing, "Authentication was canceled"}},
        {QStringLiteral("authenticationrejected"), {ErrorCategory::Pairing, "Authentication was rejected"}},
        {QStringLiteral("authenticationtimeout"), {ErrorCategory::Pairing, "Authentication timed out"}},
        {QStringLiteral("rejected"), {ErrorCategory::Pairing, "Authentication was rejected"}},
        {QStringLiteral("canceled"), {ErrorCategory::Pairing, "Authentication was canceled"}},
        {QStringLiteral("alreadyconnected"), {ErrorCategory::Connection, "Device is already connected"}},
        {QStringLiteral("notconnected"), {ErrorCategory::Connection, "Device is not connected"}},
        {QStringLiteral("connectionattemptfailed"), {ErrorCategory::Connection, "Connection attempt failed"}},
        {QStringLiteral("notavailable"), {ErrorCategory::Device, "Device is not available"}},
        {QStringLiteral("doesnotexist"), {ErrorCategory::Device, "Device does not exist"}},
        {QStringLiteral("invalidarguments"), {ErrorCategory::Device, "Invalid arguments"}},
        {QStringLiteral("notsupported"), {ErrorCategory::Device, "Operation not supported"}},
        {QStringLiteral("inprogress"), {ErrorCategory::Device, "Operation already in progress"}},
        {QStringLiteral("alreadyexists"), {ErrorCategory::Device, "Object already exists"}},
        {QStringLiteral("notready"), {ErrorCategory::Adapter, "Bluetooth adapter is not ready"}},
        {QStringLiteral("notauthorized"), {ErrorCategory::Permission, "Operation not authorized"}},
        {QStringLiteral("notpermitted"), {ErrorCategory::Permission, "Operation not authorized"}},
    };
    return table;
}

// Keyed by the lower-cased last component of an org.freedesktop.DBus.Error.* name
const QHash<QString, NamedError>& dbusErrors()
{
    static const QHash<QString, NamedError> table = {
        {QStringLiteral("timeout"), {ErrorCategory::Timeout, "Operation timed out"}},
        {QStringLiteral("timedout"), {ErrorCategory::Timeout, "Operation timed out"}},
        {QStringLiteral("noreply"), {ErrorCategory::Timeout, "Operation timed out"}},
        {QStringLiteral("serviceunknown"), {ErrorCategory::Transport, "Bluetooth service is not available"}},
        {QStringLiteral("namehasnoowner"), {ErrorCategory::Transport, "Bluetooth service is not available"}},
        {QStringLiteral("noserver"), {ErrorCategory::Transport, "Bluetooth service is not available"}},
        {QStringLiteral("disconnected"), {ErrorCategory::Transport, "Bluetooth service is not available"}},
        {QStringLiteral("accessdenied"), {ErrorCategory::Permission, "Permission denied"}},
        {QStringLiteral("authfailed"), {ErrorCategory::Permission, "Permission denied"}},
        {QStringLiteral("interactiveauthorizationrequired"), {ErrorCategory::Permission, "Permission denied"}},
        {QStringLiteral("unknownobject"), {ErrorCategory::Device, "Resource not found"}},
        {QStringLiteral("unknownmethod"), {ErrorCategory::Device, "Resource not found"}},
        {QStringLiteral("unknowninterface"), {ErrorCategory::Device, "Resource not found"}},
        {QStringLiteral("unknownproperty"), {ErrorCategory::Device, "Resource not found"}},
    };
    return table;
}

ErrorCategory categorizeByMessage(const QString& errorMessage)
{
    const QString msg = errorMessage.toLower();
    if (msg.isEmpty())
        return ErrorCategory::Unknown;

    if (msg.contains(QLatin1String("timeout")) || msg.contains(QLatin1String("timed out")))
        return ErrorCategory::Timeout;
    if (msg.contains(QLatin1String("service unknown")) || msg.contains(QLatin1String("name has no owner")))
        return ErrorCategory::Transport;
    if (msg.contains(QLatin1String("permission")) || msg.contains(QLatin1String("access denied")))
        return ErrorCategory::Permission;
    if (msg.contains(QLatin1String("pair")) || msg.contains(QLatin1String("bond"))
        || msg.contains(QLatin1String("authentication")))
        return ErrorCategory::Pairing;
    if (msg.contains(QLatin1String("connect")))
        return ErrorCategory::Connection;
    if (msg.contains(QLatin1String("adapter")) || msg.contains(QLatin1String("power")))
        return ErrorCategory::Adapter;
    if (msg.contains(QLatin1String("transfer")) || msg.contains(QLatin1String("obex")))
        return ErrorCategory::Transfer;
    if (msg.contains(QLatin1String("not found")) || msg.contains(QLatin1String("does not exist")))
        return ErrorCategory::Device;
    return ErrorCategory::Unknown;
}

QString lastComponent(const QString& errorName)
{
    return errorName.section('.', -1);
}

} // namespace

ErrorCategory categorizeError(const QString& errorName, const QString& errorMessage)
{
    const QString name = errorName.toLower();

    if (name.startsWith(OBEX_ERROR_PREFIX))
        return ErrorCategory::Transfer;

    if (name.startsWith(BLUEZ_ERROR_PREFIX)) {
        const QString key = lastComponent(name);
        auto it = bluezErrors().constFind(key);
        if (it != bluezErrors().constEnd())
            return it->category;
        // org.bluez.Error.Failed carries its meaning in the message text
        const ErrorCategory fromMessage = categorizeByMessage(errorMessage);
        if (fromMessage != ErrorCategory::Unknown)
            return fromMessage;
        return key == QLatin1String("failed") ? ErrorCategory::Device : ErrorCategory::Unknown;
    }

    if (name.startsWith(DBUS_ERROR_PREFIX)) {
        auto it = dbusErrors().constFind(lastComponent(name));
        if (it != dbusErrors().constEnd())
            return it->category;
        const ErrorCategory fromMessage = categorizeByMessage(errorMessage);
        return fromMessage != ErrorCategory::Unknown ? fromMessage : ErrorCategory::Transport;
    }

    return categorizeByMessage(errorMessage);
}

QString errorCodeFor(const QString& errorName)
{
    if (errorName.isEmpty())
        return QStringLiteral("BLUEZ_ERROR");
    return lastComponent(errorName).toUpper();
}

QString friendlyMessageFor(const QString& errorName, const QString& errorMessage)
{
    const QString name = errorName.toLower();
    const QString key = lastComponent(name);

    if (name.startsWith(BLUEZ_ERROR_PREFIX)) {
        auto it = bluezErrors().constFind(key);
        if (it != bluezErrors().constEnd())
            return QString::fromLatin1(it->text);
    } else if (name.startsWith(DBUS_ERROR_PREFIX)) {
        auto it = dbusErrors().constFind(key);
        if (it != dbusErrors().constEnd())
            return QString::fromLatin1(it->text);
    } else if (name.startsWith(OBEX_ERROR_PREFIX)) {
        return QStringLiteral("File transfer failed");
    }

    const QString msg = errorMessage.toLower();
    if (msg.contains(QLatin1String("timeout")) || msg.contains(QLatin1String("timed out")))
        return QStringLiteral("Operation timed out");
    if (msg.contains(QLatin1String("not found")))
        return QStringLiteral("Resource not found");
    if (msg.contains(QLatin1String("permission")) || msg.contains(QLatin1String("access denied")))
        return QStringLiteral("Permission denied");
    if (msg.contains(QLatin1String("service unknown")) || msg.contains(QLatin1String("name has no owner")))
        return QStringLiteral("Bluetooth service is not available");
    return QStringLiteral("Bluetooth operation failed");
}

BluetoothError classifyError(const QString& errorName, const QString& errorMessage,
                             const QString& operation, ErrorCategory fallback)
{
    QString message = friendlyMessageFor(errorName, errorMessage);
    if (!operation.isEmpty())
        message = QStringLiteral("%1 failed: %2").arg(operation, message);

    ErrorCategory category = categorizeError(errorName, errorMessage);
    if (category == ErrorCategory::Unknown)
        category = fallback;
    return BluetoothError(category, errorCodeFor(errorName), message, errorMessage);
}

BluetoothError classifyDBusError(const QDBusError& error, const QString& operation,
                                 ErrorCategory fallback)
{
    // Local call deadlines surface with a generic name on some Qt versions
    if (error.type() == QDBusError::Timeout || error.type() == QDBusError::NoReply
        || error.type() == QDBusError::TimedOut) {
        BluetoothError timeoutError = BluetoothError::timeout(
            operation.isEmpty() ? QStringLiteral("remote call") : operation);
        timeoutError.details = error.message();
        return timeoutError;
    }
    return classifyError(error.name(), error.message(), operation, fallback);
}

} // namespace bcore
