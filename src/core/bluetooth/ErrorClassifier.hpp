#pragma once

#include "BluetoothError.hpp"
#include <QDBusError>

namespace bcore {

// Maps remote failures onto the error taxonomy. The structured error name
// (org.bluez.Error.*, org.freedesktop.DBus.Error.*, org.bluez.obex.Error.*)
// is the primary key; message substrings are only consulted when the name
// is absent or not recognised. Anything unmatched is Unknown.

ErrorCategory categorizeError(const QString& errorName, const QString& errorMessage);

/// "org.bluez.Error.AlreadyConnected" -> "ALREADYCONNECTED", "BLUEZ_ERROR" when no name.
QString errorCodeFor(const QString& errorName);

/// Short human-readable text for a remote error, e.g. "Authentication failed".
QString friendlyMessageFor(const QString& errorName, const QString& errorMessage);

/// Builds a classified error. When @p operation is set the message reads
/// "<operation> failed: <friendly text>". The raw remote message goes into details.
/// @p fallback replaces Unknown when the caller knows which entity failed.
BluetoothError classifyError(const QString& errorName, const QString& errorMessage,
                             const QString& operation = {},
                             ErrorCategory fallback = ErrorCategory::Unknown);
BluetoothError classifyDBusError(const QDBusError& error, const QString& operation = {},
                                 ErrorCategory fallback = ErrorCategory::Unknown);

} // namespace bcore
