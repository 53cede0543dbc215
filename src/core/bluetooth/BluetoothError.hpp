#pragma once

#include <QDateTime>
#include <QMetaType>
#include <QString>
#include <functional>

namespace bcore {

enum class ErrorCategory {
    Adapter,
    Device,
    Pairing,
    Connection,
    Transfer,
    Transport,   // bus or daemon unavailable
    Permission,  // policy denial
    Timeout,
    Unknown
};

/// Classified failure produced by every error path in the core.
/// A default-constructed error is "no error": isValid() is false.
struct BluetoothError {
    ErrorCategory category = ErrorCategory::Unknown;
    QString code;
    QString message;
    QString details;
    QString recoverySuggestion;
    QDateTime occurred;

    BluetoothError() = default;
    BluetoothError(ErrorCategory category, const QString& code,
                   const QString& message, const QString& details = {});

    bool isValid() const { return !code.isEmpty(); }
    bool isRecoverable() const;
    QString categoryName() const;

    /// Message, details and suggestion joined for display.
    QString userMessage() const;

    static BluetoothError timeout(const QString& operation);
    static BluetoothError serviceUnavailable();
    static BluetoothError permissionDenied(const QString& operation);
    static BluetoothError precondition(ErrorCategory category, const QString& message);
    static BluetoothError invalidArgument(ErrorCategory category, const QString& message);
    static BluetoothError notFound(ErrorCategory category, const QString& message);
    static BluetoothError cancelled(ErrorCategory category, const QString& message);

    static QString suggestionFor(ErrorCategory category);
};

/// Completion for operations without a result; an invalid error means success.
using Completion = std::function<void(const BluetoothError& error)>;

QString toString(ErrorCategory category);

} // namespace bcore

Q_DECLARE_METATYPE(bcore::BluetoothError)
