#include "BluetoothTypes.hpp"
#include <QDBusObjectPath>

namespace bcore {

// --- BluetoothAdapter ---

QString BluetoothAdapter::displayName() const
{
    if (!alias.isEmpty()) return alias;
    if (!name.isEmpty()) return name;
    return address;
}

QString BluetoothAdapter::statusText() const
{
    if (!powered) return QStringLiteral("Off");
    if (discovering) return QStringLiteral("Scanning...");
    if (connectedDeviceCount > 0) {
        return QStringLiteral("%1 device%2 connected")
            .arg(connectedDeviceCount)
            .arg(connectedDeviceCount == 1 ? QString() : QStringLiteral("s"));
    }
    return QStringLiteral("On");
}

// --- BluetoothDevice ---

QString BluetoothDevice::displayName() const
{
    if (!alias.isEmpty()) return alias;
    if (!name.isEmpty()) return name;
    return address;
}

bool BluetoothDevice::hasAudioProfile() const
{
    static const QStringList audioUuids = {
        A2DP_SINK_UUID, A2DP_SOURCE_UUID, AVRCP_UUID, HFP_UUID, HSP_UUID
    };
    for (const auto& uuid : uuids) {
        if (audioUuids.contains(uuid.toLower()))
            return true;
    }
    return false;
}

bool BluetoothDevice::hasInputProfile() const
{
    return uuids.contains(HID_UUID, Qt::CaseInsensitive);
}

bool BluetoothDevice::supportsFileTransfer() const
{
    return uuids.contains(OBEX_PUSH_UUID, Qt::CaseInsensitive);
}

void BluetoothDevice::updateSignalStrength()
{
    if (rssi > -50) signalStrength = SignalStrength::Excellent;
    else if (rssi > -60) signalStrength = SignalStrength::Good;
    else if (rssi > -70) signalStrength = SignalStrength::Fair;
    else if (rssi > -80) signalStrength = SignalStrength::Weak;
    else signalStrength = SignalStrength::VeryWeak;
}

void BluetoothDevice::updateConnectionState()
{
    connectionState = connected ? ConnectionState::Connected : ConnectionState::Disconnected;
}

void BluetoothDevice::updateCategory()
{
    if (hasAudioProfile()) {
        category = DeviceCategory::Audio;
    } else if (hasInputProfile()) {
        category = DeviceCategory::Input;
    } else if (icon.contains(QLatin1String("phone"))) {
        category = DeviceCategory::Phone;
    } else if (icon.contains(QLatin1String("computer"))) {
        category = DeviceCategory::Computer;
    } else if (icon.contains(QLatin1String("printer")) || icon.contains(QLatin1String("scanner"))) {
        category = DeviceCategory::Peripheral;
    } else if (icon.contains(QLatin1String("watch"))) {
        category = DeviceCategory::Wearable;
    } else if (icon.startsWith(QLatin1String("audio"))) {
        category = DeviceCategory::Audio;
    } else if (icon.startsWith(QLatin1String("input"))) {
        category = DeviceCategory::Input;
    } else {
        category = DeviceCategory::Unknown;
    }
}

QStringList BluetoothDevice::applyProperties(const QVariantMap& properties)
{
    QStringList applied;
    if (adapterPath.isEmpty())
        adapterPath = adapterPathFor(objectPath);

    for (auto it = properties.constBegin(); it != properties.constEnd(); ++it) {
        const QString& key = it.key();
        const QVariant& v = it.value();
        if (key == "Address") address = v.toString();
        else if (key == "Alias") alias = v.toString();
        else if (key == "Name") name = v.toString();
        else if (key == "Icon") icon = v.toString();
        else if (key == "Modalias") modalias = v.toString();
        else if (key == "Class") deviceClass = v.toUInt();
        else if (key == "Appearance") appearance = static_cast<uint16_t>(v.toUInt());
        else if (key == "UUIDs") uuids = v.toStringList();
        else if (key == "Paired") paired = v.toBool();
        else if (key == "Connected") connected = v.toBool();
        else if (key == "Trusted") trusted = v.toBool();
        else if (key == "Blocked") blocked = v.toBool();
        else if (key == "ServicesResolved") servicesResolved = v.toBool();
        else if (key == "RSSI") rssi = static_cast<int16_t>(v.toInt());
        else if (key == "TxPower") txPower = static_cast<int8_t>(v.toInt());
        else if (key == "BatteryPercentage") batteryPercentage = static_cast<int>(v.toUInt());
        else if (key == "Adapter") adapterPath = v.value<QDBusObjectPath>().path();
        else continue;
        applied.append(key);
    }

    updateSignalStrength();
    updateConnectionState();
    updateCategory();
    lastSeen = QDateTime::currentDateTime();
    return applied;
}

QString BluetoothDevice::adapterPathFor(const QString& devicePath)
{
    // Leading '/' yields an empty first section
    const QStringList parts = devicePath.split('/');
    if (parts.size() < 4)
        return {};
    return parts.mid(0, 4).join('/');
}

// --- FileTransfer ---

double FileTransfer::progressPercentage() const
{
    if (size == 0)
        return 0.0;
    return (static_cast<double>(transferred) / static_cast<double>(size)) * 100.0;
}

quint64 FileTransfer::bytesPerSecond() const
{
    const QDateTime end = completed.isValid() ? completed : QDateTime::currentDateTime();
    const qint64 elapsedMs = started.msecsTo(end);
    if (elapsedMs <= 0)
        return 0;
    return static_cast<quint64>(static_cast<double>(transferred) * 1000.0 / elapsedMs);
}

qint64 FileTransfer::estimatedSecondsRemaining() const
{
    const quint64 speed = bytesPerSecond();
    if (speed == 0 || transferred >= size)
        return 0;
    return static_cast<qint64>((size - transferred) / speed);
}

bool FileTransfer::updateProgress(quint64 newTransferred)
{
    if (newTransferred <= transferred)
        return false;
    transferred = newTransferred;
    if (size > 0 && transferred >= size && !completed.isValid())
        completed = QDateTime::currentDateTime();
    return true;
}

QString FileTransfer::statusText() const
{
    switch (status) {
    case TransferStatus::Queued: return QStringLiteral("Queued");
    case TransferStatus::Active: return QStringLiteral("Transferring");
    case TransferStatus::Suspended: return QStringLiteral("Paused");
    case TransferStatus::Complete: return QStringLiteral("Complete");
    case TransferStatus::Error: return QStringLiteral("Failed");
    }
    return QStringLiteral("Unknown");
}

QString FileTransfer::progressText() const
{
    const double transferredMb = static_cast<double>(transferred) / (1024.0 * 1024.0);
    const double sizeMb = static_cast<double>(size) / (1024.0 * 1024.0);

    if (status == TransferStatus::Complete)
        return QStringLiteral("%1 MB").arg(sizeMb, 0, 'f', 1);

    const quint64 speed = bytesPerSecond();
    if (speed > 0) {
        return QStringLiteral("%1 / %2 MB (%3 KB/s)")
            .arg(transferredMb, 0, 'f', 1)
            .arg(sizeMb, 0, 'f', 1)
            .arg(static_cast<double>(speed) / 1024.0, 0, 'f', 0);
    }
    return QStringLiteral("%1 / %2 MB").arg(transferredMb, 0, 'f', 1).arg(sizeMb, 0, 'f', 1);
}

QString FileTransfer::formatTimeSpan(qint64 seconds)
{
    if (seconds < 60)
        return QStringLiteral("%1 sec").arg(seconds);
    qint64 minutes = seconds / 60;
    if (minutes < 60)
        return QStringLiteral("%1 min").arg(minutes);
    const qint64 hours = minutes / 60;
    minutes %= 60;
    return QStringLiteral("%1:%2 hr").arg(hours).arg(minutes, 2, 10, QChar('0'));
}

TransferStatus FileTransfer::parseStatus(const QString& status)
{
    const QString s = status.toLower();
    if (s == QLatin1String("active")) return TransferStatus::Active;
    if (s == QLatin1String("suspended")) return TransferStatus::Suspended;
    if (s == QLatin1String("complete")) return TransferStatus::Complete;
    if (s == QLatin1String("error")) return TransferStatus::Error;
    return TransferStatus::Queued;
}

// --- PairingRequest ---

QString PairingRequest::promptText() const
{
    const QString key = QStringLiteral("%1").arg(passkey, 6, 10, QChar('0'));
    switch (method) {
    case PairingMethod::PinCode:
        return QStringLiteral("Enter PIN code to pair with %1").arg(deviceName);
    case PairingMethod::PasskeyEntry:
        return QStringLiteral("Enter the passkey displayed on %1").arg(deviceName);
    case PairingMethod::PasskeyDisplay:
        if (!pinCode.isEmpty())
            return QStringLiteral("Enter PIN %1 on %2").arg(pinCode, deviceName);
        return QStringLiteral("Confirm this passkey is displayed on %1:\n%2").arg(deviceName, key);
    case PairingMethod::PasskeyConfirmation:
        return QStringLiteral("Does %1 show passkey %2?").arg(deviceName, key);
    case PairingMethod::Authorization:
        return QStringLiteral("Authorize pairing with %1?").arg(deviceName);
    case PairingMethod::ServiceAuthorization:
        return QStringLiteral("Authorize service access for %1?").arg(deviceName);
    }
    return QStringLiteral("Pair with %1?").arg(deviceName);
}

QString PairingRequest::dialogTitle() const
{
    switch (method) {
    case PairingMethod::PinCode: return QStringLiteral("Enter PIN Code");
    case PairingMethod::PasskeyEntry: return QStringLiteral("Enter Passkey");
    case PairingMethod::PasskeyDisplay:
    case PairingMethod::PasskeyConfirmation: return QStringLiteral("Confirm Passkey");
    case PairingMethod::Authorization:
    case PairingMethod::ServiceAuthorization: return QStringLiteral("Authorize Pairing");
    }
    return QStringLiteral("Bluetooth Pairing");
}

bool PairingRequest::requiresUserInput() const
{
    return method == PairingMethod::PinCode || method == PairingMethod::PasskeyEntry;
}

// --- enum names ---

QString toString(ConnectionState state)
{
    switch (state) {
    case ConnectionState::Disconnected: return QStringLiteral("disconnected");
    case ConnectionState::Connecting: return QStringLiteral("connecting");
    case ConnectionState::Connected: return QStringLiteral("connected");
    case ConnectionState::Disconnecting: return QStringLiteral("disconnecting");
    }
    return {};
}

QString toString(TransferStatus status)
{
    switch (status) {
    case TransferStatus::Queued: return QStringLiteral("queued");
    case TransferStatus::Active: return QStringLiteral("active");
    case TransferStatus::Suspended: return QStringLiteral("suspended");
    case TransferStatus::Complete: return QStringLiteral("complete");
    case TransferStatus::Error: return QStringLiteral("error");
    }
    return {};
}

QString toString(PairingMethod method)
{
    switch (method) {
    case PairingMethod::PinCode: return QStringLiteral("pin-code");
    case PairingMethod::PasskeyEntry: return QStringLiteral("passkey-entry");
    case PairingMethod::PasskeyDisplay: return QStringLiteral("passkey-display");
    case PairingMethod::PasskeyConfirmation: return QStringLiteral("passkey-confirmation");
    case PairingMethod::Authorization: return QStringLiteral("authorization");
    case PairingMethod::ServiceAuthorization: return QStringLiteral("service-authorization");
    }
    return {};
}

QString toString(DeviceCategory category)
{
    switch (category) {
    case DeviceCategory::Audio: return QStringLiteral("audio");
    case DeviceCategory::Input: return QStringLiteral("input");
    case DeviceCategory::Phone: return QStringLiteral("phone");
    case DeviceCategory::Computer: return QStringLiteral("computer");
    case DeviceCategory::Peripheral: return QStringLiteral("peripheral");
    case DeviceCategory::Wearable: return QStringLiteral("wearable");
    case DeviceCategory::Unknown: return QStringLiteral("unknown");
    }
    return {};
}

} // namespace bcore
