#include "AudioManager.hpp"
#include "DeviceManager.hpp"
#include "ErrorClassifier.hpp"
#include "IBluezTransport.hpp"
#include <QDebug>

namespace bcore {

AudioManager::AudioManager(IBluezTransport* transport, DeviceManager* devices, QObject* parent)
    : QObject(parent)
    , transport_(transport)
    , devices_(devices)
{
}

void AudioManager::initialize()
{
    connect(devices_, &DeviceManager::deviceFound, this, [this](const BluetoothDevice& device) {
        detectProfiles(device.objectPath);
        // Already connected when it appeared (daemon restart, late announcement)
        if (device.connected)
            onDeviceConnectionChanged(device.objectPath, ConnectionState::Connected);
    });
    connect(devices_, &DeviceManager::deviceRemoved, this, &AudioManager::onDeviceRemoved);
    connect(devices_, &DeviceManager::devicePropertiesChanged,
            this, &AudioManager::onDevicePropertiesChanged);
    connect(devices_, &DeviceManager::connectionStateChanged,
            this, &AudioManager::onDeviceConnectionChanged);

    for (const auto& device : devices_->devices()) {
        detectProfiles(device.objectPath);
        if (device.connected && profiles_.contains(device.objectPath))
            connectedDevices_.insert(device.objectPath);
    }
    qInfo() << "[AudioMgr] Audio devices:" << profiles_.size();
}

void AudioManager::shutdown()
{
    disconnect(devices_, nullptr, this, nullptr);
    profiles_.clear();
    connectedDevices_.clear();
}

AudioProfile AudioManager::profileForUuid(const QString& uuid)
{
    AudioProfile profile;
    profile.uuid = uuid;
    const QString normalized = uuid.toLower();
    if (normalized == A2DP_SINK_UUID) {
        profile.type = AudioProfileType::A2dpSink;
        profile.name = QStringLiteral("A2DP Sink");
    } else if (normalized == A2DP_SOURCE_UUID) {
        profile.type = AudioProfileType::A2dpSource;
        profile.name = QStringLiteral("A2DP Source");
    } else if (normalized == HFP_UUID) {
        profile.type = AudioProfileType::Hfp;
        profile.name = QStringLiteral("Hands-Free");
    } else if (normalized == HSP_UUID) {
        profile.type = AudioProfileType::Hsp;
        profile.name = QStringLiteral("Headset");
    } else if (normalized == AVRCP_UUID) {
        profile.type = AudioProfileType::Avrcp;
        profile.name = QStringLiteral("Remote Control");
    }
    return profile;
}

void AudioManager::detectProfiles(const QString& devicePath)
{
    if (!devices_->hasDevice(devicePath)) return;
    const BluetoothDevice device = devices_->device(devicePath);

    // Keep the connected flags of profiles that are still advertised
    const QList<AudioProfile> previous = profiles_.value(devicePath);
    QList<AudioProfile> detected;
    for (const auto& uuid : device.uuids) {
        AudioProfile profile = profileForUuid(uuid);
        if (profile.type == AudioProfileType::Unknown) continue;
        for (const auto& old : previous) {
            if (old.uuid.compare(uuid, Qt::CaseInsensitive) == 0) {
                profile.connected = old.connected;
                profile.codec = old.codec;
                break;
            }
        }
        detected.append(profile);
    }

    if (detected.isEmpty()) {
        if (profiles_.remove(devicePath) > 0) {
            connectedDevices_.remove(devicePath);
            emit profilesChanged(devicePath);
        }
        return;
    }

    profiles_.insert(devicePath, detected);
    qDebug() << "[AudioMgr]" << devicePath << "has" << detected.size() << "audio profiles";
    emit profilesChanged(devicePath);
}

QString AudioManager::primaryProfile(const QString& devicePath) const
{
    const QList<AudioProfile> list = profiles_.value(devicePath);
    if (list.isEmpty()) return {};

    static const AudioProfileType priority[] = {
        AudioProfileType::A2dpSink,
        AudioProfileType::Hfp,
        AudioProfileType::Hsp,
        AudioProfileType::Avrcp,
        AudioProfileType::A2dpSource,
    };
    for (auto type : priority) {
        for (const auto& profile : list) {
            if (profile.type == type) return profile.uuid;
        }
    }
    return list.first().uuid;
}

// --- Device events ---

void AudioManager::onDevicePropertiesChanged(const BluetoothDevice& device, const QStringList& changed)
{
    if (changed.contains(QStringLiteral("UUIDs")))
        detectProfiles(device.objectPath);
}

void AudioManager::onDeviceRemoved(const QString& devicePath)
{
    connectedDevices_.remove(devicePath);
    if (profiles_.remove(devicePath) > 0) {
        qDebug() << "[AudioMgr] Removed audio device" << devicePath;
        emit profilesChanged(devicePath);
    }
}

void AudioManager::onDeviceConnectionChanged(const QString& devicePath, ConnectionState state)
{
    if (state == ConnectionState::Connected) {
        detectProfiles(devicePath);
        if (!profiles_.contains(devicePath) || connectedDevices_.contains(devicePath)) return;

        connectedDevices_.insert(devicePath);
        const QString primary = primaryProfile(devicePath);
        qInfo() << "[AudioMgr] Audio device connected:" << devicePath << "primary" << primary;
        emit audioDeviceConnected(devicePath, primary);
    } else if (state == ConnectionState::Disconnected) {
        if (!connectedDevices_.remove(devicePath)) return;

        auto it = profiles_.find(devicePath);
        if (it != profiles_.end()) {
            for (auto& profile : *it) profile.connected = false;
        }
        qInfo() << "[AudioMgr] Audio device disconnected:" << devicePath;
        emit audioDeviceDisconnected(devicePath);
    }
}

// --- Profile control ---

BluetoothError AudioManager::checkProfile(const QString& devicePath, const QString& uuid) const
{
    auto it = profiles_.constFind(devicePath);
    if (it == profiles_.constEnd())
        return BluetoothError::notFound(ErrorCategory::Device,
               QStringLiteral("Device %1 has no audio profiles").arg(devicePath));

    for (const auto& profile : *it) {
        if (profile.uuid.compare(uuid, Qt::CaseInsensitive) == 0) return {};
    }
    return BluetoothError::invalidArgument(ErrorCategory::Device,
           QStringLiteral("Device %1 does not support profile %2").arg(devicePath, uuid));
}

void AudioManager::setProfileConnected(const QString& devicePath, const QString& uuid, bool connected)
{
    auto it = profiles_.find(devicePath);
    if (it == profiles_.end()) return;
    for (auto& profile : *it) {
        if (profile.uuid.compare(uuid, Qt::CaseInsensitive) == 0) {
            profile.connected = connected;
            return;
        }
    }
}

void AudioManager::callProfileMethod(const QString& devicePath, const QString& uuid, const QString& method,
                                     bool connected, Completion done)
{
    BluetoothError err = checkProfile(devicePath, uuid);
    if (err.isValid()) { done(err); return; }

    qInfo() << "[AudioMgr]" << method << uuid << "on" << devicePath;
    transport_->callMethod(devicePath, DEVICE_INTERFACE, method, {uuid},
        [this, devicePath, uuid, method, connected, done](const QVariantList&, const QDBusError& error) {
            if (error.isValid()) {
                qWarning() << "[AudioMgr]" << method << "failed:" << error.message();
                done(classifyDBusError(error, connected ? QStringLiteral("Profile connection")
                                                        : QStringLiteral("Profile disconnection"),
                                       ErrorCategory::Connection));
                return;
            }
            setProfileConnected(devicePath, uuid, connected);
            emit profileChanged(devicePath, uuid);
            done({});
        });
}

void AudioManager::connectProfile(const QString& devicePath, const QString& uuid, Completion done)
{
    callProfileMethod(devicePath, uuid, QStringLiteral("ConnectProfile"), true, std::move(done));
}

void AudioManager::disconnectProfile(const QString& devicePath, const QString& uuid, Completion done)
{
    callProfileMethod(devicePath, uuid, QStringLiteral("DisconnectProfile"), false, std::move(done));
}

void AudioManager::setActiveProfile(const QString& devicePath, const QString& uuid, Completion done)
{
    BluetoothError err = checkProfile(devicePath, uuid);
    if (err.isValid()) { done(err); return; }

    connectProfile(devicePath, uuid, [this, devicePath, uuid, done](const BluetoothError& error) {
        // The daemon reports an already connected profile as a failure
        if (error.isValid() && error.code != QLatin1String("ALREADYCONNECTED")) {
            done(error);
            return;
        }
        setProfileConnected(devicePath, uuid, true);
        emit profileChanged(devicePath, uuid);
        done({});
    });
}

} // namespace bcore
