#pragma once

#include "BluetoothError.hpp"
#include "BluetoothTypes.hpp"
#include <QHash>
#include <QList>
#include <QObject>
#include <QSet>

namespace bcore {

class DeviceManager;
class IBluezTransport;

/// Maps the service UUIDs a device advertises onto audio profiles and tracks
/// which of those profiles are connected. Profile routing itself belongs to
/// the audio server; this manager only asks the daemon to (dis)connect them.
class AudioManager : public QObject {
    Q_OBJECT
public:
    AudioManager(IBluezTransport* transport, DeviceManager* devices, QObject* parent = nullptr);

    void initialize();
    void shutdown();

    /// Rebuilds the profile list of one device from its advertised UUIDs.
    void detectProfiles(const QString& devicePath);

    QList<AudioProfile> profiles(const QString& devicePath) const { return profiles_.value(devicePath); }
    bool hasAudioProfiles(const QString& devicePath) const { return profiles_.contains(devicePath); }

    /// Highest priority profile UUID: sink, hands-free, headset, remote control, source.
    QString primaryProfile(const QString& devicePath) const;

    void connectProfile(const QString& devicePath, const QString& uuid, Completion done);
    void disconnectProfile(const QString& devicePath, const QString& uuid, Completion done);

    /// Connects @p uuid without touching the device's other profiles.
    void setActiveProfile(const QString& devicePath, const QString& uuid, Completion done);

    int connectedAudioDeviceCount() const { return connectedDevices_.size(); }
    bool isAudioDeviceConnected(const QString& devicePath) const { return connectedDevices_.contains(devicePath); }

    /// Profile record for a known audio UUID; type Unknown otherwise.
    static AudioProfile profileForUuid(const QString& uuid);

signals:
    void profilesChanged(const QString& devicePath);
    void profileChanged(const QString& devicePath, const QString& uuid);
    void audioDeviceConnected(const QString& devicePath, const QString& primaryUuid);
    void audioDeviceDisconnected(const QString& devicePath);

private:
    void onDeviceConnectionChanged(const QString& devicePath, ConnectionState state);
    void onDevicePropertiesChanged(const BluetoothDevice& device, const QStringList& changed);
    void onDeviceRemoved(const QString& devicePath);
    BluetoothError checkProfile(const QString& devicePath, const QString& uuid) const;
    void setProfileConnected(const QString& devicePath, const QString& uuid, bool connected);
    void callProfileMethod(const QString& devicePath, const QString& uuid, const QString& method,
                           bool connected, Completion done);

    IBluezTransport* transport_;
    DeviceManager* devices_;
    QHash<QString, QList<AudioProfile>> profiles_;
    QSet<QString> connectedDevices_;
};

} // namespace bcore
