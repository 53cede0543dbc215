#pragma once

#include "BluetoothError.hpp"
#include "BluetoothTypes.hpp"
#include <QHash>
#include <QList>
#include <QObject>
#include <QSet>
#include <functional>

namespace bcore {

class IBluezTransport;
struct ObjectEvent;

/// File transfer over OBEX object push. Outbound transfers are started here;
/// inbound ones appear as Transfer1 objects announced by obexd.
class TransferManager : public QObject {
    Q_OBJECT
public:
    using SendHandler = std::function<void(const QString& transferPath, const BluetoothError& error)>;
    using SendManyHandler = std::function<void(const QStringList& transferPaths)>;

    explicit TransferManager(IBluezTransport* transport, QObject* parent = nullptr);
    ~TransferManager() override;

    void initialize();
    void shutdown();
    bool isInitialized() const { return subscriptionId_ != 0; }

    void sendFile(const QString& devicePath, const QString& localPath, SendHandler done);

    /// Sends the files one after another. Failed files are skipped; the
    /// handler receives the transfers that did start.
    void sendFiles(const QString& devicePath, const QStringList& localPaths, SendManyHandler done);

    void acceptTransfer(const QString& transferPath, const QString& savePath, Completion done);
    void rejectTransfer(const QString& transferPath, Completion done);
    void cancelTransfer(const QString& transferPath, Completion done);
    void pauseTransfer(const QString& transferPath, Completion done);
    void resumeTransfer(const QString& transferPath, Completion done);

    bool hasTransfer(const QString& transferPath) const { return transfers_.contains(transferPath); }
    FileTransfer transfer(const QString& transferPath) const { return transfers_.value(transferPath); }
    QList<FileTransfer> activeTransfers() const;

signals:
    void transferStarted(const bcore::FileTransfer& transfer);
    void incomingTransfer(const bcore::FileTransfer& transfer);
    void transferProgress(const bcore::FileTransfer& transfer);
    void transferCompleted(const bcore::FileTransfer& transfer);
    void transferFailed(const bcore::FileTransfer& transfer, const bcore::BluetoothError& error);

private:
    void onTransferEvent(const ObjectEvent& event);
    void trackTransfer(const QString& path, const QVariantMap& properties);
    void applyProperties(const QString& path, const QVariantMap& properties);
    void onTransferRemoved(const QString& path);
    void createSession(const QString& address, std::function<void(const QString&, const BluetoothError&)> done);
    void pushFile(const QString& devicePath, const QString& sessionPath, const QString& localPath,
                  SendHandler done);
    void removeSession(const QString& sessionPath);
    void sendNext(const QString& devicePath, QStringList remaining, QStringList started, SendManyHandler done);
    void controlTransfer(const QString& transferPath, const QString& method, TransferStatus required,
                         TransferStatus next, Completion done);
    bool isOutbound(const QString& transferPath, const QString& sessionPath) const;
    BluetoothError checkTransfer(const QString& transferPath) const;

    IBluezTransport* transport_;
    int subscriptionId_ = 0;
    QHash<QString, FileTransfer> transfers_;
    QSet<QString> outboundSessions_;
};

} // namespace bcore
