#include "TransferManager.hpp"
#include "ErrorClassifier.hpp"
#include "IBluezTransport.hpp"
#include <QDBusObjectPath>
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <algorithm>

namespace bcore {

namespace {

const QString OBEX_ROOT_PATH = QStringLiteral("/org/bluez/obex");

// Object paths arrive as QDBusObjectPath from the bus and as plain strings from the cache
QString objectPathFrom(const QVariant& value)
{
    if (value.userType() == qMetaTypeId<QDBusObjectPath>())
        return value.value<QDBusObjectPath>().path();
    return value.toString();
}

QString parentPath(const QString& path)
{
    const int slash = path.lastIndexOf(QLatin1Char('/'));
    return slash > 0 ? path.left(slash) : QString();
}

} // namespace

TransferManager::TransferManager(IBluezTransport* transport, QObject* parent)
    : QObject(parent)
    , transport_(transport)
{
}

TransferManager::~TransferManager()
{
    if (subscriptionId_)
        transport_->events().unsubscribe(subscriptionId_);
}

void TransferManager::initialize()
{
    if (subscriptionId_) {
        qWarning() << "[TransferMgr] Already initialized";
        return;
    }
    subscriptionId_ = transport_->events().subscribe(OBEX_TRANSFER_INTERFACE,
        [this](const ObjectEvent& event) { onTransferEvent(event); });

    // Transfers that were already running when we started
    for (const auto& path : transport_->objectsWithInterface(OBEX_TRANSFER_INTERFACE))
        trackTransfer(path, transport_->cachedProperties(path, OBEX_TRANSFER_INTERFACE));
}

void TransferManager::shutdown()
{
    if (subscriptionId_) {
        transport_->events().unsubscribe(subscriptionId_);
        subscriptionId_ = 0;
    }
    transfers_.clear();
    outboundSessions_.clear();
}

QList<FileTransfer> TransferManager::activeTransfers() const
{
    QList<FileTransfer> list = transfers_.values();
    std::sort(list.begin(), list.end(), [](const FileTransfer& a, const FileTransfer& b) {
        return a.objectPath < b.objectPath;
    });
    return list;
}

BluetoothError TransferManager::checkTransfer(const QString& transferPath) const
{
    if (!transfers_.contains(transferPath))
        return BluetoothError::notFound(ErrorCategory::Transfer,
               QStringLiteral("Transfer not found: %1").arg(transferPath));
    return {};
}

bool TransferManager::isOutbound(const QString& transferPath, const QString& sessionPath) const
{
    if (outboundSessions_.contains(sessionPath)) return true;
    return outboundSessions_.contains(parentPath(transferPath));
}

// --- Outbound ---

void TransferManager::sendFile(const QString& devicePath, const QString& localPath, SendHandler done)
{
    if (!isInitialized()) {
        done({}, BluetoothError::precondition(ErrorCategory::Transfer,
                 QStringLiteral("Transfer manager not initialized")));
        return;
    }

    QFileInfo info(localPath);
    if (!info.exists() || !info.isFile()) {
        done({}, BluetoothError::notFound(ErrorCategory::Transfer,
                 QStringLiteral("File not found: %1").arg(localPath)));
        return;
    }

    qInfo() << "[TransferMgr] Sending" << localPath << "to" << devicePath;
    transport_->getProperty(devicePath, DEVICE_INTERFACE, QStringLiteral("Address"),
        [this, devicePath, localPath, done](const QVariant& value, const QDBusError& error) {
            if (error.isValid() || value.toString().isEmpty()) {
                done({}, error.isValid()
                     ? classifyDBusError(error, QStringLiteral("Get device address"), ErrorCategory::Transfer)
                     : BluetoothError::notFound(ErrorCategory::Transfer,
                           QStringLiteral("Device has no address: %1").arg(devicePath)));
                return;
            }

            createSession(value.toString(),
                [this, devicePath, localPath, done](const QString& sessionPath, const BluetoothError& err) {
                    if (err.isValid()) { done({}, err); return; }
                    pushFile(devicePath, sessionPath, localPath, done);
                });
        });
}

void TransferManager::createSession(const QString& address,
                                    std::function<void(const QString&, const BluetoothError&)> done)
{
    QVariantMap params;
    params.insert(QStringLiteral("Target"), QStringLiteral("opp"));

    transport_->callMethod(OBEX_ROOT_PATH, OBEX_CLIENT_INTERFACE, QStringLiteral("CreateSession"),
        {address, params},
        [this, done](const QVariantList& results, const QDBusError& error) {
            if (error.isValid() || results.isEmpty()) {
                qWarning() << "[TransferMgr] CreateSession failed:" << error.message();
                done({}, error.isValid()
                     ? classifyDBusError(error, QStringLiteral("Create OBEX session"), ErrorCategory::Transfer)
                     : BluetoothError(ErrorCategory::Transfer, QStringLiteral("INVALID_REPLY"),
                                      QStringLiteral("Create OBEX session returned no session")));
                return;
            }
            const QString sessionPath = objectPathFrom(results.first());
            outboundSessions_.insert(sessionPath);
            qDebug() << "[TransferMgr] OBEX session created:" << sessionPath;
            done(sessionPath, {});
        });
}

void TransferManager::pushFile(const QString& devicePath, const QString& sessionPath, const QString& localPath,
                               SendHandler done)
{
    transport_->callMethod(sessionPath, OBEX_OBJECT_PUSH_INTERFACE, QStringLiteral("SendFile"), {localPath},
        [this, devicePath, sessionPath, localPath, done](const QVariantList& results, const QDBusError& error) {
            if (error.isValid() || results.isEmpty()) {
                qWarning() << "[TransferMgr] SendFile failed:" << error.message();
                removeSession(sessionPath);
                done({}, error.isValid()
                     ? classifyDBusError(error, QStringLiteral("Send file"), ErrorCategory::Transfer)
                     : BluetoothError(ErrorCategory::Transfer, QStringLiteral("INVALID_REPLY"),
                                      QStringLiteral("Send file returned no transfer")));
                return;
            }

            const QString transferPath = objectPathFrom(results.first());
            const QFileInfo info(localPath);

            // The Transfer1 object may already have been announced
            FileTransfer transfer = transfers_.value(transferPath);
            transfer.objectPath = transferPath;
            transfer.sessionPath = sessionPath;
            transfer.devicePath = devicePath;
            transfer.filename = info.fileName();
            transfer.localPath = localPath;
            transfer.direction = TransferDirection::Sending;
            if (transfer.size == 0)
                transfer.size = static_cast<quint64>(std::max<qint64>(info.size(), 0));
            transfers_.insert(transferPath, transfer);

            qInfo() << "[TransferMgr] Transfer started:" << transferPath;
            emit transferStarted(transfer);

            if (results.size() > 1)
                applyProperties(transferPath, results.at(1).toMap());
            done(transferPath, {});
        });
}

void TransferManager::removeSession(const QString& sessionPath)
{
    if (!outboundSessions_.remove(sessionPath)) return;
    qDebug() << "[TransferMgr] Removing OBEX session" << sessionPath;
    transport_->callMethod(OBEX_ROOT_PATH, OBEX_CLIENT_INTERFACE, QStringLiteral("RemoveSession"),
        {QVariant::fromValue(QDBusObjectPath(sessionPath))},
        [sessionPath](const QVariantList&, const QDBusError& error) {
            if (error.isValid())
                qWarning() << "[TransferMgr] Failed to remove session" << sessionPath << ":" << error.message();
        });
}

void TransferManager::sendFiles(const QString& devicePath, const QStringList& localPaths, SendManyHandler done)
{
    qInfo() << "[TransferMgr] Sending" << localPaths.size() << "files to" << devicePath;
    sendNext(devicePath, localPaths, {}, std::move(done));
}

void TransferManager::sendNext(const QString& devicePath, QStringList remaining, QStringList started,
                               SendManyHandler done)
{
    if (remaining.isEmpty()) {
        qInfo() << "[TransferMgr] Started" << started.size() << "file transfers";
        done(started);
        return;
    }

    const QString localPath = remaining.takeFirst();
    sendFile(devicePath, localPath,
        [this, devicePath, localPath, remaining, started, done](const QString& transferPath,
                                                                const BluetoothError& error) mutable {
            if (error.isValid())
                qWarning() << "[TransferMgr] Failed to send" << localPath << ":" << error.message;
            else
                started.append(transferPath);
            sendNext(devicePath, remaining, started, done);
        });
}

// --- Transfer objects ---

void TransferManager::onTransferEvent(const ObjectEvent& event)
{
    switch (event.kind) {
    case ObjectEvent::Kind::ObjectAdded:
        trackTransfer(event.path, event.changed);
        break;
    case ObjectEvent::Kind::ObjectRemoved:
        onTransferRemoved(event.path);
        break;
    case ObjectEvent::Kind::PropertiesChanged:
        if (transfers_.contains(event.path))
            applyProperties(event.path, event.changed);
        else
            trackTransfer(event.path, event.changed);
        break;
    }
}

void TransferManager::trackTransfer(const QString& path, const QVariantMap& properties)
{
    if (transfers_.contains(path)) {
        applyProperties(path, properties);
        return;
    }

    FileTransfer transfer;
    transfer.objectPath = path;
    transfer.sessionPath = properties.contains(QStringLiteral("Session"))
        ? objectPathFrom(properties.value(QStringLiteral("Session")))
        : parentPath(path);
    transfer.direction = isOutbound(path, transfer.sessionPath) ? TransferDirection::Sending
                                                                : TransferDirection::Receiving;
    transfers_.insert(path, transfer);

    // Our own sends are announced when SendFile replies
    if (transfer.direction == TransferDirection::Receiving) {
        applyProperties(path, properties);
        auto it = transfers_.constFind(path);
        if (it == transfers_.constEnd()) return;
        qInfo() << "[TransferMgr] Incoming transfer:" << it->filename;
        emit incomingTransfer(*it);
        return;
    }
    applyProperties(path, properties);
}

void TransferManager::applyProperties(const QString& path, const QVariantMap& properties)
{
    auto it = transfers_.find(path);
    if (it == transfers_.end()) return;
    FileTransfer& transfer = *it;

    if (properties.contains(QStringLiteral("Size")))
        transfer.size = properties.value(QStringLiteral("Size")).toULongLong();
    if (properties.contains(QStringLiteral("Name")))
        transfer.filename = properties.value(QStringLiteral("Name")).toString();
    if (properties.contains(QStringLiteral("Filename"))) {
        const QString file = properties.value(QStringLiteral("Filename")).toString();
        if (transfer.localPath.isEmpty()) transfer.localPath = file;
        if (transfer.filename.isEmpty()) transfer.filename = QFileInfo(file).fileName();
    }

    bool progressed = false;
    if (properties.contains(QStringLiteral("Transferred")))
        progressed = transfer.updateProgress(properties.value(QStringLiteral("Transferred")).toULongLong());

    const TransferStatus previous = transfer.status;
    if (properties.contains(QStringLiteral("Status")))
        transfer.status = FileTransfer::parseStatus(properties.value(QStringLiteral("Status")).toString());

    if (transfer.status == TransferStatus::Complete && !transfer.completed.isValid())
        transfer.completed = QDateTime::currentDateTime();

    const FileTransfer snapshot = transfer;
    if (transfer.status == TransferStatus::Error && previous != TransferStatus::Error)
        transfers_.erase(it);

    if (progressed)
        emit transferProgress(snapshot);

    if (snapshot.status == previous) return;

    if (snapshot.status == TransferStatus::Complete) {
        qInfo() << "[TransferMgr] Transfer complete:" << snapshot.filename;
        emit transferCompleted(snapshot);
    } else if (snapshot.status == TransferStatus::Error) {
        qWarning() << "[TransferMgr] Transfer failed:" << snapshot.filename;
        if (snapshot.direction == TransferDirection::Sending)
            removeSession(snapshot.sessionPath);
        emit transferFailed(snapshot, BluetoothError(ErrorCategory::Transfer, QStringLiteral("TRANSFER_FAILED"),
                                                     QStringLiteral("Transfer failed"), snapshot.filename));
    }
}

void TransferManager::onTransferRemoved(const QString& path)
{
    auto it = transfers_.find(path);
    if (it == transfers_.end()) return;

    FileTransfer transfer = *it;
    transfers_.erase(it);
    if (transfer.direction == TransferDirection::Sending)
        removeSession(transfer.sessionPath);

    if (transfer.status == TransferStatus::Queued || transfer.status == TransferStatus::Active) {
        transfer.status = TransferStatus::Error;
        qWarning() << "[TransferMgr] Transfer removed while in progress:" << path;
        emit transferFailed(transfer, BluetoothError(ErrorCategory::Transfer, QStringLiteral("TRANSFER_REMOVED"),
                                                     QStringLiteral("Transfer was removed unexpectedly"),
                                                     transfer.filename));
    }
}

// --- Control ---

void TransferManager::acceptTransfer(const QString& transferPath, const QString& savePath, Completion done)
{
    BluetoothError err = checkTransfer(transferPath);
    if (err.isValid()) { done(err); return; }

    const QDir saveDir = QFileInfo(savePath).absoluteDir();
    if (!saveDir.exists()) {
        done(BluetoothError::notFound(ErrorCategory::Transfer,
             QStringLiteral("Save directory does not exist: %1").arg(saveDir.path())));
        return;
    }

    // obexd accepts the object itself; only local tracking changes here
    FileTransfer& transfer = transfers_[transferPath];
    transfer.localPath = savePath;
    transfer.status = TransferStatus::Active;
    qInfo() << "[TransferMgr] Accepted" << transferPath << "to" << savePath;
    done({});
}

void TransferManager::rejectTransfer(const QString& transferPath, Completion done)
{
    qInfo() << "[TransferMgr] Rejecting" << transferPath;
    cancelTransfer(transferPath, std::move(done));
}

void TransferManager::cancelTransfer(const QString& transferPath, Completion done)
{
    BluetoothError err = checkTransfer(transferPath);
    if (err.isValid()) { done(err); return; }

    transport_->callMethod(transferPath, OBEX_TRANSFER_INTERFACE, QStringLiteral("Cancel"), {},
        [this, transferPath, done](const QVariantList&, const QDBusError& error) {
            if (error.isValid()) {
                done(classifyDBusError(error, QStringLiteral("Cancel transfer"), ErrorCategory::Transfer));
                return;
            }

            auto it = transfers_.find(transferPath);
            if (it != transfers_.end()) {
                FileTransfer transfer = *it;
                transfers_.erase(it);
                transfer.status = TransferStatus::Error;
                if (transfer.direction == TransferDirection::Sending)
                    removeSession(transfer.sessionPath);
                qInfo() << "[TransferMgr] Transfer cancelled:" << transferPath;
                emit transferFailed(transfer, BluetoothError::cancelled(ErrorCategory::Transfer,
                                                  QStringLiteral("Transfer cancelled by user")));
            }
            done({});
        });
}

void TransferManager::pauseTransfer(const QString& transferPath, Completion done)
{
    controlTransfer(transferPath, QStringLiteral("Suspend"), TransferStatus::Active,
                    TransferStatus::Suspended, std::move(done));
}

void TransferManager::resumeTransfer(const QString& transferPath, Completion done)
{
    controlTransfer(transferPath, QStringLiteral("Resume"), TransferStatus::Suspended,
                    TransferStatus::Active, std::move(done));
}

void TransferManager::controlTransfer(const QString& transferPath, const QString& method, TransferStatus required,
                                      TransferStatus next, Completion done)
{
    BluetoothError err = checkTransfer(transferPath);
    if (err.isValid()) { done(err); return; }

    if (transfers_.value(transferPath).status != required) {
        done(BluetoothError::precondition(ErrorCategory::Transfer,
             required == TransferStatus::Active ? QStringLiteral("Transfer is not active")
                                                : QStringLiteral("Transfer is not suspended")));
        return;
    }

    transport_->callMethod(transferPath, OBEX_TRANSFER_INTERFACE, method, {},
        [this, transferPath, method, next, done](const QVariantList&, const QDBusError& error) {
            if (error.isValid()) {
                qWarning() << "[TransferMgr]" << method << "failed:" << error.message();
                done(classifyDBusError(error, QStringLiteral("%1 transfer").arg(method), ErrorCategory::Transfer));
                return;
            }
            auto it = transfers_.find(transferPath);
            if (it != transfers_.end())
                it->status = next;
            done({});
        });
}

} // namespace bcore
