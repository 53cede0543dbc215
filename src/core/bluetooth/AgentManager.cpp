#include "AgentManager.hpp"
#include "IBluezTransport.hpp"
#include <QDebug>
#include <QDBusConnection>
#include <QDBusContext>
#include <QDBusMessage>
#include <QDBusObjectPath>

// BluezAgentAdaptor - receives org.bluez.Agent1 calls from BlueZ and forwards
// them to AgentManager. Calls that wait for the user take a delayed reply
// which is sent once the exchange resolves.
// Requires #include "AgentManager.moc" at end of file for AUTOMOC.
class BluezAgentAdaptor : public QObject, protected QDBusContext {
    Q_OBJECT
    Q_CLASSINFO("D-Bus Interface", "org.bluez.Agent1")
public:
    explicit BluezAgentAdaptor(bcore::AgentManager* manager, QObject* parent = nullptr)
        : QObject(parent), manager_(manager) {}

public slots:
    void Release() {
        qInfo() << "[BtAgent] Released";
        manager_->release();
    }

    QString RequestPinCode(const QDBusObjectPath& device) {
        qInfo() << "[BtAgent] RequestPinCode:" << device.path();
        manager_->requestPinCode(device.path(), delayedReply(ReplyKind::String));
        return {};
    }

    void DisplayPinCode(const QDBusObjectPath& device, const QString& pinCode) {
        qInfo() << "[BtAgent] DisplayPinCode:" << device.path();
        manager_->displayPinCode(device.path(), pinCode, delayedReply(ReplyKind::Empty));
    }

    uint RequestPasskey(const QDBusObjectPath& device) {
        qInfo() << "[BtAgent] RequestPasskey:" << device.path();
        manager_->requestPasskey(device.path(), delayedReply(ReplyKind::Passkey));
        return 0;
    }

    void DisplayPasskey(const QDBusObjectPath& device, uint passkey, ushort entered) {
        qInfo() << "[BtAgent] DisplayPasskey:" << device.path() << entered;
        manager_->displayPasskey(device.path(), passkey, entered);
    }

    void RequestConfirmation(const QDBusObjectPath& device, uint passkey) {
        qInfo() << "[BtAgent] RequestConfirmation:" << device.path() << passkey;
        manager_->requestConfirmation(device.path(), passkey, delayedReply(ReplyKind::Empty));
    }

    void RequestAuthorization(const QDBusObjectPath& device) {
        qInfo() << "[BtAgent] RequestAuthorization:" << device.path();
        manager_->requestAuthorization(device.path(), delayedReply(ReplyKind::Empty));
    }

    void AuthorizeService(const QDBusObjectPath& device, const QString& uuid) {
        qInfo() << "[BtAgent] AuthorizeService:" << device.path() << uuid;
        manager_->authorizeService(device.path(), uuid, delayedReply(ReplyKind::Empty));
    }

    void Cancel() {
        qInfo() << "[BtAgent] Cancel";
        manager_->cancel();
    }

private:
    enum class ReplyKind { Empty, String, Passkey };

    bcore::AgentManager::AgentReply delayedReply(ReplyKind kind) {
        setDelayedReply(true);
        QDBusMessage msg = message();
        QDBusConnection bus = connection();
        return [msg, bus, kind](bool accepted, const QVariant& value) {
            if (!accepted) {
                bus.send(msg.createErrorReply(QStringLiteral("org.bluez.Error.Rejected"),
                                              QStringLiteral("User rejected pairing")));
                return;
            }
            switch (kind) {
            case ReplyKind::String:
                bus.send(msg.createReply(value.toString()));
                break;
            case ReplyKind::Passkey:
                bus.send(msg.createReply(QVariant::fromValue(static_cast<uint>(value.toUInt()))));
                break;
            case ReplyKind::Empty:
                bus.send(msg.createReply());
                break;
            }
        };
    }

    bcore::AgentManager* manager_;
};

namespace bcore {

AgentManager::AgentManager(IBluezTransport* transport, QObject* parent)
    : QObject(parent)
    , transport_(transport)
    , agentPath_(QStringLiteral("/org/bluecore/agent"))
    , capability_(QStringLiteral("KeyboardDisplay"))
{
    responseTimer_.setSingleShot(true);
    connect(&responseTimer_, &QTimer::timeout, this, [this]() {
        if (!pending_) return;
        qInfo() << "[AgentMgr] No response within" << responseTimeoutMs_ << "ms, rejecting";
        resolve(false, {});
    });
    connect(transport_, &IBluezTransport::connectionStateChanged,
            this, &AgentManager::onConnectionStateChanged);
}

AgentManager::~AgentManager() = default;

PairingRequest AgentManager::pendingRequest() const
{
    return pending_ ? pending_->request : PairingRequest();
}

// --- Registration ---

void AgentManager::registerAgent()
{
    if (registered_) return;

    if (!exported_) {
        if (!adaptor_)
            adaptor_ = new BluezAgentAdaptor(this, this);
        exported_ = transport_->exportObject(agentPath_, adaptor_);
        if (!exported_)
            qWarning() << "[AgentMgr] Could not export agent at" << agentPath_;
    }

    qInfo() << "[AgentMgr] Registering agent at" << agentPath_ << "capability" << capability_;
    registerWithDaemon(false);
}

void AgentManager::registerWithDaemon(bool retried)
{
    transport_->callMethod(QStringLiteral("/org/bluez"), AGENT_MANAGER_INTERFACE, QStringLiteral("RegisterAgent"),
        {QVariant::fromValue(QDBusObjectPath(agentPath_)), capability_},
        [this, retried](const QVariantList&, const QDBusError& error) {
            if (!error.isValid()) {
                setRegistered(true);
                requestDefault();
                return;
            }

            // The daemon's wording is not a stable contract; match the name or the text
            const bool alreadyExists = error.name().contains(QLatin1String("AlreadyExists"))
                || error.message().contains(QLatin1String("AlreadyExists"));
            if (!alreadyExists || retried) {
                // Non-fatal: pairing prompts are routed to whichever agent is registered
                qWarning() << "[AgentMgr] RegisterAgent failed:" << error.message();
                return;
            }

            qInfo() << "[AgentMgr] Agent path already registered, re-registering";
            transport_->callMethod(QStringLiteral("/org/bluez"), AGENT_MANAGER_INTERFACE,
                QStringLiteral("UnregisterAgent"), {QVariant::fromValue(QDBusObjectPath(agentPath_))},
                [this](const QVariantList&, const QDBusError& unregisterError) {
                    if (unregisterError.isValid()) {
                        qWarning() << "[AgentMgr] UnregisterAgent failed:" << unregisterError.message();
                        return;
                    }
                    registerWithDaemon(true);
                });
        });
}

void AgentManager::requestDefault()
{
    transport_->callMethod(QStringLiteral("/org/bluez"), AGENT_MANAGER_INTERFACE, QStringLiteral("RequestDefaultAgent"),
        {QVariant::fromValue(QDBusObjectPath(agentPath_))},
        [](const QVariantList&, const QDBusError& error) {
            if (error.isValid()) {
                // Another agent stays default; explicit pairing still comes here
                qInfo() << "[AgentMgr] Not the default agent:" << error.message();
                return;
            }
            qInfo() << "[AgentMgr] Registered as default agent";
        });
}

void AgentManager::unregisterAgent()
{
    if (!registered_) return;
    transport_->callMethod(QStringLiteral("/org/bluez"), AGENT_MANAGER_INTERFACE, QStringLiteral("UnregisterAgent"),
        {QVariant::fromValue(QDBusObjectPath(agentPath_))},
        [](const QVariantList&, const QDBusError& error) {
            if (error.isValid())
                qWarning() << "[AgentMgr] UnregisterAgent failed:" << error.message();
        });
    setRegistered(false);
}

void AgentManager::shutdown()
{
    cancel();
    unregisterAgent();
    if (exported_) {
        transport_->unexportObject(agentPath_);
        exported_ = false;
    }
}

void AgentManager::setRegistered(bool registered)
{
    if (registered_ == registered) return;
    registered_ = registered;
    qInfo() << "[AgentMgr] Registered:" << registered;
    emit registeredChanged(registered);
}

void AgentManager::onConnectionStateChanged(bool connected)
{
    if (!connected) {
        cancel();
        setRegistered(false);
        return;
    }
    // The daemon forgets agents when it restarts
    if (exported_)
        registerAgent();
}

// --- Exchanges ---

void AgentManager::beginExchange(PairingRequest request, AgentReply reply)
{
    if (pending_) {
        qWarning() << "[AgentMgr] Rejecting" << toString(request.method) << "for" << request.devicePath
                   << "- another pairing request is pending";
        reply(false, {});
        return;
    }

    pending_ = std::make_unique<PendingExchange>();
    pending_->id = nextExchangeId_++;
    pending_->request = std::move(request);
    pending_->reply = std::move(reply);
    responseTimer_.start(responseTimeoutMs_);

    publish(pending_->id);
}

void AgentManager::publish(quint64 exchangeId)
{
    const QString devicePath = pending_->request.devicePath;
    transport_->getProperty(devicePath, DEVICE_INTERFACE, QStringLiteral("Alias"),
        [this, exchangeId](const QVariant& value, const QDBusError& error) {
            // Cancelled or timed out while the name was being read
            if (!pending_ || pending_->id != exchangeId) return;

            if (error.isValid() || value.toString().isEmpty()) {
                qWarning() << "[AgentMgr] Failed to get device name:" << error.message();
                pending_->request.deviceName = QStringLiteral("Unknown Device");
            } else {
                pending_->request.deviceName = value.toString();
            }
            emit pairingRequested(pending_->request);
        });
}

void AgentManager::resolve(bool accepted, const QVariant& value)
{
    if (!pending_) return;

    // Clear the slot first so nothing triggered below can resolve it again
    std::unique_ptr<PendingExchange> exchange = std::move(pending_);
    responseTimer_.stop();

    qInfo() << "[AgentMgr]" << toString(exchange->request.method) << "for"
            << exchange->request.devicePath << (accepted ? "accepted" : "rejected");
    exchange->reply(accepted, value);

    if (accepted && exchange->request.method == PairingMethod::PasskeyConfirmation) {
        // Trust the device so future connections auto-accept
        transport_->setProperty(exchange->request.devicePath, DEVICE_INTERFACE,
            QStringLiteral("Trusted"), true, [](const QDBusError& error) {
                if (error.isValid())
                    qWarning() << "[AgentMgr] Failed to trust device:" << error.message();
            });
    }

    emit pairingCompleted(exchange->request.devicePath, accepted);
}

void AgentManager::requestPinCode(const QString& devicePath, AgentReply reply)
{
    PairingRequest request;
    request.devicePath = devicePath;
    request.method = PairingMethod::PinCode;
    beginExchange(std::move(request), std::move(reply));
}

void AgentManager::displayPinCode(const QString& devicePath, const QString& pinCode, AgentReply reply)
{
    PairingRequest request;
    request.devicePath = devicePath;
    request.method = PairingMethod::PasskeyDisplay;
    request.pinCode = pinCode;
    beginExchange(std::move(request), std::move(reply));
}

void AgentManager::requestPasskey(const QString& devicePath, AgentReply reply)
{
    PairingRequest request;
    request.devicePath = devicePath;
    request.method = PairingMethod::PasskeyEntry;
    beginExchange(std::move(request), std::move(reply));
}

void AgentManager::displayPasskey(const QString& devicePath, uint32_t passkey, uint16_t entered)
{
    Q_UNUSED(entered);
    PairingRequest request;
    request.devicePath = devicePath;
    request.method = PairingMethod::PasskeyDisplay;
    request.passkey = passkey;
    request.hasPasskey = true;

    // Display only: publish and return, nothing waits for the user
    transport_->getProperty(devicePath, DEVICE_INTERFACE, QStringLiteral("Alias"),
        [this, request](const QVariant& value, const QDBusError& error) mutable {
            request.deviceName = (error.isValid() || value.toString().isEmpty())
                ? QStringLiteral("Unknown Device") : value.toString();
            emit pairingRequested(request);
        });
}

void AgentManager::requestConfirmation(const QString& devicePath, uint32_t passkey, AgentReply reply)
{
    PairingRequest request;
    request.devicePath = devicePath;
    request.method = PairingMethod::PasskeyConfirmation;
    request.passkey = passkey;
    request.hasPasskey = true;
    beginExchange(std::move(request), std::move(reply));
}

void AgentManager::requestAuthorization(const QString& devicePath, AgentReply reply)
{
    PairingRequest request;
    request.devicePath = devicePath;
    request.method = PairingMethod::Authorization;
    beginExchange(std::move(request), std::move(reply));
}

void AgentManager::authorizeService(const QString& devicePath, const QString& uuid, AgentReply reply)
{
    PairingRequest request;
    request.devicePath = devicePath;
    request.method = PairingMethod::ServiceAuthorization;
    request.serviceUuid = uuid;
    beginExchange(std::move(request), std::move(reply));
}

void AgentManager::release()
{
    cancel();
    setRegistered(false);
}

void AgentManager::cancel()
{
    if (!pending_) return;
    qInfo() << "[AgentMgr] Pairing cancelled";
    resolve(false, {});
}

bool AgentManager::expects(std::initializer_list<PairingMethod> methods, const char* response) const
{
    if (!pending_) return false;
    for (PairingMethod method : methods) {
        if (pending_->request.method == method) return true;
    }
    qWarning() << "[AgentMgr] Ignoring" << response << "for pending" << toString(pending_->request.method);
    return false;
}

void AgentManager::providePinCode(const QString& pinCode)
{
    if (!expects({PairingMethod::PinCode}, "PIN code")) return;
    resolve(!pinCode.isEmpty(), pinCode.isEmpty() ? QVariant() : QVariant(pinCode));
}

void AgentManager::providePasskey(uint32_t passkey)
{
    if (!expects({PairingMethod::PasskeyEntry}, "passkey")) return;
    resolve(true, QVariant::fromValue(static_cast<uint>(passkey)));
}

void AgentManager::confirm(bool accepted)
{
    // DisplayPinCode waits for the user to confirm the code was entered remotely
    if (!expects({PairingMethod::PasskeyConfirmation, PairingMethod::PasskeyDisplay}, "confirmation")) return;
    resolve(accepted, {});
}

void AgentManager::authorize(bool accepted)
{
    if (!expects({PairingMethod::Authorization, PairingMethod::ServiceAuthorization}, "authorization")) return;
    resolve(accepted, {});
}

} // namespace bcore

#include "AgentManager.moc"
