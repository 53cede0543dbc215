#pragma once

#include "BluetoothTypes.hpp"
#include <QObject>
#include <QTimer>
#include <functional>
#include <initializer_list>
#include <memory>

class BluezAgentAdaptor;

namespace bcore {

class IBluezTransport;

/// Pairing authority. Registers an org.bluez.Agent1 object with the daemon
/// and turns each authentication callback into a PairingRequest that waits
/// for a user response.
///
/// At most one exchange is pending at a time. It resolves exactly once:
/// through a response call, cancel(), or the response timeout (a rejection).
/// A second request arriving while one is pending is rejected immediately.
class AgentManager : public QObject {
    Q_OBJECT
public:
    static constexpr int DefaultResponseTimeoutMs = 30000;

    /// Delivers the outcome of one exchange back to the caller (the D-Bus reply).
    using AgentReply = std::function<void(bool accepted, const QVariant& value)>;

    explicit AgentManager(IBluezTransport* transport, QObject* parent = nullptr);
    ~AgentManager() override;

    QString agentPath() const { return agentPath_; }
    QString capability() const { return capability_; }
    void setCapability(const QString& capability) { capability_ = capability; }
    void setResponseTimeout(int ms) { responseTimeoutMs_ = ms; }
    int responseTimeout() const { return responseTimeoutMs_; }

    bool isRegistered() const { return registered_; }
    bool hasPendingRequest() const { return pending_ != nullptr; }
    PairingRequest pendingRequest() const;

    /// Exports the agent object and registers it. Failure is logged, never fatal.
    void registerAgent();
    void unregisterAgent();
    void shutdown();

    // Agent1 callbacks
    void requestPinCode(const QString& devicePath, AgentReply reply);
    void displayPinCode(const QString& devicePath, const QString& pinCode, AgentReply reply);
    void requestPasskey(const QString& devicePath, AgentReply reply);
    void displayPasskey(const QString& devicePath, uint32_t passkey, uint16_t entered);
    void requestConfirmation(const QString& devicePath, uint32_t passkey, AgentReply reply);
    void requestAuthorization(const QString& devicePath, AgentReply reply);
    void authorizeService(const QString& devicePath, const QString& uuid, AgentReply reply);
    void release();

    /// Aborts the pending exchange as a rejection.
    void cancel();

    // User responses; no-ops when nothing is pending
    void providePinCode(const QString& pinCode);
    void providePasskey(uint32_t passkey);
    void confirm(bool accepted);
    void authorize(bool accepted);

signals:
    void pairingRequested(const bcore::PairingRequest& request);
    void pairingCompleted(const QString& devicePath, bool success);
    void registeredChanged(bool registered);

private:
    struct PendingExchange {
        quint64 id = 0;
        PairingRequest request;
        AgentReply reply;
    };

    void beginExchange(PairingRequest request, AgentReply reply);
    void publish(quint64 exchangeId);
    void resolve(bool accepted, const QVariant& value);
    /// True when the pending exchange is one of @p methods; other responses are ignored.
    bool expects(std::initializer_list<PairingMethod> methods, const char* response) const;
    void registerWithDaemon(bool retried);
    void requestDefault();
    void onConnectionStateChanged(bool connected);
    void setRegistered(bool registered);

    IBluezTransport* transport_;
    BluezAgentAdaptor* adaptor_ = nullptr;
    QString agentPath_;
    QString capability_;
    bool registered_ = false;
    bool exported_ = false;
    int responseTimeoutMs_ = DefaultResponseTimeoutMs;
    std::unique_ptr<PendingExchange> pending_;
    quint64 nextExchangeId_ = 1;
    QTimer responseTimer_;
};

} // namespace bcore
