#pragma once

#include "IAuthorizationPolicy.hpp"
#include <QDBusConnection>
#include <QObject>

namespace bcore {

/// IAuthorizationPolicy backed by org.freedesktop.PolicyKit1 on the system bus.
/// The subject is this process; user interaction is allowed, so a check may
/// wait on a password prompt.
class PolkitAuthorizer : public QObject, public IAuthorizationPolicy {
    Q_OBJECT
public:
    static constexpr int CheckTimeoutMs = 60000;

    explicit PolkitAuthorizer(QObject* parent = nullptr);
    PolkitAuthorizer(const QDBusConnection& bus, QObject* parent = nullptr);

    void checkAuthorization(const QString& actionId, const QString& message,
                            DecisionHandler handler) override;

    /// Maps a CheckAuthorization result (is_authorized, is_challenge, details).
    static Decision decisionFor(bool authorized, bool challenge, const QMap<QString, QString>& details);

private:
    QDBusConnection bus_;
};

} // namespace bcore
