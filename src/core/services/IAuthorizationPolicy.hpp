#pragma once

#include <QString>
#include <functional>

namespace bcore {

class IAuthorizationPolicy {
public:
    enum class Decision {
        Allowed,
        Denied,
        Cancelled   // the user dismissed the prompt
    };

    using DecisionHandler = std::function<void(Decision decision)>;

    virtual ~IAuthorizationPolicy() = default;

    /// Asks whether the calling process may perform @p actionId.
    /// The handler runs exactly once on the event loop; failures to reach the
    /// policy service are reported as Denied.
    virtual void checkAuthorization(const QString& actionId, const QString& message,
                                    DecisionHandler handler) = 0;
};

// Action ids
inline const QString ACTION_POWER = QStringLiteral("org.bluecore.bluetooth.power");
inline const QString ACTION_CONFIGURE = QStringLiteral("org.bluecore.bluetooth.configure");
inline const QString ACTION_PAIR = QStringLiteral("org.bluecore.bluetooth.pair");

QString toString(IAuthorizationPolicy::Decision decision);

} // namespace bcore
