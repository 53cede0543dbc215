#include "PolkitAuthorizer.hpp"
#include <QCoreApplication>
#include <QDBusArgument>
#include <QDBusMessage>
#include <QDBusMetaType>
#include <QDBusPendingCallWatcher>
#include <QDebug>
#include <QMap>

namespace bcore {

// (sa{sv}) subject of a CheckAuthorization call
struct PolkitSubject {
    QString kind;
    QVariantMap details;
};

using PolkitDetails = QMap<QString, QString>;

QDBusArgument& operator<<(QDBusArgument& arg, const PolkitSubject& subject)
{
    arg.beginStructure();
    arg << subject.kind << subject.details;
    arg.endStructure();
    return arg;
}

const QDBusArgument& operator>>(const QDBusArgument& arg, PolkitSubject& subject)
{
    arg.beginStructure();
    arg >> subject.kind >> subject.details;
    arg.endStructure();
    return arg;
}

} // namespace bcore

Q_DECLARE_METATYPE(bcore::PolkitSubject)

namespace bcore {

namespace {

const QString POLKIT_SERVICE = QStringLiteral("org.freedesktop.PolicyKit1");
const QString POLKIT_PATH = QStringLiteral("/org/freedesktop/PolicyKit1/Authority");
const QString POLKIT_INTERFACE = QStringLiteral("org.freedesktop.PolicyKit1.Authority");
constexpr quint32 AllowUserInteraction = 0x1;

} // namespace

QString toString(IAuthorizationPolicy::Decision decision)
{
    switch (decision) {
    case IAuthorizationPolicy::Decision::Allowed: return QStringLiteral("allowed");
    case IAuthorizationPolicy::Decision::Denied: return QStringLiteral("denied");
    case IAuthorizationPolicy::Decision::Cancelled: return QStringLiteral("cancelled");
    }
    return QStringLiteral("denied");
}

PolkitAuthorizer::PolkitAuthorizer(QObject* parent)
    : PolkitAuthorizer(QDBusConnection::systemBus(), parent)
{
}

PolkitAuthorizer::PolkitAuthorizer(const QDBusConnection& bus, QObject* parent)
    : QObject(parent)
    , bus_(bus)
{
    qDBusRegisterMetaType<PolkitSubject>();
    qDBusRegisterMetaType<PolkitDetails>();
}

IAuthorizationPolicy::Decision PolkitAuthorizer::decisionFor(bool authorized, bool challenge,
                                                             const QMap<QString, QString>& details)
{
    Q_UNUSED(challenge);
    if (authorized)
        return Decision::Allowed;
    // Set by the authentication agent when the prompt was closed
    if (details.value(QStringLiteral("polkit.dismissed")) == QLatin1String("true"))
        return Decision::Cancelled;
    return Decision::Denied;
}

void PolkitAuthorizer::checkAuthorization(const QString& actionId, const QString& message,
                                          DecisionHandler handler)
{
    PolkitSubject subject;
    subject.kind = QStringLiteral("unix-process");
    subject.details.insert(QStringLiteral("pid"),
                           QVariant::fromValue(static_cast<quint32>(QCoreApplication::applicationPid())));
    // 0 lets polkit look the start time up itself
    subject.details.insert(QStringLiteral("start-time"), QVariant::fromValue(static_cast<quint64>(0)));

    QDBusMessage msg = QDBusMessage::createMethodCall(POLKIT_SERVICE, POLKIT_PATH, POLKIT_INTERFACE,
                                                      QStringLiteral("CheckAuthorization"));
    msg << QVariant::fromValue(subject) << actionId << QVariant::fromValue(PolkitDetails())
        << AllowUserInteraction << QString();

    qInfo() << "[Polkit] Checking" << actionId << "-" << message;

    auto* watcher = new QDBusPendingCallWatcher(bus_.asyncCall(msg, CheckTimeoutMs), this);
    connect(watcher, &QDBusPendingCallWatcher::finished, this, [watcher, handler, actionId]() {
        watcher->deleteLater();
        if (watcher->isError()) {
            qWarning() << "[Polkit] Authorization check failed:" << watcher->error().message();
            handler(Decision::Denied);
            return;
        }

        const QVariantList args = watcher->reply().arguments();
        if (args.isEmpty() || args.first().userType() != qMetaTypeId<QDBusArgument>()) {
            qWarning() << "[Polkit] Unexpected reply for" << actionId;
            handler(Decision::Denied);
            return;
        }

        const QDBusArgument arg = args.first().value<QDBusArgument>();
        bool authorized = false;
        bool challenge = false;
        PolkitDetails details;
        arg.beginStructure();
        arg >> authorized >> challenge >> details;
        arg.endStructure();

        const Decision decision = decisionFor(authorized, challenge, details);
        qInfo() << "[Polkit]" << actionId << toString(decision);
        handler(decision);
    });
}

} // namespace bcore
