#include <QTest>
#include "core/services/PolkitAuthorizer.hpp"

using Decision = bcore::IAuthorizationPolicy::Decision;

class TestPolkitAuthorizer : public QObject {
    Q_OBJECT
private slots:
    void testDecisionMapping()
    {
        QCOMPARE(bcore::PolkitAuthorizer::decisionFor(true, false, {}), Decision::Allowed);
        QCOMPARE(bcore::PolkitAuthorizer::decisionFor(false, false, {}), Decision::Denied);
        QCOMPARE(bcore::PolkitAuthorizer::decisionFor(false, true, {}), Decision::Denied);
        QCOMPARE(bcore::PolkitAuthorizer::decisionFor(false, false, {{"polkit.dismissed", "true"}}),
                 Decision::Cancelled);
        // Authorization wins over a stale dismissal flag
        QCOMPARE(bcore::PolkitAuthorizer::decisionFor(true, false, {{"polkit.dismissed", "true"}}),
                 Decision::Allowed);
    }

    void testDecisionNames()
    {
        QCOMPARE(bcore::toString(Decision::Allowed), QString("allowed"));
        QCOMPARE(bcore::toString(Decision::Denied), QString("denied"));
        QCOMPARE(bcore::toString(Decision::Cancelled), QString("cancelled"));
    }

    void testUnreachableAuthorityDenies()
    {
        // A connection that never reached a bus fails every call
        bcore::PolkitAuthorizer authorizer(QDBusConnection(QStringLiteral("bcore-test-nobus")));

        int calls = 0;
        Decision decision = Decision::Allowed;
        authorizer.checkAuthorization(bcore::ACTION_POWER, "Turn adapter off",
                                      [&](Decision d) { ++calls; decision = d; });

        QTRY_COMPARE(calls, 1);
        QCOMPARE(decision, Decision::Denied);
    }
};

QTEST_MAIN(TestPolkitAuthorizer)
#include "test_polkit_authorizer.moc"
