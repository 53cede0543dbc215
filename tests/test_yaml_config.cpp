#include <QtTest>
#include <QFile>
#include <QTemporaryDir>
#include "core/YamlConfig.hpp"

class TestYamlConfig : public QObject {
    Q_OBJECT
private slots:
    void testLoadDefaults();
    void testLoadPartialFile();
    void testSaveAndReload();
    void testAdapterConfig();
    void testAdapterConfigValidation();
    void testDeviceLists();
    void testValueByPath();
    void testValueByPathMissing();
    void testSetValueByPath();
    void testSetValueByPathAdapters();
    void testSetValueByPathRejectsUnknown();
    void testLoadMalformedThrows();

private:
    static QString writeFile(const QTemporaryDir& dir, const QByteArray& contents);
};

QString TestYamlConfig::writeFile(const QTemporaryDir& dir, const QByteArray& contents)
{
    const QString path = dir.filePath("config.yaml");
    QFile f(path);
    if (f.open(QIODevice::WriteOnly))
        f.write(contents);
    return path;
}

void TestYamlConfig::testLoadDefaults()
{
    bcore::YamlConfig config;
    QCOMPARE(config.filter(), QString("all"));
    QCOMPARE(config.sortOrder(), QString("name"));
    QCOMPARE(config.showOnlyPaired(), false);
    QCOMPARE(config.notificationsEnabled(), true);
    QCOMPARE(config.notifyOnConnect(), true);
    QCOMPARE(config.notifyOnTransfer(), true);
    QCOMPARE(config.agentCapability(), QString("KeyboardDisplay"));
    QCOMPARE(config.autoDiscoverySeconds(), 15);
    QCOMPARE(config.rssiRefreshMs(), 30000);
    QCOMPARE(config.pairingTimeoutMs(), 30000);
    QVERIFY(config.trustedDevices().isEmpty());
    QVERIFY(config.configuredAdapters().isEmpty());
}

void TestYamlConfig::testLoadPartialFile()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = writeFile(dir,
        "ui:\n"
        "  notify_on_disconnect: false\n"
        "bluetooth:\n"
        "  agent_capability: DisplayYesNo\n"
        "devices:\n"
        "  trusted: [\"AA:BB:CC:DD:EE:FF\"]\n");

    bcore::YamlConfig config;
    config.load(path);

    QCOMPARE(config.notifyOnDisconnect(), false);
    QCOMPARE(config.agentCapability(), QString("DisplayYesNo"));
    QCOMPARE(config.trustedDevices(), QStringList{"AA:BB:CC:DD:EE:FF"});
    // Keys absent from the file keep their defaults
    QCOMPARE(config.notifyOnConnect(), true);
    QCOMPARE(config.autoDiscoverySeconds(), 15);
    QVERIFY(config.blockedDevices().isEmpty());
}

void TestYamlConfig::testSaveAndReload()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath("saved.yaml");

    bcore::YamlConfig config;
    config.setSortOrder("rssi");
    config.setShowOnlyConnected(true);
    config.setPairingTimeoutMs(45000);
    config.setBlockedDevices({"11:22:33:44:55:66"});
    config.save(path);

    bcore::YamlConfig loaded;
    loaded.load(path);
    QCOMPARE(loaded.sortOrder(), QString("rssi"));
    QCOMPARE(loaded.showOnlyConnected(), true);
    QCOMPARE(loaded.pairingTimeoutMs(), 45000);
    QCOMPARE(loaded.blockedDevices(), QStringList{"11:22:33:44:55:66"});
}

void TestYamlConfig::testAdapterConfig()
{
    bcore::YamlConfig config;
    QVERIFY(!config.hasAdapterConfig("hci0"));
    QCOMPARE(config.adapterConfig("hci0").discoverableTimeout, 180u);

    bcore::AdapterConfig hci0;
    hci0.alias = "desk";
    hci0.discoverableTimeout = 60;
    config.setAdapterConfig("hci0", hci0);

    bcore::AdapterConfig hci1;
    hci1.pairableTimeout = 30;
    config.setAdapterConfig("hci1", hci1);

    QVERIFY(config.hasAdapterConfig("hci0"));
    QCOMPARE(config.configuredAdapters(), (QStringList{"hci0", "hci1"}));
    QCOMPARE(config.adapterConfig("hci0").alias, QString("desk"));
    QCOMPARE(config.adapterConfig("hci0").discoverableTimeout, 60u);
    QCOMPARE(config.adapterConfig("hci1").pairableTimeout, 30u);
}

void TestYamlConfig::testAdapterConfigValidation()
{
    bcore::AdapterConfig config;
    QVERIFY(config.isValid());

    config.alias = QString(249, 'a');
    QVERIFY(!config.isValid());

    config.alias = "ok";
    config.discoverableTimeout = 70000;
    QVERIFY(!config.isValid());
}

void TestYamlConfig::testDeviceLists()
{
    bcore::YamlConfig config;
    config.setTrustedDevices({"AA:AA:AA:AA:AA:AA", "BB:BB:BB:BB:BB:BB"});
    QCOMPARE(config.trustedDevices().size(), 2);
    QCOMPARE(config.valueByPath("devices.trusted").toStringList(), config.trustedDevices());

    config.setTrustedDevices({});
    QVERIFY(config.trustedDevices().isEmpty());
}

void TestYamlConfig::testValueByPath()
{
    bcore::YamlConfig config;
    QCOMPARE(config.valueByPath("ui.notifications_enabled").toBool(), true);
    QCOMPARE(config.valueByPath("bluetooth.auto_discovery_seconds").toInt(), 15);
    QCOMPARE(config.valueByPath("bluetooth.agent_capability").toString(), QString("KeyboardDisplay"));
}

void TestYamlConfig::testValueByPathMissing()
{
    bcore::YamlConfig config;
    QVERIFY(!config.valueByPath("").isValid());
    QVERIFY(!config.valueByPath("ui.nonexistent").isValid());
    QVERIFY(!config.valueByPath("adapters.hci0.alias").isValid());
    // Leaf traversal stops at scalars
    QVERIFY(!config.valueByPath("ui.filter.deeper").isValid());
}

void TestYamlConfig::testSetValueByPath()
{
    bcore::YamlConfig config;
    QVERIFY(config.setValueByPath("ui.notify_on_pairing", false));
    QCOMPARE(config.notifyOnPairing(), false);

    QVERIFY(config.setValueByPath("bluetooth.rssi_refresh_ms", 5000));
    QCOMPARE(config.rssiRefreshMs(), 5000);
}

void TestYamlConfig::testSetValueByPathAdapters()
{
    bcore::YamlConfig config;
    QVERIFY(config.setValueByPath("adapters.hci0.alias", QString("kitchen")));
    QVERIFY(config.setValueByPath("adapters.hci0.discoverable_timeout", 90));

    QCOMPARE(config.valueByPath("adapters.hci0.alias").toString(), QString("kitchen"));
    QCOMPARE(config.adapterConfig("hci0").discoverableTimeout, 90u);
    QVERIFY(!config.setValueByPath("adapters.hci0.color", QString("blue")));
}

void TestYamlConfig::testSetValueByPathRejectsUnknown()
{
    bcore::YamlConfig config;
    QVERIFY(!config.setValueByPath("", 1));
    QVERIFY(!config.setValueByPath("ui.nonexistent", 1));
    QVERIFY(!config.setValueByPath("bogus.key", 1));
    // Sections are not scalars
    QVERIFY(!config.setValueByPath("ui", 1));
    QVERIFY(!config.valueByPath("ui.nonexistent").isValid());
}

void TestYamlConfig::testLoadMalformedThrows()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = writeFile(dir, "ui: [unterminated\n");

    bcore::YamlConfig config;
    bool thrown = false;
    try {
        config.load(path);
    } catch (const YAML::Exception&) {
        thrown = true;
    }
    QVERIFY(thrown);
}

QTEST_MAIN(TestYamlConfig)
#include "test_yaml_config.moc"
