#include <signal.h>
#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <boost/log/trivial.hpp>
#include <yaml-cpp/exceptions.h>
#include "core/YamlConfig.hpp"
#include "core/bluetooth/BluetoothController.hpp"
#include "core/bluetooth/BluezClient.hpp"
#include "core/services/ConfigService.hpp"
#include "core/services/NotificationService.hpp"
#include "core/services/PolkitAuthorizer.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("BlueCore");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("BlueCore");

    bcore::YamlConfig yamlConfig;
    QString yamlPath = QDir::homePath() + "/.config/bluecore/config.yaml";
    if (QFile::exists(yamlPath)) {
        try {
            yamlConfig.load(yamlPath);
        } catch (const YAML::Exception& e) {
            BOOST_LOG_TRIVIAL(warning) << "[Config] Ignoring unreadable " << yamlPath.toStdString()
                                       << ": " << e.what();
        }
    }

    auto configService = new bcore::ConfigService(&yamlConfig, yamlPath, &app);
    auto notificationService = new bcore::NotificationService(&app);
    auto authorizer = new bcore::PolkitAuthorizer(&app);

    auto controller = new bcore::BluetoothController(new bcore::BluezClient, authorizer,
                                                     configService, notificationService, &app);

    QObject::connect(controller, &bcore::BluetoothController::adapterAdded,
                     [](const bcore::BluetoothAdapter& adapter) {
        BOOST_LOG_TRIVIAL(info) << "Adapter " << adapter.objectPath.toStdString()
                                << " (" << adapter.displayName().toStdString() << ") "
                                << adapter.statusText().toStdString();
    });
    QObject::connect(controller, &bcore::BluetoothController::adapterRemoved, [](const QString& path) {
        BOOST_LOG_TRIVIAL(info) << "Adapter removed: " << path.toStdString();
    });
    QObject::connect(controller, &bcore::BluetoothController::deviceFound,
                     [](const bcore::BluetoothDevice& device) {
        BOOST_LOG_TRIVIAL(debug) << "Device found: " << device.displayName().toStdString()
                                 << " [" << device.address.toStdString() << "]";
    });
    QObject::connect(controller, &bcore::BluetoothController::deviceConnected,
                     [](const bcore::BluetoothDevice& device) {
        BOOST_LOG_TRIVIAL(info) << "Connected: " << device.displayName().toStdString();
    });
    QObject::connect(controller, &bcore::BluetoothController::deviceDisconnected,
                     [](const bcore::BluetoothDevice& device) {
        BOOST_LOG_TRIVIAL(info) << "Disconnected: " << device.displayName().toStdString();
    });
    QObject::connect(controller, &bcore::BluetoothController::pairingRequested,
                     [](const bcore::PairingRequest& request) {
        BOOST_LOG_TRIVIAL(info) << request.dialogTitle().toStdString() << ": "
                                << request.promptText().toStdString();
    });
    QObject::connect(controller, &bcore::BluetoothController::transferCompleted,
                     [](const bcore::FileTransfer& transfer) {
        BOOST_LOG_TRIVIAL(info) << "Transfer complete: " << transfer.filename.toStdString();
    });
    QObject::connect(notificationService, &bcore::NotificationService::notificationAdded,
                     [](const bcore::Notification& n) {
        BOOST_LOG_TRIVIAL(info) << "[Notify] " << n.title.toStdString() << ": " << n.message.toStdString();
    });

    // SIGINT/SIGTERM -> leave the event loop, teardown happens below
    signal(SIGINT, [](int) {
        QMetaObject::invokeMethod(QCoreApplication::instance(), &QCoreApplication::quit,
                                  Qt::QueuedConnection);
    });
    signal(SIGTERM, [](int) {
        QMetaObject::invokeMethod(QCoreApplication::instance(), &QCoreApplication::quit,
                                  Qt::QueuedConnection);
    });

    controller->initialize();

    int ret = app.exec();

    // Controller first: it saves config and unregisters the agent while the bus is still up
    controller->shutdown();

    return ret;
}
