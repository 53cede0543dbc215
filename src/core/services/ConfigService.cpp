#include "ConfigService.hpp"
#include "core/YamlConfig.hpp"
#include <QDebug>
#include <QDir>
#include <QFileInfo>

namespace bcore {

ConfigService::ConfigService(YamlConfig* config, const QString& configPath, QObject* parent)
    : QObject(parent), config_(config), configPath_(configPath)
{
}

QVariant ConfigService::value(const QString& key) const
{
    if (key == "devices.trusted") return config_->trustedDevices();
    if (key == "devices.blocked") return config_->blockedDevices();
    return config_->valueByPath(key);
}

void ConfigService::setValue(const QString& key, const QVariant& val)
{
    if (key == "devices.trusted") {
        config_->setTrustedDevices(val.toStringList());
    } else if (key == "devices.blocked") {
        config_->setBlockedDevices(val.toStringList());
    } else if (!config_->setValueByPath(key, val)) {
        qWarning() << "[Config] Ignoring unknown key" << key;
        return;
    }
    emit configChanged(key, val);
}

void ConfigService::save()
{
    if (configPath_.isEmpty()) return;
    QDir().mkpath(QFileInfo(configPath_).absolutePath());
    config_->save(configPath_);
}

} // namespace bcore
