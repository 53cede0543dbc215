#pragma once

#include <QString>
#include <QVariant>

namespace bcore {

class IConfigService {
public:
    virtual ~IConfigService() = default;

    /// Read a config value by dot-notation key (e.g., "ui.notify_on_connect").
    /// List keys ("devices.trusted") return a QStringList.
    /// Returns invalid QVariant if key not found.
    virtual QVariant value(const QString& key) const = 0;

    /// Write a config value. Keys outside the known schema are ignored.
    virtual void setValue(const QString& key, const QVariant& value) = 0;

    /// Flush config to disk.
    virtual void save() = 0;
};

} // namespace bcore
