#include "core/YamlConfig.hpp"
#include <fstream>

namespace bcore {

namespace {

constexpr int MaxAliasLength = 248;
constexpr uint32_t MaxTimeoutSeconds = 65535;

// Overlay wins; mappings are merged key by key so a partial file keeps the
// remaining defaults. Sequences (device lists) are replaced as a whole.
YAML::Node mergeYaml(const YAML::Node& base, const YAML::Node& overlay)
{
    if (!overlay.IsDefined() || overlay.IsNull())
        return YAML::Clone(base);
    if (!base.IsDefined() || base.IsNull() || !base.IsMap() || !overlay.IsMap())
        return YAML::Clone(overlay);

    YAML::Node result = YAML::Clone(base);
    for (auto it = overlay.begin(); it != overlay.end(); ++it) {
        const auto key = it->first.as<std::string>();
        result[key] = result[key] ? mergeYaml(result[key], it->second) : YAML::Clone(it->second);
    }
    return result;
}

QVariant yamlScalarToVariant(const YAML::Node& node)
{
    if (!node.IsScalar()) return {};

    const QString s = QString::fromStdString(node.Scalar());

    if (s == QLatin1String("true")) return QVariant(true);
    if (s == QLatin1String("false")) return QVariant(false);

    bool intOk = false;
    int i = s.toInt(&intOk);
    if (intOk) return QVariant(i);

    bool dblOk = false;
    double d = s.toDouble(&dblOk);
    if (dblOk) return QVariant(d);

    return QVariant(s);
}

void assignScalar(YAML::Node node, const std::string& key, const QVariant& value)
{
    switch (value.typeId()) {
    case QMetaType::Bool:
        node[key] = value.toBool();
        break;
    case QMetaType::Int:
    case QMetaType::UInt:
    case QMetaType::LongLong:
    case QMetaType::ULongLong:
        node[key] = value.toLongLong();
        break;
    case QMetaType::Double:
    case QMetaType::Float:
        node[key] = value.toDouble();
        break;
    default:
        node[key] = value.toString().toStdString();
        break;
    }
}

} // namespace

bool AdapterConfig::isValid() const
{
    if (alias.size() > MaxAliasLength) return false;
    return discoverableTimeout <= MaxTimeoutSeconds && pairableTimeout <= MaxTimeoutSeconds;
}

YamlConfig::YamlConfig()
{
    initDefaults();
}

void YamlConfig::initDefaults()
{
    root_ = YAML::Node(YAML::NodeType::Map);

    root_["adapters"] = YAML::Node(YAML::NodeType::Map);

    root_["devices"]["trusted"] = YAML::Node(YAML::NodeType::Sequence);
    root_["devices"]["blocked"] = YAML::Node(YAML::NodeType::Sequence);

    root_["ui"]["filter"] = "all";
    root_["ui"]["sort_order"] = "name";
    root_["ui"]["show_only_paired"] = false;
    root_["ui"]["show_only_connected"] = false;
    root_["ui"]["notifications_enabled"] = true;
    root_["ui"]["notify_on_connect"] = true;
    root_["ui"]["notify_on_disconnect"] = true;
    root_["ui"]["notify_on_pairing"] = true;
    root_["ui"]["notify_on_transfer"] = true;

    root_["bluetooth"]["agent_capability"] = "KeyboardDisplay";
    root_["bluetooth"]["auto_discovery_seconds"] = 15;
    root_["bluetooth"]["rssi_refresh_ms"] = 30000;
    root_["bluetooth"]["pairing_timeout_ms"] = 30000;
}

YAML::Node YamlConfig::buildDefaultsNode()
{
    YamlConfig tmp;
    return YAML::Clone(tmp.root_);
}

YAML::Node YamlConfig::buildAdapterDefaults()
{
    YAML::Node node(YAML::NodeType::Map);
    node["alias"] = "";
    node["discoverable_timeout"] = 180;
    node["pairable_timeout"] = 0;
    return node;
}

void YamlConfig::load(const QString& filePath)
{
    initDefaults();
    YAML::Node defaults = YAML::Clone(root_);

    YAML::Node loaded = YAML::LoadFile(filePath.toStdString());
    root_ = mergeYaml(defaults, loaded);
}

void YamlConfig::save(const QString& filePath) const
{
    std::ofstream fout(filePath.toStdString());
    fout << root_;
}

QStringList YamlConfig::readList(const YAML::Node& node)
{
    QStringList result;
    if (!node.IsSequence()) return result;
    for (const auto& item : node)
        result.append(QString::fromStdString(item.as<std::string>()));
    return result;
}

YAML::Node YamlConfig::writeList(const QStringList& values)
{
    YAML::Node node(YAML::NodeType::Sequence);
    for (const auto& v : values)
        node.push_back(v.toStdString());
    return node;
}

// --- Adapters ---

QStringList YamlConfig::configuredAdapters() const
{
    QStringList names;
    const YAML::Node adapters = root_["adapters"];
    if (!adapters.IsMap()) return names;
    for (auto it = adapters.begin(); it != adapters.end(); ++it)
        names.append(QString::fromStdString(it->first.as<std::string>()));
    names.sort();
    return names;
}

bool YamlConfig::hasAdapterConfig(const QString& adapterName) const
{
    const YAML::Node adapters = root_["adapters"];
    return adapters.IsMap() && adapters[adapterName.toStdString()].IsMap();
}

AdapterConfig YamlConfig::adapterConfig(const QString& adapterName) const
{
    AdapterConfig config;
    const YAML::Node node = root_["adapters"][adapterName.toStdString()];
    if (!node.IsMap()) return config;

    config.alias = QString::fromStdString(node["alias"].as<std::string>(""));
    config.discoverableTimeout = node["discoverable_timeout"].as<uint32_t>(180);
    config.pairableTimeout = node["pairable_timeout"].as<uint32_t>(0);
    return config;
}

void YamlConfig::setAdapterConfig(const QString& adapterName, const AdapterConfig& config)
{
    YAML::Node node = root_["adapters"][adapterName.toStdString()];
    node["alias"] = config.alias.toStdString();
    node["discoverable_timeout"] = config.discoverableTimeout;
    node["pairable_timeout"] = config.pairableTimeout;
}

// --- Devices ---

QStringList YamlConfig::trustedDevices() const
{
    return readList(root_["devices"]["trusted"]);
}

void YamlConfig::setTrustedDevices(const QStringList& addresses)
{
    root_["devices"]["trusted"] = writeList(addresses);
}

QStringList YamlConfig::blockedDevices() const
{
    return readList(root_["devices"]["blocked"]);
}

void YamlConfig::setBlockedDevices(const QStringList& addresses)
{
    root_["devices"]["blocked"] = writeList(addresses);
}

// --- UI ---

QString YamlConfig::filter() const
{
    return QString::fromStdString(root_["ui"]["filter"].as<std::string>("all"));
}

void YamlConfig::setFilter(const QString& v)
{
    root_["ui"]["filter"] = v.toStdString();
}

QString YamlConfig::sortOrder() const
{
    return QString::fromStdString(root_["ui"]["sort_order"].as<std::string>("name"));
}

void YamlConfig::setSortOrder(const QString& v)
{
    root_["ui"]["sort_order"] = v.toStdString();
}

bool YamlConfig::showOnlyPaired() const
{
    return root_["ui"]["show_only_paired"].as<bool>(false);
}

void YamlConfig::setShowOnlyPaired(bool v)
{
    root_["ui"]["show_only_paired"] = v;
}

bool YamlConfig::showOnlyConnected() const
{
    return root_["ui"]["show_only_connected"].as<bool>(false);
}

void YamlConfig::setShowOnlyConnected(bool v)
{
    root_["ui"]["show_only_connected"] = v;
}

bool YamlConfig::notificationsEnabled() const
{
    return root_["ui"]["notifications_enabled"].as<bool>(true);
}

void YamlConfig::setNotificationsEnabled(bool v)
{
    root_["ui"]["notifications_enabled"] = v;
}

bool YamlConfig::notifyOnConnect() const
{
    return root_["ui"]["notify_on_connect"].as<bool>(true);
}

bool YamlConfig::notifyOnDisconnect() const
{
    return root_["ui"]["notify_on_disconnect"].as<bool>(true);
}

bool YamlConfig::notifyOnPairing() const
{
    return root_["ui"]["notify_on_pairing"].as<bool>(true);
}

bool YamlConfig::notifyOnTransfer() const
{
    return root_["ui"]["notify_on_transfer"].as<bool>(true);
}

// --- Bluetooth ---

QString YamlConfig::agentCapability() const
{
    return QString::fromStdString(root_["bluetooth"]["agent_capability"].as<std::string>("KeyboardDisplay"));
}

void YamlConfig::setAgentCapability(const QString& v)
{
    root_["bluetooth"]["agent_capability"] = v.toStdString();
}

int YamlConfig::autoDiscoverySeconds() const
{
    return root_["bluetooth"]["auto_discovery_seconds"].as<int>(15);
}

void YamlConfig::setAutoDiscoverySeconds(int v)
{
    root_["bluetooth"]["auto_discovery_seconds"] = v;
}

int YamlConfig::rssiRefreshMs() const
{
    return root_["bluetooth"]["rssi_refresh_ms"].as<int>(30000);
}

void YamlConfig::setRssiRefreshMs(int v)
{
    root_["bluetooth"]["rssi_refresh_ms"] = v;
}

int YamlConfig::pairingTimeoutMs() const
{
    return root_["bluetooth"]["pairing_timeout_ms"].as<int>(30000);
}

void YamlConfig::setPairingTimeoutMs(int v)
{
    root_["bluetooth"]["pairing_timeout_ms"] = v;
}

// --- Generic dot-path access ---

QVariant YamlConfig::valueByPath(const QString& dottedKey) const
{
    if (dottedKey.isEmpty()) return {};

    const QStringList parts = dottedKey.split('.');

    YAML::Node node = YAML::Clone(root_);
    for (const auto& part : parts) {
        if (!node.IsMap()) return {};
        node.reset(node[part.toStdString()]);
        if (!node.IsDefined() || node.IsNull()) return {};
    }

    if (node.IsSequence())
        return readList(node);
    return yamlScalarToVariant(node);
}

bool YamlConfig::setValueByPath(const QString& dottedKey, const QVariant& value)
{
    if (dottedKey.isEmpty()) return false;

    const QStringList parts = dottedKey.split('.');

    // Validate against the defaults tree. Adapter entries are open-ended, so
    // "adapters.<name>.<key>" is checked against the per-adapter template.
    {
        YAML::Node schema = buildDefaultsNode();
        QStringList rest = parts;
        if (parts.size() == 3 && parts.first() == QLatin1String("adapters")) {
            schema = buildAdapterDefaults();
            rest = parts.mid(2);
        }
        for (const auto& part : rest) {
            if (!schema.IsMap()) return false;
            schema.reset(schema[part.toStdString()]);
            if (!schema.IsDefined()) return false;
        }
        if (!schema.IsScalar()) return false;
    }

    YAML::Node node = root_;
    for (int i = 0; i < parts.size() - 1; ++i) {
        if (node.IsDefined() && !node.IsNull() && !node.IsMap()) return false;
        node.reset(node[parts[i].toStdString()]);
    }

    assignScalar(node, parts.last().toStdString(), value);
    return true;
}

} // namespace bcore
