#include "core/YamlConfig.hpp"
#include "core/YamlMerge.hpp"
#include <QDir>
#include <QFileInfo>
#include <QStringList>
#include <boost/log/trivial.hpp>
#include <fstream>

namespace pem {

namespace {

enum class ScalarKind { Integer, Boolean, Text };

// Kind of a default value; decides how the same key is read and written.
ScalarKind kindOf(const YAML::Node& scalar)
{
    int i = 0;
    if (YAML::convert<int>::decode(scalar, i))
        return ScalarKind::Integer;
    bool b = false;
    if (YAML::convert<bool>::decode(scalar, b))
        return ScalarKind::Boolean;
    return ScalarKind::Text;
}

// Follows a dotted path through mappings. Undefined node when a step is missing.
YAML::Node findNode(const YAML::Node& root, const QStringList& parts)
{
    YAML::Node node = root;
    for (const auto& part : parts) {
        if (!node.IsMap())
            return YAML::Node(YAML::NodeType::Undefined);
        const YAML::Node& current = node;
        node.reset(current[part.toStdString()]);
        if (!node.IsDefined())
            return YAML::Node(YAML::NodeType::Undefined);
    }
    return node;
}

} // namespace

YamlConfig::YamlConfig()
    : root_(defaults())
{
}

YAML::Node YamlConfig::defaults()
{
    YAML::Node root(YAML::NodeType::Map);

    root["market"]["mode"] = "cloudpe";
    root["market"]["boot_root"] = "";

    root["download"]["threads"] = 8;
    root["download"]["default_directory"] = "";

    root["network"]["request_timeout_ms"] = 30000;
    root["network"]["probe_attempts"] = 3;
    root["network"]["probe_timeout_ms"] = 5000;
    root["network"]["probe_delay_ms"] = 1000;

    root["logging"]["verbose"] = false;
    return root;
}

void YamlConfig::load(const QString& filePath)
{
    YAML::Node loaded = YAML::LoadFile(filePath.toStdString());
    QStringList rejected;
    root_ = mergeYaml(defaults(), loaded, &rejected);
    for (const auto& key : rejected)
        BOOST_LOG_TRIVIAL(warning) << "Config " << filePath.toStdString() << ": ignoring " << key.toStdString()
                                   << " (wrong shape, default kept)";
}

bool YamlConfig::save(const QString& filePath) const
{
    QDir().mkpath(QFileInfo(filePath).absolutePath());
    std::ofstream fout(filePath.toStdString());
    fout << root_ << "\n";
    return static_cast<bool>(fout);
}

QString YamlConfig::defaultPath()
{
    return QDir::homePath() + "/.config/pem/config.yaml";
}

// --- Market ---

QString YamlConfig::mode() const
{
    return QString::fromStdString(root_["market"]["mode"].as<std::string>("cloudpe"));
}

QString YamlConfig::bootRoot() const
{
    return QString::fromStdString(root_["market"]["boot_root"].as<std::string>(""));
}

// --- Download ---

int YamlConfig::downloadThreads() const
{
    int threads = root_["download"]["threads"].as<int>(8);
    return threads > 0 ? threads : 8;
}

QString YamlConfig::defaultDownloadDirectory() const
{
    return QString::fromStdString(root_["download"]["default_directory"].as<std::string>(""));
}

void YamlConfig::setDefaultDownloadDirectory(const QString& v)
{
    root_["download"]["default_directory"] = v.toStdString();
}

// --- Network ---

int YamlConfig::requestTimeoutMs() const
{
    return root_["network"]["request_timeout_ms"].as<int>(30000);
}

int YamlConfig::probeAttempts() const
{
    return root_["network"]["probe_attempts"].as<int>(3);
}

int YamlConfig::probeTimeoutMs() const
{
    return root_["network"]["probe_timeout_ms"].as<int>(5000);
}

int YamlConfig::probeDelayMs() const
{
    return root_["network"]["probe_delay_ms"].as<int>(1000);
}

// --- Logging ---

bool YamlConfig::verboseLogging() const
{
    return root_["logging"]["verbose"].as<bool>(false);
}

// --- Dotted paths ---

QVariant YamlConfig::valueByPath(const QString& dottedKey) const
{
    if (dottedKey.isEmpty())
        return {};

    const QStringList parts = dottedKey.split('.');
    const YAML::Node known = findNode(defaults(), parts);
    const YAML::Node node = findNode(root_, parts);
    if (!known.IsScalar() || !node.IsScalar())
        return {};

    switch (kindOf(known)) {
    case ScalarKind::Integer: {
        int i = 0;
        if (YAML::convert<int>::decode(node, i))
            return i;
        break;
    }
    case ScalarKind::Boolean: {
        bool b = false;
        if (YAML::convert<bool>::decode(node, b))
            return b;
        break;
    }
    case ScalarKind::Text:
        break;
    }
    // Hand-edited value of the wrong kind: report it as written
    return QString::fromStdString(node.Scalar());
}

bool YamlConfig::setValueByPath(const QString& dottedKey, const QVariant& value)
{
    if (dottedKey.isEmpty() || !value.isValid())
        return false;

    const QStringList parts = dottedKey.split('.');
    const YAML::Node known = findNode(defaults(), parts);
    if (!known.IsScalar())
        return false;

    YAML::Node scalar(value.toString().toStdString());
    switch (kindOf(known)) {
    case ScalarKind::Integer: {
        int i = 0;
        if (!YAML::convert<int>::decode(scalar, i))
            return false;
        break;
    }
    case ScalarKind::Boolean: {
        bool b = false;
        if (!YAML::convert<bool>::decode(scalar, b))
            return false;
        scalar = b;
        break;
    }
    case ScalarKind::Text:
        break;
    }

    // Sections always exist: load() never lets a file replace one
    YAML::Node node = root_;
    for (int i = 0; i < parts.size() - 1; ++i)
        node.reset(node[parts[i].toStdString()]);
    node[parts.last().toStdString()] = scalar;
    return true;
}

} // namespace pem
