#pragma once

#include <QString>
#include <QVariant>
#include <yaml-cpp/yaml.h>

namespace pem {

/// Market settings. Built-in defaults are deep-merged with the on-disk file,
/// so a partial file only overrides the keys it names.
class YamlConfig {
public:
    YamlConfig();

    /// Throws YAML::Exception on unreadable or malformed files.
    void load(const QString& filePath);
    bool save(const QString& filePath) const;

    /// ~/.config/pem/config.yaml
    static QString defaultPath();

    // Market
    QString mode() const;
    QString bootRoot() const;

    // Download
    int downloadThreads() const;
    QString defaultDownloadDirectory() const;
    void setDefaultDownloadDirectory(const QString& v);

    // Network
    int requestTimeoutMs() const;
    int probeAttempts() const;
    int probeTimeoutMs() const;
    int probeDelayMs() const;

    // Logging
    bool verboseLogging() const;

    /// Dotted-path access to leaf settings, e.g. "network.probe_attempts".
    /// Invalid QVariant for unknown keys and sections.
    QVariant valueByPath(const QString& dottedKey) const;

    /// Only leaf keys of the defaults tree are writable, and the value must
    /// read back as the default's kind (integer, boolean or text).
    bool setValueByPath(const QString& dottedKey, const QVariant& value);

private:
    YAML::Node root_;

    static YAML::Node defaults();
};

} // namespace pem
