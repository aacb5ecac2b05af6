#pragma once

#include <QList>
#include <QString>
#include <QStringList>

namespace pem {

enum class PluginMode {
    CloudPE,
    HotPE,
    Edgeless,
    Select      // source chooser placeholder, carries no rules
};

enum class PluginField {
    Name,
    Version,
    Author,
    Description
};

enum class CatalogSchema {
    None,
    Coded,      // {code, message, data:[{class, icon, list:[plugin]}]}
    Stated      // {state, data:[{class, icon, list:[{name, size, modified, link}]}]}
};

/// Static per-ecosystem rules. Every per-mode decision (URLs, folder,
/// extensions, filename grammar, wording) is read from this table.
struct ModeProfile {
    PluginMode mode = PluginMode::Select;
    QString id;                 // config / CLI name: "cloudpe", "hotpe", "edgeless"
    QString catalogUrl;
    QString connectTestUrl;
    QString folder;             // relative to the boot root
    QString enabledExtension;   // with leading dot
    QString disabledExtension;  // with leading dot, may be compound (".hpm.off")
    QList<PluginField> fieldOrder;
    int minTokens = 0;
    bool nameForEmptyDescription = false;
    QString disableFallbackSuffix;  // appended on disable when the enabled suffix is missing
    CatalogSchema schema = CatalogSchema::None;

    QString title;
    QString serverName;
    QString marketName;
    QString manageName;

    bool isActive() const { return mode != PluginMode::Select; }

    /// `<root>/<folder>`, or empty when root is empty.
    QString pluginDirectory(const QString& root) const;

    static const ModeProfile& forMode(PluginMode mode);

    /// "--hpm" selects HotPE, "--edgeless" Edgeless, "--select" the chooser,
    /// anything else Cloud-PE.
    static PluginMode modeFromArguments(const QStringList& arguments);

    /// Parse a config value ("cloudpe", "hotpe", "edgeless"). Unknown names map to CloudPE.
    static PluginMode modeFromName(const QString& name);
};

} // namespace pem
