#pragma once

#include <QList>
#include <QMetaType>
#include <QString>

namespace pem {

/// One plugin, either a remote catalog entry or a local file.
/// Remote entries carry `link`; local entries carry `file`.
struct Plugin {
    QString name;
    QString version;
    QString author;
    QString description;
    QString size;       // display string, e.g. "2.00 MB"
    QString file;       // on-disk (or remote) file name, empty for pure catalog entries
    QString link;       // download URL, empty for local entries
    QString modified;   // catalog timestamp, only filled by the HotPE catalog

    /// (name, author) correlates a catalog entry with an installed file.
    QString identityKey() const { return name + QChar(0x1F) + author; }

    /// (name, version, author, size) collapses duplicate entries.
    QString dedupKey() const
    {
        return name + QChar(0x1F) + version + QChar(0x1F) + author + QChar(0x1F) + size;
    }

    /// Human-readable identity for logs.
    QString displayId() const { return name + "_" + author; }
};

struct PluginCategory {
    QString className;
    QString icon;       // empty when the catalog has none
    QList<Plugin> plugins;
};

enum class PluginStatus {
    NotInstalled,
    Installed,
    UpdateAvailable
};

enum class OperationKind {
    Install,
    Update,
    Enable,
    Disable,
    Download
};

inline const char* operationKindName(OperationKind kind)
{
    switch (kind) {
    case OperationKind::Install: return "install";
    case OperationKind::Update: return "update";
    case OperationKind::Enable: return "enable";
    case OperationKind::Disable: return "disable";
    case OperationKind::Download: return "download";
    }
    return "unknown";
}

} // namespace pem

Q_DECLARE_METATYPE(pem::OperationKind)
