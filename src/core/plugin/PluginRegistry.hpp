#pragma once

#include "LocalPluginScanner.hpp"
#include "Plugin.hpp"
#include "PluginError.hpp"
#include <QHash>
#include <QObject>
#include <QReadWriteLock>
#include <optional>

namespace pem {

/// In-memory store of the remote catalog and the local snapshot.
///
/// Every accessor copies out under a shared lock, so readers never block each
/// other. Writers compute their new state off-lock and swap it in wholesale
/// under a short exclusive lock. Safe to call from any thread; change signals
/// are emitted on the writer's thread after the lock is released.
class PluginRegistry : public QObject {
    Q_OBJECT
public:
    explicit PluginRegistry(QObject* parent = nullptr);

    QList<PluginCategory> categories() const;
    QList<Plugin> enabledPlugins() const;
    QList<Plugin> disabledPlugins() const;

    /// Case-insensitive substring match over "name author description version"
    /// across all categories, de-duplicated, in catalog order.
    QList<Plugin> search(const QString& keyword) const;

    /// First catalog entry with that identity.
    std::optional<Plugin> findRemoteByIdentity(const QString& identityKey) const;
    /// Enabled local plugin with that identity.
    std::optional<Plugin> findLocalByIdentity(const QString& identityKey) const;

    PluginStatus statusOf(const Plugin& remote) const;

    /// True when the catalog carries a newer version of an installed plugin.
    bool hasUpdate(const Plugin& local) const;

    void replaceCatalog(const QList<PluginCategory>& categories);
    void replaceLocal(const LocalSnapshot& snapshot);

    /// Error of the last catalog load; a failed load also empties the catalog.
    void setCatalogError(const Status& error);
    Status catalogError() const;

signals:
    void catalogChanged();
    void localPluginsChanged();

private:
    mutable QReadWriteLock lock_;
    QList<PluginCategory> categories_;
    QList<Plugin> enabled_;
    QList<Plugin> disabled_;
    QHash<QString, Plugin> enabledByIdentity_;
    Status catalogError_;
};

} // namespace pem
