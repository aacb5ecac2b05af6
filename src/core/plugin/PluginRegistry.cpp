#include "PluginRegistry.hpp"
#include "VersionComparator.hpp"
#include <QReadLocker>
#include <QSet>
#include <QStringList>
#include <QWriteLocker>

namespace pem {

PluginRegistry::PluginRegistry(QObject* parent)
    : QObject(parent)
{
}

QList<PluginCategory> PluginRegistry::categories() const
{
    QReadLocker locker(&lock_);
    return categories_;
}

QList<Plugin> PluginRegistry::enabledPlugins() const
{
    QReadLocker locker(&lock_);
    return enabled_;
}

QList<Plugin> PluginRegistry::disabledPlugins() const
{
    QReadLocker locker(&lock_);
    return disabled_;
}

QList<Plugin> PluginRegistry::search(const QString& keyword) const
{
    const QList<PluginCategory> snapshot = categories();
    const QString needle = keyword.toLower();

    QList<Plugin> results;
    QSet<QString> seen;
    for (const auto& category : snapshot) {
        for (const auto& plugin : category.plugins) {
            const QString haystack = QStringList{plugin.name, plugin.author, plugin.description,
                                                 plugin.version}.join(QLatin1Char(' ')).toLower();
            if (!haystack.contains(needle))
                continue;
            const QString key = plugin.dedupKey();
            if (seen.contains(key))
                continue;
            seen.insert(key);
            results.append(plugin);
        }
    }
    return results;
}

std::optional<Plugin> PluginRegistry::findRemoteByIdentity(const QString& identityKey) const
{
    QReadLocker locker(&lock_);
    for (const auto& category : categories_) {
        for (const auto& plugin : category.plugins) {
            if (plugin.identityKey() == identityKey)
                return plugin;
        }
    }
    return std::nullopt;
}

std::optional<Plugin> PluginRegistry::findLocalByIdentity(const QString& identityKey) const
{
    QReadLocker locker(&lock_);
    auto it = enabledByIdentity_.constFind(identityKey);
    if (it == enabledByIdentity_.constEnd())
        return std::nullopt;
    return *it;
}

PluginStatus PluginRegistry::statusOf(const Plugin& remote) const
{
    auto local = findLocalByIdentity(remote.identityKey());
    if (!local)
        return PluginStatus::NotInstalled;
    if (VersionComparator::compare(local->version, remote.version) < 0)
        return PluginStatus::UpdateAvailable;
    return PluginStatus::Installed;
}

bool PluginRegistry::hasUpdate(const Plugin& local) const
{
    auto remote = findRemoteByIdentity(local.identityKey());
    return remote && VersionComparator::compare(local.version, remote->version) < 0;
}

void PluginRegistry::replaceCatalog(const QList<PluginCategory>& categories)
{
    {
        QWriteLocker locker(&lock_);
        categories_ = categories;
        catalogError_ = Status::success();
    }
    emit catalogChanged();
}

void PluginRegistry::replaceLocal(const LocalSnapshot& snapshot)
{
    // Later files with the same identity replace earlier ones
    QHash<QString, Plugin> index;
    for (const auto& plugin : snapshot.enabled)
        index.insert(plugin.identityKey(), plugin);

    {
        QWriteLocker locker(&lock_);
        enabled_ = snapshot.enabled;
        disabled_ = snapshot.disabled;
        enabledByIdentity_.swap(index);
    }
    emit localPluginsChanged();
}

void PluginRegistry::setCatalogError(const Status& error)
{
    {
        QWriteLocker locker(&lock_);
        catalogError_ = error;
        if (!error.ok())
            categories_.clear();
    }
    emit catalogChanged();
}

Status PluginRegistry::catalogError() const
{
    QReadLocker locker(&lock_);
    return catalogError_;
}

} // namespace pem
