#pragma once

#include "ModeProfile.hpp"
#include "Plugin.hpp"
#include "PluginError.hpp"
#include "TaskRegistry.hpp"
#include <QMutex>
#include <QObject>
#include <QReadWriteLock>
#include <QString>
#include <atomic>
#include <functional>
#include <optional>

class QThreadPool;

namespace pem {

class IBootRootProvider;
class PluginRegistry;

/// Install / update / enable / disable / delete for one mode's plugin folder.
///
/// Asynchronous operations return false without scheduling anything when a
/// task with the same (identity, kind) is already running. Otherwise the work
/// runs on the thread pool in this order: filesystem change, rescan into the
/// registry, task removal, then operationFinished(). The task entry is removed
/// whether the operation succeeded or not.
class LifecycleOrchestrator : public QObject {
    Q_OBJECT
public:
    LifecycleOrchestrator(const ModeProfile& profile, PluginRegistry* registry,
                          const IBootRootProvider* bootRoot, QThreadPool* pool,
                          QObject* parent = nullptr);
    ~LifecycleOrchestrator() override;

    /// Download the canonical file for a catalog entry into the plugin folder.
    bool install(const Plugin& remote);
    /// Delete the installed file for the entry's identity (if any), then install.
    bool update(const Plugin& remote);
    /// update() driven from an installed plugin; fails with NotFound when the
    /// catalog has no entry for its identity.
    bool updateInstalled(const Plugin& local);
    bool enable(const Plugin& local);
    bool disable(const Plugin& local);
    /// Download a catalog entry outside the plugin folder. An empty directory
    /// means the default download directory. No rescan follows.
    bool downloadTo(const Plugin& remote, const QString& directory = {});

    /// Synchronous delete of a local plugin file. Does not rescan.
    Status remove(const Plugin& local);
    /// Synchronous scan of the plugin folder, committed to the registry on success.
    Status rescan();

    bool isRunning(const QString& identityKey, OperationKind kind) const;
    std::optional<DownloadProgress::Snapshot> progress(const QString& identityKey, OperationKind kind) const;
    int runningCount() const;

    /// `<boot root>/<folder>`, empty when no boot root is selected.
    QString pluginDirectory() const;

    void setDefaultDownloadDirectory(const QString& directory);
    QString defaultDownloadDirectory() const;
    void setRequestTimeout(int timeoutMs);

signals:
    void operationFinished(const QString& identityKey, pem::OperationKind kind, bool ok,
                           const QString& message);

private:
    using Work = std::function<Status(DownloadProgress& progress)>;

    bool startTask(const Plugin& plugin, OperationKind kind, Work work);

    Status installNow(const Plugin& remote, DownloadProgress& progress);
    Status updateNow(const Plugin& remote, DownloadProgress& progress);
    Status renameNow(const Plugin& local, bool enable);
    Status downloadToNow(const Plugin& remote, const QString& directory, DownloadProgress& progress);
    Status downloadFile(const Plugin& remote, const QString& destination, DownloadProgress& progress);

    ModeProfile profile_;
    PluginRegistry* registry_;
    const IBootRootProvider* bootRoot_;
    QThreadPool* pool_;
    TaskRegistry tasks_;
    QMutex rescanMutex_;
    std::atomic<int> timeoutMs_{30000};

    mutable QReadWriteLock settingsLock_;
    QString defaultDownloadDirectory_;
};

} // namespace pem
