#include "LifecycleOrchestrator.hpp"
#include "FilenameCodec.hpp"
#include "LocalPluginScanner.hpp"
#include "PluginRegistry.hpp"
#include "core/net/DownloadEngine.hpp"
#include "core/net/HttpClient.hpp"
#include "core/services/IBootRootProvider.hpp"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutexLocker>
#include <QReadLocker>
#include <QScopeGuard>
#include <QThreadPool>
#include <QUrl>
#include <QWriteLocker>
#include <boost/log/trivial.hpp>
#include <exception>

namespace pem {

LifecycleOrchestrator::LifecycleOrchestrator(const ModeProfile& profile, PluginRegistry* registry,
                                             const IBootRootProvider* bootRoot, QThreadPool* pool,
                                             QObject* parent)
    : QObject(parent)
    , profile_(profile)
    , registry_(registry)
    , bootRoot_(bootRoot)
    , pool_(pool)
{
    qRegisterMetaType<pem::OperationKind>("pem::OperationKind");
}

LifecycleOrchestrator::~LifecycleOrchestrator()
{
    // Queued tasks capture this
    pool_->waitForDone();
}

// --- Asynchronous operations ---

bool LifecycleOrchestrator::install(const Plugin& remote)
{
    return startTask(remote, OperationKind::Install, [this, remote](DownloadProgress& progress) {
        return installNow(remote, progress);
    });
}

bool LifecycleOrchestrator::update(const Plugin& remote)
{
    return startTask(remote, OperationKind::Update, [this, remote](DownloadProgress& progress) {
        return updateNow(remote, progress);
    });
}

bool LifecycleOrchestrator::updateInstalled(const Plugin& local)
{
    return startTask(local, OperationKind::Update, [this, local](DownloadProgress& progress) {
        auto remote = registry_->findRemoteByIdentity(local.identityKey());
        if (!remote)
            return Status::failure(ErrorKind::NotFound,
                                   "no catalog entry for " + local.displayId());
        return updateNow(*remote, progress);
    });
}

bool LifecycleOrchestrator::enable(const Plugin& local)
{
    return startTask(local, OperationKind::Enable, [this, local](DownloadProgress&) {
        return renameNow(local, true);
    });
}

bool LifecycleOrchestrator::disable(const Plugin& local)
{
    return startTask(local, OperationKind::Disable, [this, local](DownloadProgress&) {
        return renameNow(local, false);
    });
}

bool LifecycleOrchestrator::downloadTo(const Plugin& remote, const QString& directory)
{
    const QString target = directory.isEmpty() ? defaultDownloadDirectory() : directory;
    return startTask(remote, OperationKind::Download, [this, remote, target](DownloadProgress& progress) {
        return downloadToNow(remote, target, progress);
    });
}

bool LifecycleOrchestrator::startTask(const Plugin& plugin, OperationKind kind, Work work)
{
    const QString identity = plugin.identityKey();
    auto progress = tasks_.tryBegin(identity, kind);
    if (!progress) {
        BOOST_LOG_TRIVIAL(info) << operationKindName(kind) << " of " << plugin.displayId().toStdString()
                                << " already running, request ignored";
        return false;
    }

    const std::string label = std::string(operationKindName(kind)) + " of " + plugin.displayId().toStdString();
    BOOST_LOG_TRIVIAL(info) << "Starting " << label;

    pool_->start([this, identity, kind, progress, label, work = std::move(work)]() {
        Status status;
        {
            auto cleanup = qScopeGuard([&] { tasks_.finish(identity, kind); });
            try {
                status = work(*progress);
            } catch (const std::exception& e) {
                status = Status::failure(ErrorKind::Io, QString::fromUtf8(e.what()));
            }
        }

        if (status.ok())
            BOOST_LOG_TRIVIAL(info) << "Finished " << label;
        else
            BOOST_LOG_TRIVIAL(error) << label << " failed (" << errorKindName(status.kind) << "): "
                                     << status.message.toStdString();

        emit operationFinished(identity, kind, status.ok(), status.message);
    });
    return true;
}

// --- Worker bodies ---

Status LifecycleOrchestrator::installNow(const Plugin& remote, DownloadProgress& progress)
{
    const QString dir = pluginDirectory();
    if (dir.isEmpty())
        return Status::failure(ErrorKind::NotFound, "no boot root selected");
    if (!QDir().mkpath(dir))
        return Status::failure(ErrorKind::Io, "cannot create " + dir);

    const QString destination = QDir(dir).filePath(FilenameCodec::installFileName(remote, profile_));
    Status status = downloadFile(remote, destination, progress);
    if (!status.ok()) {
        // Leave no half-written plugin behind for the scanner to pick up
        QFile::remove(destination);
        Status scanned = rescan();
        if (!scanned.ok())
            BOOST_LOG_TRIVIAL(warning) << "Rescan after failed download: " << scanned.message.toStdString();
        return status;
    }
    return rescan();
}

Status LifecycleOrchestrator::updateNow(const Plugin& remote, DownloadProgress& progress)
{
    const QString dir = pluginDirectory();
    if (dir.isEmpty())
        return Status::failure(ErrorKind::NotFound, "no boot root selected");

    auto local = registry_->findLocalByIdentity(remote.identityKey());
    if (local && !local->file.isEmpty()) {
        const QString path = QDir(dir).filePath(local->file);
        if (QFileInfo::exists(path) && !QFile::remove(path))
            return Status::failure(ErrorKind::Io, "cannot delete " + path);
        BOOST_LOG_TRIVIAL(info) << "Removed " << local->file.toStdString() << " (v"
                                << local->version.toStdString() << ") for update to v"
                                << remote.version.toStdString();
    }
    return installNow(remote, progress);
}

Status LifecycleOrchestrator::renameNow(const Plugin& local, bool enable)
{
    const QString dir = pluginDirectory();
    if (dir.isEmpty())
        return Status::failure(ErrorKind::NotFound, "no boot root selected");

    const QString source = QDir(dir).filePath(local.file);
    if (local.file.isEmpty() || !QFileInfo(source).isFile())
        return Status::failure(ErrorKind::NotFound, "file not found: " + source);

    const QString targetName = enable ? FilenameCodec::enabledFileName(local.file, profile_)
                                      : FilenameCodec::disabledFileName(local.file, profile_);
    if (targetName != local.file) {
        const QString target = QDir(dir).filePath(targetName);
        if (QFileInfo::exists(target))
            return Status::failure(ErrorKind::Io, target + " already exists");
        if (!QFile::rename(source, target))
            return Status::failure(ErrorKind::Io, "cannot rename " + source + " to " + targetName);
        BOOST_LOG_TRIVIAL(info) << (enable ? "Enabled " : "Disabled ") << local.file.toStdString()
                                << " -> " << targetName.toStdString();
    }
    return rescan();
}

Status LifecycleOrchestrator::downloadToNow(const Plugin& remote, const QString& directory,
                                            DownloadProgress& progress)
{
    if (directory.isEmpty())
        return Status::failure(ErrorKind::NotFound, "no download directory configured");

    const QString destination = QDir(directory).filePath(FilenameCodec::installFileName(remote, profile_));
    Status status = downloadFile(remote, destination, progress);
    if (!status.ok())
        QFile::remove(destination);
    return status;
}

Status LifecycleOrchestrator::downloadFile(const Plugin& remote, const QString& destination,
                                           DownloadProgress& progress)
{
    if (remote.link.isEmpty())
        return Status::failure(ErrorKind::Network, "no download link for " + remote.displayId());

    HttpClient client(timeoutMs_.load());
    DownloadEngine engine(client);
    return engine.download(QUrl(remote.link), destination, progress);
}

// --- Synchronous operations ---

Status LifecycleOrchestrator::remove(const Plugin& local)
{
    const QString dir = pluginDirectory();
    if (dir.isEmpty())
        return Status::failure(ErrorKind::NotFound, "no boot root selected");

    const QString path = QDir(dir).filePath(local.file);
    if (local.file.isEmpty() || !QFileInfo::exists(path))
        return Status::failure(ErrorKind::NotFound, "file not found: " + path);

    QFile file(path);
    if (!file.remove())
        return Status::failure(ErrorKind::Io, "cannot delete " + path + ": " + file.errorString());

    BOOST_LOG_TRIVIAL(info) << "Deleted " << local.file.toStdString();
    return Status::success();
}

Status LifecycleOrchestrator::rescan()
{
    const QString dir = pluginDirectory();
    if (dir.isEmpty())
        return Status::failure(ErrorKind::NotFound, "no boot root selected");

    // Scan and commit as one step so an older snapshot never overwrites a newer one
    QMutexLocker locker(&rescanMutex_);
    auto snapshot = LocalPluginScanner::scan(dir, profile_);
    if (!snapshot.ok())
        return snapshot.status;
    registry_->replaceLocal(snapshot.value);
    return Status::success();
}

// --- Queries and settings ---

bool LifecycleOrchestrator::isRunning(const QString& identityKey, OperationKind kind) const
{
    return tasks_.isRunning(identityKey, kind);
}

std::optional<DownloadProgress::Snapshot> LifecycleOrchestrator::progress(const QString& identityKey,
                                                                          OperationKind kind) const
{
    auto record = tasks_.progress(identityKey, kind);
    if (!record)
        return std::nullopt;
    return record->snapshot();
}

int LifecycleOrchestrator::runningCount() const
{
    return tasks_.count();
}

QString LifecycleOrchestrator::pluginDirectory() const
{
    if (!bootRoot_)
        return {};
    return profile_.pluginDirectory(bootRoot_->currentRoot());
}

void LifecycleOrchestrator::setDefaultDownloadDirectory(const QString& directory)
{
    QWriteLocker locker(&settingsLock_);
    defaultDownloadDirectory_ = directory;
}

QString LifecycleOrchestrator::defaultDownloadDirectory() const
{
    QReadLocker locker(&settingsLock_);
    return defaultDownloadDirectory_;
}

void LifecycleOrchestrator::setRequestTimeout(int timeoutMs)
{
    timeoutMs_.store(timeoutMs);
}

} // namespace pem
