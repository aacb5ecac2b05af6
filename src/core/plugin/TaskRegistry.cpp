#include "TaskRegistry.hpp"
#include <QReadLocker>
#include <QWriteLocker>

namespace pem {

QString TaskRegistry::taskKey(const QString& identityKey, OperationKind kind)
{
    return identityKey + QChar(0x1F) + QString::fromLatin1(operationKindName(kind));
}

std::shared_ptr<DownloadProgress> TaskRegistry::tryBegin(const QString& identityKey, OperationKind kind)
{
    const QString key = taskKey(identityKey, kind);
    QWriteLocker locker(&lock_);
    if (tasks_.contains(key))
        return nullptr;
    auto progress = std::make_shared<DownloadProgress>();
    tasks_.insert(key, progress);
    return progress;
}

void TaskRegistry::finish(const QString& identityKey, OperationKind kind)
{
    QWriteLocker locker(&lock_);
    tasks_.remove(taskKey(identityKey, kind));
}

bool TaskRegistry::isRunning(const QString& identityKey, OperationKind kind) const
{
    QReadLocker locker(&lock_);
    return tasks_.contains(taskKey(identityKey, kind));
}

std::shared_ptr<DownloadProgress> TaskRegistry::progress(const QString& identityKey, OperationKind kind) const
{
    QReadLocker locker(&lock_);
    return tasks_.value(taskKey(identityKey, kind));
}

int TaskRegistry::count() const
{
    QReadLocker locker(&lock_);
    return tasks_.size();
}

} // namespace pem
