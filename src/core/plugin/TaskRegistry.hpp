#pragma once

#include "Plugin.hpp"
#include "core/net/DownloadProgress.hpp"
#include <QHash>
#include <QReadWriteLock>
#include <memory>

namespace pem {

/// In-flight lifecycle operations keyed by (identity, kind).
///
/// At most one entry per key exists at a time. Each entry owns a progress
/// record that stays valid for holders of the shared pointer after finish().
class TaskRegistry {
public:
    /// Registers a task. Returns nullptr when one with the same key is running.
    std::shared_ptr<DownloadProgress> tryBegin(const QString& identityKey, OperationKind kind);
    void finish(const QString& identityKey, OperationKind kind);

    bool isRunning(const QString& identityKey, OperationKind kind) const;
    std::shared_ptr<DownloadProgress> progress(const QString& identityKey, OperationKind kind) const;
    int count() const;

private:
    static QString taskKey(const QString& identityKey, OperationKind kind);

    mutable QReadWriteLock lock_;
    QHash<QString, std::shared_ptr<DownloadProgress>> tasks_;
};

} // namespace pem
