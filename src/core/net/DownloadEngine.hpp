#pragma once

#include "core/net/DownloadProgress.hpp"
#include "core/net/HttpClient.hpp"
#include "core/plugin/PluginError.hpp"
#include <QString>
#include <QUrl>

namespace pem {

/// Streams an HTTP resource into a file, publishing progress after every chunk.
///
/// Parent directories are created as needed. Any network or write failure
/// aborts the transfer immediately and leaves the partial file on disk; the
/// caller decides whether to remove it.
class DownloadEngine {
public:
    explicit DownloadEngine(const HttpClient& client);

    Status download(const QUrl& url, const QString& destination, DownloadProgress& progress) const;

private:
    const HttpClient& client_;
};

} // namespace pem
