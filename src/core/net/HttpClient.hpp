#pragma once

#include "core/plugin/PluginError.hpp"
#include <QByteArray>
#include <QUrl>
#include <functional>

namespace pem {

struct HttpResponse {
    int statusCode = 0;
    QByteArray body;
};

/// Blocking HTTP GET built on QNetworkAccessManager.
///
/// Each call runs a private QEventLoop, so it can be used from any thread that
/// may block: worker-pool threads, or the main thread in tools and tests.
/// A manager is created per call; no state is shared between threads.
class HttpClient {
public:
    /// Called once response headers are known. -1 when the length is unknown.
    using HeaderHandler = std::function<void(qint64 contentLength)>;
    /// Called for every chunk of body data. Return false to abort the transfer.
    using ChunkHandler = std::function<bool(const QByteArray& chunk)>;

    explicit HttpClient(int timeoutMs = 30000);

    Result<HttpResponse> get(const QUrl& url) const;

    /// Streamed GET. Returns Io when a chunk handler refused data, Network on
    /// transport failure or HTTP error status.
    Status stream(const QUrl& url, const HeaderHandler& onHeaders, const ChunkHandler& onChunk) const;

    int timeoutMs() const { return timeoutMs_; }

private:
    int timeoutMs_;
};

} // namespace pem
