#include "DownloadEngine.hpp"
#include <QDir>
#include <QElapsedTimer>
#include <QFile>
#include <QFileInfo>
#include <boost/log/trivial.hpp>

namespace pem {

static constexpr double MIB = 1024.0 * 1024.0;

DownloadEngine::DownloadEngine(const HttpClient& client)
    : client_(client)
{
}

Status DownloadEngine::download(const QUrl& url, const QString& destination, DownloadProgress& progress) const
{
    const QString parent = QFileInfo(destination).absolutePath();
    if (!QDir().mkpath(parent))
        return Status::failure(ErrorKind::Io, "cannot create directory " + parent);

    QFile file(destination);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate))
        return Status::failure(ErrorKind::Io, "cannot open " + destination + ": " + file.errorString());

    progress.reset(0);
    quint64 received = 0;
    QString writeError;
    QElapsedTimer timer;
    timer.start();

    auto onHeaders = [&](qint64 contentLength) {
        progress.reset(contentLength > 0 ? static_cast<quint64>(contentLength) : 0);
    };

    auto onChunk = [&](const QByteArray& chunk) {
        if (file.write(chunk) != chunk.size()) {
            writeError = file.errorString();
            return false;
        }
        received += static_cast<quint64>(chunk.size());
        const qint64 elapsedMs = timer.elapsed();
        const double speed = elapsedMs > 0 ? (received / MIB) / (elapsedMs / 1000.0) : 0.0;
        progress.update(received, speed);
        return true;
    };

    Status status = client_.stream(url, onHeaders, onChunk);
    file.close();

    if (!status.ok()) {
        if (status.kind == ErrorKind::Io && !writeError.isEmpty())
            status.message = "write to " + destination + " failed: " + writeError;
        BOOST_LOG_TRIVIAL(warning) << "Download of " << url.toString().toStdString()
                                   << " failed: " << status.message.toStdString();
        return status;
    }

    if (file.error() != QFileDevice::NoError)
        return Status::failure(ErrorKind::Io, "write to " + destination + " failed: " + file.errorString());

    BOOST_LOG_TRIVIAL(info) << "Downloaded " << received << " bytes to " << destination.toStdString();
    return Status::success();
}

} // namespace pem
