#include "HttpClient.hpp"
#include <QEventLoop>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <boost/log/trivial.hpp>
#include <memory>

namespace pem {

static const char* USER_AGENT = "pem/0.1";

static QNetworkRequest makeRequest(const QUrl& url, int timeoutMs)
{
    QNetworkRequest request(url);
    request.setTransferTimeout(timeoutMs);
    request.setAttribute(QNetworkRequest::RedirectPolicyAttribute,
                         QNetworkRequest::NoLessSafeRedirectPolicy);
    request.setHeader(QNetworkRequest::UserAgentHeader, QString::fromLatin1(USER_AGENT));
    return request;
}

static int httpStatus(const QNetworkReply* reply)
{
    return reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
}

static QString describeFailure(const QNetworkReply* reply, int timeoutMs)
{
    // A transfer timeout surfaces as a cancelled operation
    if (reply->error() == QNetworkReply::OperationCanceledError)
        return QString("request timed out after %1 ms").arg(timeoutMs);

    int status = httpStatus(reply);
    if (status > 0)
        return QString("HTTP %1: %2").arg(status).arg(reply->errorString());
    return reply->errorString();
}

static bool validUrl(const QUrl& url)
{
    return url.isValid() && !url.scheme().isEmpty() && !url.host().isEmpty();
}

HttpClient::HttpClient(int timeoutMs)
    : timeoutMs_(timeoutMs)
{
}

Result<HttpResponse> HttpClient::get(const QUrl& url) const
{
    if (!validUrl(url))
        return Result<HttpResponse>::failure(ErrorKind::Network, "invalid URL '" + url.toString() + "'");

    BOOST_LOG_TRIVIAL(debug) << "GET " << url.toString().toStdString();

    QNetworkAccessManager manager;
    std::unique_ptr<QNetworkReply> reply(manager.get(makeRequest(url, timeoutMs_)));

    QEventLoop loop;
    QObject::connect(reply.get(), &QNetworkReply::finished, &loop, &QEventLoop::quit);
    if (!reply->isFinished())
        loop.exec();

    if (reply->error() != QNetworkReply::NoError) {
        QString message = describeFailure(reply.get(), timeoutMs_);
        BOOST_LOG_TRIVIAL(debug) << "GET " << url.toString().toStdString()
                                 << " failed: " << message.toStdString();
        return Result<HttpResponse>::failure(ErrorKind::Network, message);
    }

    HttpResponse response;
    response.statusCode = httpStatus(reply.get());
    response.body = reply->readAll();
    return Result<HttpResponse>::success(response);
}

Status HttpClient::stream(const QUrl& url, const HeaderHandler& onHeaders, const ChunkHandler& onChunk) const
{
    if (!validUrl(url))
        return Status::failure(ErrorKind::Network, "invalid URL '" + url.toString() + "'");

    BOOST_LOG_TRIVIAL(debug) << "GET (stream) " << url.toString().toStdString();

    QNetworkAccessManager manager;
    std::unique_ptr<QNetworkReply> reply(manager.get(makeRequest(url, timeoutMs_)));

    bool headersSeen = false;
    bool discardBody = false;
    bool refused = false;

    // Headers are taken from the first body read so redirects have already
    // been followed by then
    auto announceHeaders = [&]() {
        if (headersSeen) return;
        headersSeen = true;
        if (httpStatus(reply.get()) >= 400) {
            discardBody = true;
            return;
        }
        if (onHeaders) {
            QVariant length = reply->header(QNetworkRequest::ContentLengthHeader);
            onHeaders(length.isValid() ? length.toLongLong() : -1);
        }
    };

    auto drain = [&]() {
        if (refused) return;
        announceHeaders();
        QByteArray chunk = reply->readAll();
        if (chunk.isEmpty() || discardBody) return;
        if (onChunk && !onChunk(chunk)) {
            refused = true;
            reply->abort();
        }
    };

    QEventLoop loop;
    QObject::connect(reply.get(), &QNetworkReply::readyRead, &loop, drain);
    QObject::connect(reply.get(), &QNetworkReply::finished, &loop, &QEventLoop::quit);
    if (!reply->isFinished())
        loop.exec();

    if (refused)
        return Status::failure(ErrorKind::Io, "transfer aborted, destination refused data");

    if (reply->error() != QNetworkReply::NoError) {
        QString message = describeFailure(reply.get(), timeoutMs_);
        BOOST_LOG_TRIVIAL(debug) << "GET (stream) " << url.toString().toStdString()
                                 << " failed: " << message.toStdString();
        return Status::failure(ErrorKind::Network, message);
    }

    // Whatever arrived together with the finished notification
    drain();
    if (refused)
        return Status::failure(ErrorKind::Io, "transfer aborted, destination refused data");

    return Status::success();
}

} // namespace pem
