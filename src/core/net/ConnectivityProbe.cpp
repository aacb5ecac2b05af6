#include "ConnectivityProbe.hpp"
#include "core/net/HttpClient.hpp"
#include <QThread>
#include <QUrl>
#include <boost/log/trivial.hpp>

namespace pem {

ConnectivityProbe::ConnectivityProbe(ProbeSettings settings)
    : settings_(settings)
{
}

Status ConnectivityProbe::check(const ModeProfile& profile) const
{
    if (profile.connectTestUrl.isEmpty())
        return Status::failure(ErrorKind::Network, "no connectivity test URL for mode " + profile.id);

    HttpClient client(settings_.timeoutMs);
    const QUrl url(profile.connectTestUrl);
    const int attempts = qMax(1, settings_.attempts);
    QString lastError;

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        auto result = client.get(url);
        if (result.ok() && !result.value.body.isEmpty()) {
            BOOST_LOG_TRIVIAL(debug) << profile.serverName.toStdString() << " reachable (attempt "
                                     << attempt << ")";
            return Status::success();
        }

        lastError = result.ok() ? QStringLiteral("empty response") : result.status.message;
        BOOST_LOG_TRIVIAL(warning) << "Connectivity check " << attempt << "/" << attempts
                                   << " against " << profile.connectTestUrl.toStdString()
                                   << " failed: " << lastError.toStdString();

        if (attempt < attempts && settings_.delayMs > 0)
            QThread::msleep(static_cast<unsigned long>(settings_.delayMs));
    }

    return Status::failure(ErrorKind::Network,
                           QString("%1 unreachable after %2 attempts: %3")
                               .arg(profile.serverName).arg(attempts).arg(lastError));
}

} // namespace pem
