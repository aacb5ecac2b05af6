#include "CatalogService.hpp"
#include "core/net/HttpClient.hpp"
#include "core/net/RemoteCatalogFetcher.hpp"
#include "core/plugin/PluginRegistry.hpp"
#include <QThreadPool>
#include <boost/log/trivial.hpp>
#include <exception>

namespace pem {

CatalogService::CatalogService(const ModeProfile& profile, PluginRegistry* registry, QThreadPool* pool,
                               QObject* parent)
    : QObject(parent)
    , profile_(profile)
    , registry_(registry)
    , pool_(pool)
{
}

CatalogService::~CatalogService()
{
    pool_->waitForDone();
}

bool CatalogService::load()
{
    bool expected = false;
    if (!loading_.compare_exchange_strong(expected, true)) {
        BOOST_LOG_TRIVIAL(debug) << "Catalog load already in progress";
        return false;
    }

    pool_->start([this]() {
        try {
            loadNow();
        } catch (const std::exception& e) {
            Status error = Status::failure(ErrorKind::Io, QString::fromUtf8(e.what()));
            registry_->setCatalogError(error);
            loading_ = false;
            emit catalogLoaded(false, error.message);
        }
    });
    return true;
}

void CatalogService::loadNow()
{
    Status status;

    if (probeEnabled_) {
        ConnectivityProbe probe(probeSettings_);
        status = probe.check(profile_);
    }

    if (status.ok()) {
        HttpClient client(timeoutMs_);
        RemoteCatalogFetcher fetcher(client);
        auto catalog = fetcher.fetch(profile_);
        if (catalog.ok())
            registry_->replaceCatalog(catalog.value);
        status = catalog.status;
    }

    if (!status.ok()) {
        BOOST_LOG_TRIVIAL(error) << "Loading " << profile_.serverName.toStdString() << " catalog failed: "
                                 << status.message.toStdString();
        registry_->setCatalogError(status);
    }

    loading_ = false;
    emit catalogLoaded(status.ok(), status.message);
}

} // namespace pem
