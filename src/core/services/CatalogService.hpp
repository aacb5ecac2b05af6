#pragma once

#include "core/net/ConnectivityProbe.hpp"
#include "core/plugin/ModeProfile.hpp"
#include <QObject>
#include <atomic>

class QThreadPool;

namespace pem {

class PluginRegistry;

/// Loads the remote catalog into the registry in the background.
///
/// A load optionally runs the connectivity probe first, then fetches and
/// parses the catalog. Success replaces the catalog and clears the registry's
/// error; failure leaves an empty catalog with the error recorded.
class CatalogService : public QObject {
    Q_OBJECT
public:
    CatalogService(const ModeProfile& profile, PluginRegistry* registry, QThreadPool* pool,
                   QObject* parent = nullptr);
    ~CatalogService() override;

    void setProbeEnabled(bool enabled) { probeEnabled_ = enabled; }
    void setProbeSettings(const ProbeSettings& settings) { probeSettings_ = settings; }
    void setRequestTimeout(int timeoutMs) { timeoutMs_ = timeoutMs; }

    /// Schedules a load. Returns false when one is already in progress.
    bool load();
    bool isLoading() const { return loading_.load(); }

signals:
    void catalogLoaded(bool ok, const QString& message);

private:
    void loadNow();

    ModeProfile profile_;
    PluginRegistry* registry_;
    QThreadPool* pool_;
    bool probeEnabled_ = true;
    ProbeSettings probeSettings_;
    int timeoutMs_ = 30000;
    std::atomic<bool> loading_{false};
};

} // namespace pem
