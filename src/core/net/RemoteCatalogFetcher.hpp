#pragma once

#include "core/net/HttpClient.hpp"
#include "core/plugin/ModeProfile.hpp"
#include "core/plugin/Plugin.hpp"
#include "core/plugin/PluginError.hpp"
#include <QByteArray>
#include <QList>

namespace pem {

using Catalog = QList<PluginCategory>;

/// Downloads and normalizes a mode's remote plugin catalog.
///
/// Both wire schemas end up as the same PluginCategory list. Entries are
/// de-duplicated within each category by Plugin::dedupKey(), first occurrence
/// wins and catalog order is kept.
class RemoteCatalogFetcher {
public:
    explicit RemoteCatalogFetcher(const HttpClient& client);

    /// One GET of profile.catalogUrl, then parse(). Blocks the calling thread.
    Result<Catalog> fetch(const ModeProfile& profile) const;

    /// Decode a catalog body according to profile.schema. No I/O.
    static Result<Catalog> parse(const QByteArray& body, const ModeProfile& profile);

    static QList<Plugin> deduplicate(const QList<Plugin>& plugins);

private:
    const HttpClient& client_;
};

} // namespace pem
