#pragma once

#include "ModeProfile.hpp"
#include "Plugin.hpp"
#include "PluginError.hpp"
#include <QList>
#include <QString>

namespace pem {

struct LocalSnapshot {
    QList<Plugin> enabled;
    QList<Plugin> disabled;
};

/// Enumerates a plugin directory (non-recursive, plain files only) and
/// decodes every enabled or disabled plugin file it finds.
class LocalPluginScanner {
public:
    /// Creates `directory` when missing. Fails with Io when it cannot be
    /// created or read; in that case no partial snapshot is returned.
    static Result<LocalSnapshot> scan(const QString& directory, const ModeProfile& profile);
};

} // namespace pem
