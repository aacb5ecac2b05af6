#include "LocalPluginScanner.hpp"
#include "FilenameCodec.hpp"
#include "SizeFormatter.hpp"
#include <QDir>
#include <QFileInfo>
#include <QSet>
#include <boost/log/trivial.hpp>

namespace pem {

Result<LocalSnapshot> LocalPluginScanner::scan(const QString& directory, const ModeProfile& profile)
{
    if (!profile.isActive())
        return Result<LocalSnapshot>::success({});

    if (directory.isEmpty())
        return Result<LocalSnapshot>::failure(ErrorKind::Io, "no plugin directory");

    QDir dir(directory);
    if (!dir.exists() && !QDir().mkpath(directory))
        return Result<LocalSnapshot>::failure(ErrorKind::Io, "cannot create " + directory);

    QFileInfo dirInfo(directory);
    if (!dirInfo.isDir())
        return Result<LocalSnapshot>::failure(ErrorKind::Io, directory + " is not a directory");
    if (!dirInfo.isReadable())
        return Result<LocalSnapshot>::failure(ErrorKind::Io, "cannot read " + directory);

    LocalSnapshot snapshot;
    QSet<QString> seenEnabled;
    QSet<QString> seenDisabled;

    const QFileInfoList entries = dir.entryInfoList(QDir::Files | QDir::Hidden | QDir::NoDotAndDotDot,
                                                    QDir::Name);
    for (const QFileInfo& entry : entries) {
        const QString fileName = entry.fileName();
        const FileState state = FilenameCodec::classify(fileName, profile);
        if (state == FileState::None)
            continue;

        auto plugin = FilenameCodec::decode(fileName, profile);
        if (!plugin) {
            BOOST_LOG_TRIVIAL(debug) << "Skipping " << fileName.toStdString() << ": not a "
                                     << profile.serverName.toStdString() << " plugin name";
            continue;
        }
        plugin->size = SizeFormatter::format(static_cast<quint64>(entry.size()));

        const QString key = plugin->dedupKey();
        if (state == FileState::Enabled) {
            if (seenEnabled.contains(key)) continue;
            seenEnabled.insert(key);
            snapshot.enabled.append(*plugin);
        } else {
            if (seenDisabled.contains(key)) continue;
            seenDisabled.insert(key);
            snapshot.disabled.append(*plugin);
        }
    }

    BOOST_LOG_TRIVIAL(debug) << "Scanned " << directory.toStdString() << ": "
                             << snapshot.enabled.size() << " enabled, "
                             << snapshot.disabled.size() << " disabled";
    return Result<LocalSnapshot>::success(snapshot);
}

} // namespace pem
