#pragma once

#include "ModeProfile.hpp"
#include "Plugin.hpp"
#include <QString>
#include <optional>

namespace pem {

enum class FileState {
    None,
    Enabled,
    Disabled
};

/// Maps plugins to on-disk names and back, following the profile's grammar.
/// Fields are joined with '_'; the last field of the profile order absorbs
/// any extra tokens.
class FilenameCodec {
public:
    static constexpr QChar DELIMITER = QLatin1Char('_');

    /// Decode an on-disk file name. Returns nullopt when the name has fewer
    /// tokens than the profile requires. `size` is left empty.
    static std::optional<Plugin> decode(const QString& fileName, const ModeProfile& profile);

    /// Base name (no extension) for a plugin, with path-unsafe characters in
    /// the description replaced by '_'.
    static QString encode(const Plugin& plugin, const ModeProfile& profile);

    /// encode() plus the profile's enabled extension.
    static QString installFileName(const Plugin& plugin, const ModeProfile& profile);

    static FileState classify(const QString& fileName, const ModeProfile& profile);

    /// Name the file takes when enabled (disabled suffix swapped for the enabled one).
    static QString enabledFileName(const QString& fileName, const ModeProfile& profile);

    /// Name the file takes when disabled. HotPE appends ".off" when the name
    /// does not end in ".HPM".
    static QString disabledFileName(const QString& fileName, const ModeProfile& profile);

    static QString sanitizeDescription(const QString& description);

    /// fileName with the enabled or disabled suffix removed (case-insensitive).
    static QString stripSuffix(const QString& fileName, const ModeProfile& profile);
};

} // namespace pem
