#include "FilenameCodec.hpp"
#include <QStringList>
#include <utility>

namespace pem {

static bool isCompound(const QString& extension)
{
    return extension.count(QLatin1Char('.')) > 1;
}

static QString lastExtension(const QString& fileName)
{
    int dot = fileName.lastIndexOf(QLatin1Char('.'));
    if (dot < 0) return {};
    return fileName.mid(dot);
}

QString FilenameCodec::stripSuffix(const QString& fileName, const ModeProfile& profile)
{
    // Longer suffix first so ".hpm.off" is never mistaken for something shorter
    QString first = profile.disabledExtension;
    QString second = profile.enabledExtension;
    if (second.size() > first.size())
        std::swap(first, second);

    if (!first.isEmpty() && fileName.endsWith(first, Qt::CaseInsensitive))
        return fileName.left(fileName.size() - first.size());
    if (!second.isEmpty() && fileName.endsWith(second, Qt::CaseInsensitive))
        return fileName.left(fileName.size() - second.size());
    return fileName;
}

std::optional<Plugin> FilenameCodec::decode(const QString& fileName, const ModeProfile& profile)
{
    if (!profile.isActive() || profile.fieldOrder.isEmpty())
        return std::nullopt;

    const QStringList tokens = stripSuffix(fileName, profile).split(DELIMITER);
    if (tokens.size() < profile.minTokens)
        return std::nullopt;

    Plugin plugin;
    const int last = profile.fieldOrder.size() - 1;
    for (int i = 0; i <= last; ++i) {
        QString value;
        if (i == last)
            value = tokens.mid(i).join(DELIMITER);
        else if (i < tokens.size())
            value = tokens[i];

        switch (profile.fieldOrder[i]) {
        case PluginField::Name: plugin.name = value; break;
        case PluginField::Version: plugin.version = value; break;
        case PluginField::Author: plugin.author = value; break;
        case PluginField::Description: plugin.description = value; break;
        }
    }
    plugin.file = fileName;
    return plugin;
}

QString FilenameCodec::sanitizeDescription(const QString& description)
{
    static const QString unsafe = QStringLiteral(" /\\:*?\"<>|");
    QString result = description;
    for (QChar& c : result) {
        if (unsafe.contains(c))
            c = DELIMITER;
    }
    return result;
}

QString FilenameCodec::encode(const Plugin& plugin, const ModeProfile& profile)
{
    QStringList parts;
    for (PluginField field : profile.fieldOrder) {
        switch (field) {
        case PluginField::Name:
            parts << plugin.name;
            break;
        case PluginField::Version:
            parts << plugin.version;
            break;
        case PluginField::Author:
            parts << plugin.author;
            break;
        case PluginField::Description: {
            QString description = sanitizeDescription(plugin.description);
            if (description.isEmpty() && profile.nameForEmptyDescription)
                description = plugin.name;
            parts << description;
            break;
        }
        }
    }
    return parts.join(DELIMITER);
}

QString FilenameCodec::installFileName(const Plugin& plugin, const ModeProfile& profile)
{
    return encode(plugin, profile) + profile.enabledExtension;
}

FileState FilenameCodec::classify(const QString& fileName, const ModeProfile& profile)
{
    if (!profile.isActive())
        return FileState::None;

    if (isCompound(profile.disabledExtension)) {
        // Exact suffix match; a disabled name must never count as enabled
        if (fileName.endsWith(profile.disabledExtension))
            return FileState::Disabled;
        if (lastExtension(fileName).compare(profile.enabledExtension, Qt::CaseInsensitive) == 0)
            return FileState::Enabled;
        return FileState::None;
    }

    const QString ext = lastExtension(fileName);
    if (ext.compare(profile.enabledExtension, Qt::CaseInsensitive) == 0)
        return FileState::Enabled;
    if (ext.compare(profile.disabledExtension, Qt::CaseInsensitive) == 0)
        return FileState::Disabled;
    return FileState::None;
}

QString FilenameCodec::enabledFileName(const QString& fileName, const ModeProfile& profile)
{
    if (fileName.endsWith(profile.disabledExtension, Qt::CaseInsensitive))
        return fileName.left(fileName.size() - profile.disabledExtension.size())
            + profile.enabledExtension;
    return fileName;
}

QString FilenameCodec::disabledFileName(const QString& fileName, const ModeProfile& profile)
{
    if (!profile.disableFallbackSuffix.isEmpty()) {
        if (fileName.endsWith(profile.enabledExtension))
            return fileName.left(fileName.size() - profile.enabledExtension.size())
                + profile.disabledExtension;
        return fileName + profile.disableFallbackSuffix;
    }

    if (fileName.endsWith(profile.enabledExtension, Qt::CaseInsensitive))
        return fileName.left(fileName.size() - profile.enabledExtension.size())
            + profile.disabledExtension;
    return fileName;
}

} // namespace pem
