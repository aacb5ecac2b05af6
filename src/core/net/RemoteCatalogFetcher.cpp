#include "RemoteCatalogFetcher.hpp"
#include "core/plugin/SizeFormatter.hpp"
#include <QDateTime>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QLocale>
#include <QSet>
#include <QTimeZone>
#include <QUrl>
#include <boost/log/trivial.hpp>
#include <cmath>
#include <limits>

namespace pem {

namespace {

const char* UNKNOWN_SIZE = "unknown size";

// Field extraction helpers. Each returns false and fills `error` on a type
// mismatch so the whole body is rejected, never a single entry.

bool requireString(const QJsonObject& obj, const char* key, QString& out, QString& error)
{
    const QJsonValue v = obj.value(QLatin1String(key));
    if (!v.isString()) {
        error = QString("field '%1' missing or not a string").arg(key);
        return false;
    }
    out = v.toString();
    return true;
}

bool optionalString(const QJsonObject& obj, const char* key, QString& out, QString& error)
{
    const QJsonValue v = obj.value(QLatin1String(key));
    if (v.isUndefined() || v.isNull()) {
        out.clear();
        return true;
    }
    if (!v.isString()) {
        error = QString("field '%1' is not a string").arg(key);
        return false;
    }
    out = v.toString();
    return true;
}

bool requireArray(const QJsonObject& obj, const char* key, QJsonArray& out, QString& error)
{
    const QJsonValue v = obj.value(QLatin1String(key));
    if (!v.isArray()) {
        error = QString("field '%1' missing or not an array").arg(key);
        return false;
    }
    out = v.toArray();
    return true;
}

bool isIntegral(double d)
{
    return std::isfinite(d) && std::floor(d) == d
        && d >= -9223372036854775808.0 && d < 9223372036854775808.0;
}

QString formatNumericSize(double d)
{
    if (!std::isfinite(d))
        return QString::fromLatin1(UNKNOWN_SIZE);
    if (d <= 0)
        return SizeFormatter::format(0);
    // 2^64 and above saturate
    if (d >= 18446744073709551616.0)
        return SizeFormatter::format(std::numeric_limits<quint64>::max());
    // Fractional sizes are truncated
    return SizeFormatter::format(static_cast<quint64>(d));
}

QString formatModified(double d)
{
    if (isIntegral(d)) {
        const QDateTime dt = QDateTime::fromSecsSinceEpoch(static_cast<qint64>(d), QTimeZone::utc());
        if (dt.isValid())
            return dt.toString(QStringLiteral("yyyy-MM-dd HH:mm:ss"));
        return QString::number(static_cast<qint64>(d));
    }
    return QString::number(d, 'g', QLocale::FloatingPointShortest);
}

bool parseCategoryHeader(const QJsonObject& obj, PluginCategory& category, QJsonArray& list, QString& error)
{
    if (!requireString(obj, "class", category.className, error)) return false;
    if (!optionalString(obj, "icon", category.icon, error)) return false;
    return requireArray(obj, "list", list, error);
}

// {code, message, data: [{class, icon?, list: [{name, size, version, author, describe?, file?, link}]}]}
Result<Catalog> parseCoded(const QJsonObject& root)
{
    QString error;

    const QJsonValue code = root.value(QLatin1String("code"));
    if (!code.isDouble())
        return Result<Catalog>::failure(ErrorKind::Protocol, "field 'code' missing or not a number");

    QString message;
    if (!requireString(root, "message", message, error))
        return Result<Catalog>::failure(ErrorKind::Protocol, error);

    if (code.toInt() != 200)
        return Result<Catalog>::failure(ErrorKind::Protocol,
                                        QString("catalog request rejected (code %1): %2")
                                            .arg(code.toInt()).arg(message));

    QJsonArray data;
    if (!requireArray(root, "data", data, error))
        return Result<Catalog>::failure(ErrorKind::Protocol, error);

    Catalog catalog;
    for (const QJsonValue& categoryValue : data) {
        if (!categoryValue.isObject())
            return Result<Catalog>::failure(ErrorKind::Protocol, "category is not an object");

        PluginCategory category;
        QJsonArray list;
        if (!parseCategoryHeader(categoryValue.toObject(), category, list, error))
            return Result<Catalog>::failure(ErrorKind::Protocol, error);

        for (const QJsonValue& itemValue : list) {
            if (!itemValue.isObject())
                return Result<Catalog>::failure(ErrorKind::Protocol, "plugin entry is not an object");
            const QJsonObject item = itemValue.toObject();

            Plugin plugin;
            bool ok = requireString(item, "name", plugin.name, error)
                && requireString(item, "size", plugin.size, error)
                && requireString(item, "version", plugin.version, error)
                && requireString(item, "author", plugin.author, error)
                && optionalString(item, "describe", plugin.description, error)
                && optionalString(item, "file", plugin.file, error)
                && requireString(item, "link", plugin.link, error);
            if (!ok)
                return Result<Catalog>::failure(ErrorKind::Protocol, error);

            category.plugins.append(plugin);
        }

        category.plugins = RemoteCatalogFetcher::deduplicate(category.plugins);
        catalog.append(category);
    }
    return Result<Catalog>::success(catalog);
}

// {state, data: [{class, icon?, list: [{name, size, modified, link}]}]}
// The module name itself encodes name_author_version_description.HPM
Result<Catalog> parseStated(const QJsonObject& root)
{
    QString error;

    QString state;
    if (!requireString(root, "state", state, error))
        return Result<Catalog>::failure(ErrorKind::Protocol, error);
    if (state != QLatin1String("success"))
        return Result<Catalog>::failure(ErrorKind::Protocol,
                                        QString("catalog request rejected (state '%1')").arg(state));

    QJsonArray data;
    if (!requireArray(root, "data", data, error))
        return Result<Catalog>::failure(ErrorKind::Protocol, error);

    Catalog catalog;
    for (const QJsonValue& categoryValue : data) {
        if (!categoryValue.isObject())
            return Result<Catalog>::failure(ErrorKind::Protocol, "category is not an object");

        PluginCategory category;
        QJsonArray list;
        if (!parseCategoryHeader(categoryValue.toObject(), category, list, error))
            return Result<Catalog>::failure(ErrorKind::Protocol, error);

        for (const QJsonValue& itemValue : list) {
            if (!itemValue.isObject())
                return Result<Catalog>::failure(ErrorKind::Protocol, "module entry is not an object");
            const QJsonObject item = itemValue.toObject();

            Plugin plugin;
            QString rawName;
            if (!requireString(item, "name", rawName, error)
                || !requireString(item, "link", plugin.link, error))
                return Result<Catalog>::failure(ErrorKind::Protocol, error);

            const QJsonValue modified = item.value(QLatin1String("modified"));
            if (modified.isString())
                plugin.modified = modified.toString();
            else if (modified.isDouble())
                plugin.modified = formatModified(modified.toDouble());
            else
                return Result<Catalog>::failure(ErrorKind::Protocol,
                                                "field 'modified' missing or not a string or number");

            const QJsonValue size = item.value(QLatin1String("size"));
            if (size.isDouble())
                plugin.size = formatNumericSize(size.toDouble());
            else if (size.isString())
                plugin.size = size.toString();
            else
                plugin.size = QString::fromLatin1(UNKNOWN_SIZE);

            QString stem = rawName;
            while (stem.endsWith(QLatin1String(".HPM")))
                stem.chop(4);
            const QStringList parts = stem.split(QLatin1Char('_'));
            if (parts.size() >= 3) {
                plugin.name = parts[0];
                plugin.author = parts[1];
                plugin.version = parts[2];
                plugin.description = parts.mid(3).join(QLatin1Char('_'));
            } else {
                plugin.name = rawName;
            }
            plugin.file = rawName;

            category.plugins.append(plugin);
        }

        category.plugins = RemoteCatalogFetcher::deduplicate(category.plugins);
        catalog.append(category);
    }
    return Result<Catalog>::success(catalog);
}

} // namespace

RemoteCatalogFetcher::RemoteCatalogFetcher(const HttpClient& client)
    : client_(client)
{
}

Result<Catalog> RemoteCatalogFetcher::fetch(const ModeProfile& profile) const
{
    if (!profile.isActive() || profile.catalogUrl.isEmpty())
        return Result<Catalog>::failure(ErrorKind::Protocol, "mode '" + profile.id + "' has no catalog");

    auto response = client_.get(QUrl(profile.catalogUrl));
    if (!response.ok()) {
        BOOST_LOG_TRIVIAL(error) << "Catalog fetch from " << profile.catalogUrl.toStdString()
                                 << " failed: " << response.status.message.toStdString();
        return Result<Catalog>::failure(response.status);
    }

    auto catalog = parse(response.value.body, profile);
    if (!catalog.ok()) {
        BOOST_LOG_TRIVIAL(error) << "Catalog from " << profile.catalogUrl.toStdString()
                                 << " rejected: " << catalog.status.message.toStdString();
        return catalog;
    }

    int total = 0;
    for (const auto& category : catalog.value)
        total += category.plugins.size();
    BOOST_LOG_TRIVIAL(info) << "Fetched " << profile.serverName.toStdString() << " catalog: "
                            << catalog.value.size() << " categories, " << total << " entries";
    return catalog;
}

Result<Catalog> RemoteCatalogFetcher::parse(const QByteArray& body, const ModeProfile& profile)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &parseError);
    if (parseError.error != QJsonParseError::NoError)
        return Result<Catalog>::failure(ErrorKind::Protocol, "malformed JSON: " + parseError.errorString());
    if (!doc.isObject())
        return Result<Catalog>::failure(ErrorKind::Protocol, "catalog root is not an object");

    switch (profile.schema) {
    case CatalogSchema::Coded:
        return parseCoded(doc.object());
    case CatalogSchema::Stated:
        return parseStated(doc.object());
    case CatalogSchema::None:
        break;
    }
    return Result<Catalog>::failure(ErrorKind::Protocol, "mode '" + profile.id + "' has no catalog schema");
}

QList<Plugin> RemoteCatalogFetcher::deduplicate(const QList<Plugin>& plugins)
{
    QList<Plugin> unique;
    QSet<QString> seen;
    for (const auto& plugin : plugins) {
        const QString key = plugin.dedupKey();
        if (seen.contains(key))
            continue;
        seen.insert(key);
        unique.append(plugin);
    }
    return unique;
}

} // namespace pem
