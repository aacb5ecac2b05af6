#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QEventLoop>
#include <QFile>
#include <QTextStream>
#include <QThreadPool>
#include <functional>
#include <optional>
#include <yaml-cpp/yaml.h>
#include "core/Logging.hpp"
#include "core/YamlConfig.hpp"
#include "core/plugin/LifecycleOrchestrator.hpp"
#include "core/plugin/ModeProfile.hpp"
#include "core/plugin/PluginRegistry.hpp"
#include "core/services/BootRootSelection.hpp"
#include "core/services/CatalogService.hpp"

namespace {

QTextStream& out()
{
    static QTextStream stream(stdout);
    return stream;
}

const char* statusLabel(pem::PluginStatus status)
{
    switch (status) {
    case pem::PluginStatus::NotInstalled: return "available";
    case pem::PluginStatus::Installed: return "installed";
    case pem::PluginStatus::UpdateAvailable: return "update available";
    }
    return "";
}

void printPlugin(const pem::Plugin& plugin, const QString& suffix = {})
{
    out() << "  " << plugin.name << "  v" << plugin.version << "  by " << plugin.author
          << "  (" << plugin.size << ")";
    if (!suffix.isEmpty())
        out() << "  [" << suffix << "]";
    out() << "\n";
    if (!plugin.description.isEmpty())
        out() << "      " << plugin.description << "\n";
}

bool loadCatalog(pem::CatalogService& service, pem::PluginRegistry& registry)
{
    QEventLoop loop;
    QObject::connect(&service, &pem::CatalogService::catalogLoaded, &loop, &QEventLoop::quit);
    if (!service.load())
        return false;
    loop.exec();

    const pem::Status error = registry.catalogError();
    if (!error.ok()) {
        qWarning().noquote() << "Catalog unavailable:" << error.message;
        return false;
    }
    return true;
}

bool rescan(pem::LifecycleOrchestrator& orchestrator)
{
    const pem::Status status = orchestrator.rescan();
    if (!status.ok()) {
        qWarning().noquote() << "Cannot scan plugin folder:" << status.message;
        return false;
    }
    return true;
}

// Runs one asynchronous orchestrator operation to completion
bool runOperation(pem::LifecycleOrchestrator& orchestrator, const std::function<bool()>& start)
{
    bool ok = false;
    QString message;
    QEventLoop loop;
    QObject::connect(&orchestrator, &pem::LifecycleOrchestrator::operationFinished, &loop,
                     [&](const QString&, pem::OperationKind, bool success, const QString& text) {
                         ok = success;
                         message = text;
                         loop.quit();
                     });
    if (!start()) {
        qWarning() << "Operation already running";
        return false;
    }
    loop.exec();
    if (!ok)
        qWarning().noquote() << "Failed:" << message;
    return ok;
}

std::optional<pem::Plugin> findLocalFile(const pem::PluginRegistry& registry, const QString& fileName)
{
    for (const auto& list : {registry.enabledPlugins(), registry.disabledPlugins()}) {
        for (const auto& plugin : list) {
            if (plugin.file == fileName)
                return plugin;
        }
    }
    return std::nullopt;
}

QString identityOf(const QStringList& args, int first)
{
    pem::Plugin probe;
    probe.name = args.value(first);
    probe.author = args.value(first + 1);
    return probe.identityKey();
}

// config get <key> | config set <key> <value>
int runConfigCommand(pem::YamlConfig& config, const QString& configPath, const QStringList& args)
{
    const QString action = args.value(1);
    const QString key = args.value(2);

    if (action == "get" && args.size() == 3) {
        const QVariant value = config.valueByPath(key);
        if (!value.isValid()) {
            qWarning().noquote() << "Unknown setting:" << key;
            return 1;
        }
        out() << value.toString() << "\n";
        return 0;
    }

    if (action == "set" && args.size() == 4) {
        if (!config.setValueByPath(key, args.value(3))) {
            qWarning().noquote() << "Cannot set" << key << "to" << args.value(3);
            return 1;
        }
        if (configPath.isEmpty() || !config.save(configPath)) {
            qWarning() << "Config file not writable; fix or remove it first";
            return 1;
        }
        qInfo().noquote() << "Saved" << key << "to" << configPath;
        return 0;
    }

    qWarning() << "Usage: pem config get <key> | pem config set <key> <value>";
    return 1;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("pem");
    app.setApplicationVersion("0.1.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Plugin market for Cloud-PE, HotPE and Edgeless boot media");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addOptions({
        {"hpm", "Use the HotPE module market."},
        {"edgeless", "Use the Edgeless plugin market."},
        {"root", "Boot root that holds the plugin folder.", "dir"},
        {"config", "Configuration file.", "file"},
        {"verbose", "Debug logging."},
    });
    parser.addPositionalArgument("command",
        "list | search <keyword> | installed | status | install <name> <author> | "
        "update <name> <author> | enable <file> | disable <file> | remove <file> | "
        "download <name> <author> [dir] | config get <key> | config set <key> <value>");
    parser.process(app);

    // Config: defaults overlaid by the file, when there is one
    pem::YamlConfig config;
    const QString configPath = parser.isSet("config") ? parser.value("config") : pem::YamlConfig::defaultPath();
    // Never overwrite a file that failed to load
    bool configWritable = true;
    if (QFile::exists(configPath)) {
        try {
            config.load(configPath);
        } catch (const YAML::Exception& e) {
            qWarning() << "Ignoring unreadable config" << configPath << ":" << e.what();
            configWritable = false;
        }
    }

    pem::initLogging(parser.isSet("verbose") || config.verboseLogging());

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty())
        parser.showHelp(1);
    const QString command = args.first();

    if (command == "config")
        return runConfigCommand(config, configWritable ? configPath : QString(), args);

    pem::PluginMode mode = pem::ModeProfile::modeFromName(config.mode());
    if (parser.isSet("hpm") || parser.isSet("edgeless"))
        mode = pem::ModeProfile::modeFromArguments(app.arguments());
    const pem::ModeProfile& profile = pem::ModeProfile::forMode(mode);
    if (!profile.isActive()) {
        qWarning() << "No plugin source selected";
        return 1;
    }
    qInfo().noquote() << profile.title;

    QThreadPool pool;
    pool.setMaxThreadCount(config.downloadThreads());

    pem::BootRootSelection bootRoot(parser.isSet("root") ? parser.value("root") : config.bootRoot());
    pem::PluginRegistry registry;

    pem::CatalogService catalog(profile, &registry, &pool);
    catalog.setRequestTimeout(config.requestTimeoutMs());
    pem::ProbeSettings probe;
    probe.attempts = config.probeAttempts();
    probe.timeoutMs = config.probeTimeoutMs();
    probe.delayMs = config.probeDelayMs();
    catalog.setProbeSettings(probe);

    pem::LifecycleOrchestrator orchestrator(profile, &registry, &bootRoot, &pool);
    orchestrator.setRequestTimeout(config.requestTimeoutMs());
    orchestrator.setDefaultDownloadDirectory(config.defaultDownloadDirectory());

    const bool needsRoot = command != "list" && command != "search" && command != "download";
    if (needsRoot && bootRoot.currentRoot().isEmpty()) {
        qWarning() << "No boot root; pass --root or set market.boot_root";
        return 1;
    }

    if (command == "list" || command == "search") {
        if (!bootRoot.currentRoot().isEmpty() && !rescan(orchestrator))
            return 1;
        if (!loadCatalog(catalog, registry))
            return 1;

        if (command == "search") {
            for (const auto& plugin : registry.search(args.value(1)))
                printPlugin(plugin, statusLabel(registry.statusOf(plugin)));
            return 0;
        }
        for (const auto& category : registry.categories()) {
            out() << category.className << "\n";
            for (const auto& plugin : category.plugins)
                printPlugin(plugin, statusLabel(registry.statusOf(plugin)));
        }
        return 0;
    }

    if (command == "installed" || command == "status") {
        if (!rescan(orchestrator))
            return 1;
        const bool withCatalog = command == "status" && loadCatalog(catalog, registry);

        out() << profile.manageName << " (" << orchestrator.pluginDirectory() << ")\n";
        out() << "Enabled:\n";
        for (const auto& plugin : registry.enabledPlugins())
            printPlugin(plugin, withCatalog && registry.hasUpdate(plugin) ? "update available" : QString());
        out() << "Disabled:\n";
        for (const auto& plugin : registry.disabledPlugins())
            printPlugin(plugin);
        return 0;
    }

    if (command == "install" || command == "update" || command == "download") {
        if (args.size() < 3) {
            qWarning() << "Usage: pem" << command << "<name> <author>";
            return 1;
        }
        if (!bootRoot.currentRoot().isEmpty() && !rescan(orchestrator))
            return 1;
        if (!loadCatalog(catalog, registry))
            return 1;

        auto remote = registry.findRemoteByIdentity(identityOf(args, 1));
        if (!remote) {
            qWarning().noquote() << "No catalog entry for" << args.value(1) << "by" << args.value(2);
            return 1;
        }

        bool ok = false;
        if (command == "install")
            ok = runOperation(orchestrator, [&] { return orchestrator.install(*remote); });
        else if (command == "update")
            ok = runOperation(orchestrator, [&] { return orchestrator.update(*remote); });
        else
            ok = runOperation(orchestrator, [&] { return orchestrator.downloadTo(*remote, args.value(3)); });

        // A folder given on the command line becomes the new default
        const QString chosen = args.value(3).isEmpty() ? QString() : QDir(args.value(3)).absolutePath();
        if (ok && configWritable && command == "download" && !chosen.isEmpty()
            && chosen != config.defaultDownloadDirectory()) {
            config.setDefaultDownloadDirectory(chosen);
            if (!config.save(configPath))
                qWarning().noquote() << "Cannot remember download folder in" << configPath;
        }
        return ok ? 0 : 1;
    }

    if (command == "enable" || command == "disable" || command == "remove") {
        if (args.size() < 2) {
            qWarning() << "Usage: pem" << command << "<file>";
            return 1;
        }
        if (!rescan(orchestrator))
            return 1;

        auto local = findLocalFile(registry, args.value(1));
        if (!local) {
            qWarning().noquote() << "Not a plugin file:" << args.value(1);
            return 1;
        }

        if (command == "remove") {
            const pem::Status status = orchestrator.remove(*local);
            if (!status.ok()) {
                qWarning().noquote() << "Failed:" << status.message;
                return 1;
            }
            return rescan(orchestrator) ? 0 : 1;
        }

        const bool enable = command == "enable";
        const bool ok = runOperation(orchestrator, [&] {
            return enable ? orchestrator.enable(*local) : orchestrator.disable(*local);
        });
        return ok ? 0 : 1;
    }

    qWarning().noquote() << "Unknown command:" << command;
    parser.showHelp(1);
}
