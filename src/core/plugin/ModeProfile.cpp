#include "ModeProfile.hpp"
#include <QDir>

namespace pem {

static ModeProfile makeCloudPE()
{
    ModeProfile p;
    p.mode = PluginMode::CloudPE;
    p.id = "cloudpe";
    p.catalogUrl = "https://api.cloud-pe.cn/GetPlugins/";
    p.connectTestUrl = "https://api.cloud-pe.cn/connecttest/";
    p.folder = "ce-apps";
    p.enabledExtension = ".ce";
    p.disabledExtension = ".CBK";
    p.fieldOrder = {PluginField::Name, PluginField::Version, PluginField::Author, PluginField::Description};
    p.minTokens = 4;
    p.schema = CatalogSchema::Coded;
    p.title = "Cloud-PE Plugin Market";
    p.serverName = "Cloud-PE";
    p.marketName = "Plugin Market";
    p.manageName = "Plugin Manager";
    return p;
}

static ModeProfile makeHotPE()
{
    ModeProfile p;
    p.mode = PluginMode::HotPE;
    p.id = "hotpe";
    p.catalogUrl = "https://api.hotpe.top/API/HotPE/GetHPMList/";
    p.connectTestUrl = p.catalogUrl;
    p.folder = "HotPEModule";
    p.enabledExtension = ".HPM";
    p.disabledExtension = ".hpm.off";
    p.fieldOrder = {PluginField::Name, PluginField::Author, PluginField::Version, PluginField::Description};
    p.minTokens = 3;
    p.nameForEmptyDescription = true;
    // Likely unintentional: "x.foo" disables to "x.foo.off", outside the .HPM/.hpm.off pair
    p.disableFallbackSuffix = ".off";
    p.schema = CatalogSchema::Stated;
    p.title = "HotPE Module Download";
    p.serverName = "HotPE";
    p.marketName = "Module Market";
    p.manageName = "Module Manager";
    return p;
}

static ModeProfile makeEdgeless()
{
    ModeProfile p;
    p.mode = PluginMode::Edgeless;
    p.id = "edgeless";
    p.catalogUrl = "https://api.cloud-pe.cn/EdgelessPlugins/";
    p.connectTestUrl = p.catalogUrl;
    p.folder = "Edgeless/Resource";
    p.enabledExtension = ".7z";
    p.disabledExtension = ".7zf";
    p.fieldOrder = {PluginField::Name, PluginField::Version, PluginField::Author};
    p.minTokens = 3;
    p.schema = CatalogSchema::Coded;
    p.title = "Edgeless Plugin Download";
    p.serverName = "Edgeless";
    p.marketName = "Plugin Market";
    p.manageName = "Plugin Manager";
    return p;
}

static ModeProfile makeSelect()
{
    ModeProfile p;
    p.mode = PluginMode::Select;
    p.id = "select";
    p.title = "Select Plugin Source";
    p.marketName = "Plugin Market";
    p.manageName = "Plugin Manager";
    return p;
}

const ModeProfile& ModeProfile::forMode(PluginMode mode)
{
    static const ModeProfile cloudPE = makeCloudPE();
    static const ModeProfile hotPE = makeHotPE();
    static const ModeProfile edgeless = makeEdgeless();
    static const ModeProfile select = makeSelect();

    switch (mode) {
    case PluginMode::CloudPE: return cloudPE;
    case PluginMode::HotPE: return hotPE;
    case PluginMode::Edgeless: return edgeless;
    case PluginMode::Select: return select;
    }
    return select;
}

QString ModeProfile::pluginDirectory(const QString& root) const
{
    if (root.isEmpty() || folder.isEmpty())
        return {};
    return QDir::cleanPath(QDir(root).filePath(folder));
}

PluginMode ModeProfile::modeFromArguments(const QStringList& arguments)
{
    // First argument is the program name
    for (int i = 1; i < arguments.size(); ++i) {
        const QString& arg = arguments[i];
        if (arg == "--hpm") return PluginMode::HotPE;
        if (arg == "--edgeless") return PluginMode::Edgeless;
        if (arg == "--select") return PluginMode::Select;
    }
    return PluginMode::CloudPE;
}

PluginMode ModeProfile::modeFromName(const QString& name)
{
    const QString n = name.trimmed().toLower();
    if (n == "hotpe" || n == "hpm") return PluginMode::HotPE;
    if (n == "edgeless") return PluginMode::Edgeless;
    if (n == "select") return PluginMode::Select;
    return PluginMode::CloudPE;
}

} // namespace pem
