#pragma once

#include <QString>
#include <QStringList>
#include <yaml-cpp/yaml.h>

namespace pem {

// Deep merge of a config file over the built-in defaults.
// Mappings recurse; scalars and sequences in the file replace the default.
// A mapping is never replaced by a scalar or sequence, nor a scalar by a
// mapping; such keys keep their default and are listed in `rejected`.
inline YAML::Node mergeYaml(const YAML::Node& base, const YAML::Node& overlay,
                            QStringList* rejected = nullptr, const QString& path = {})
{
    if (!overlay.IsDefined() || overlay.IsNull())
        return YAML::Clone(base);

    if (!base.IsDefined() || base.IsNull())
        return YAML::Clone(overlay);

    if (base.IsMap()) {
        if (!overlay.IsMap()) {
            if (rejected)
                rejected->append(path.isEmpty() ? QStringLiteral("<root>") : path);
            return YAML::Clone(base);
        }

        YAML::Node result = YAML::Clone(base);
        for (auto it = overlay.begin(); it != overlay.end(); ++it) {
            const auto key = it->first.as<std::string>();
            const QString childPath = path.isEmpty() ? QString::fromStdString(key)
                                                     : path + '.' + QString::fromStdString(key);
            if (result[key])
                result[key] = mergeYaml(result[key], it->second, rejected, childPath);
            else
                result[key] = YAML::Clone(it->second);
        }
        return result;
    }

    if (base.IsScalar() && overlay.IsMap()) {
        if (rejected)
            rejected->append(path);
        return YAML::Clone(base);
    }

    return YAML::Clone(overlay);
}

} // namespace pem
