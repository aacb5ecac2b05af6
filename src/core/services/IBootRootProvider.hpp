#pragma once

#include <QString>

namespace pem {

/// Supplies the root of the boot medium that plugin folders live under.
class IBootRootProvider {
public:
    virtual ~IBootRootProvider() = default;

    /// Current boot root, or an empty string when none is selected.
    /// Thread-safe.
    virtual QString currentRoot() const = 0;
};

} // namespace pem
