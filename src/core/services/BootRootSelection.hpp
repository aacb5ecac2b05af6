#pragma once

#include "IBootRootProvider.hpp"
#include <QReadWriteLock>

namespace pem {

/// Boot root held in memory, seeded from config or the command line.
class BootRootSelection : public IBootRootProvider {
public:
    explicit BootRootSelection(const QString& root = {});

    QString currentRoot() const override;
    void setRoot(const QString& root);

private:
    mutable QReadWriteLock lock_;
    QString root_;
};

} // namespace pem
