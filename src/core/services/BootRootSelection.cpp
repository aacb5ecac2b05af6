#include "BootRootSelection.hpp"
#include <QDir>
#include <QReadLocker>
#include <QWriteLocker>

namespace pem {

BootRootSelection::BootRootSelection(const QString& root)
{
    setRoot(root);
}

QString BootRootSelection::currentRoot() const
{
    QReadLocker locker(&lock_);
    return root_;
}

void BootRootSelection::setRoot(const QString& root)
{
    const QString cleaned = root.trimmed().isEmpty() ? QString() : QDir::cleanPath(root.trimmed());
    QWriteLocker locker(&lock_);
    root_ = cleaned;
}

} // namespace pem
