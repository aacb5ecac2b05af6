#pragma once

#include <QString>
#include <QtGlobal>

namespace pem {

class SizeFormatter {
public:
    /// "512 B", "2.00 KB", "5.00 MB", "1.50 GB". Always '.' as decimal point.
    static QString format(quint64 bytes);
};

} // namespace pem
