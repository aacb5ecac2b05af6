#include "SizeFormatter.hpp"

namespace pem {

namespace {
constexpr quint64 KiB = 1024;
constexpr quint64 MiB = KiB * 1024;
constexpr quint64 GiB = MiB * 1024;
}

QString SizeFormatter::format(quint64 bytes)
{
    // QString::number is locale-independent
    if (bytes < KiB)
        return QString::number(bytes) + " B";
    if (bytes < MiB)
        return QString::number(static_cast<double>(bytes) / KiB, 'f', 2) + " KB";
    if (bytes < GiB)
        return QString::number(static_cast<double>(bytes) / MiB, 'f', 2) + " MB";
    return QString::number(static_cast<double>(bytes) / GiB, 'f', 2) + " GB";
}

} // namespace pem
