// Copyright (C) 2025
// SPDX-License-Identifier: GPL-3.0-or-later

#include "host_platform.h"

#include <QSysInfo>

namespace smi {
namespace system {

PlatformFamily HostPlatform::current()
{
    return fromKernelType(QSysInfo::kernelType());
}

PlatformFamily HostPlatform::fromKernelType(const QString &kernelType)
{
    const QString kernel = kernelType.trimmed().toLower();
    if (kernel == "winnt") return PlatformFamily::Windows;
    if (kernel == "linux") return PlatformFamily::Linux;
    return PlatformFamily::Unknown;
}

QString HostPlatform::name(PlatformFamily family)
{
    switch (family) {
    case PlatformFamily::Windows: return QStringLiteral("Windows");
    case PlatformFamily::Linux: return QStringLiteral("Linux");
    default: return QStringLiteral("Unknown");
    }
}

QString HostPlatform::windowsDirectory(const QString &homePath)
{
    QChar drive('C');
    if (!homePath.isEmpty() && homePath.at(0).isLetter())
        drive = homePath.at(0).toUpper();
    return QString("%1:\\Windows").arg(drive);
}

QString HostPlatform::driverStorePath(const QString &homePath)
{
    return windowsDirectory(homePath) + "\\System32\\DriverStore\\FileRepository";
}

} // namespace system
} // namespace smi
