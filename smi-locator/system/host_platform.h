// Copyright (C) 2025
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef SMI_SYSTEM_HOST_PLATFORM_H
#define SMI_SYSTEM_HOST_PLATFORM_H

#include <QString>

namespace smi {
namespace system {

enum class PlatformFamily {
    Windows,
    Linux,
    Unknown
};

class HostPlatform
{
public:
    // Family of the running kernel, from QSysInfo::kernelType()
    static PlatformFamily current();
    static PlatformFamily fromKernelType(const QString &kernelType);
    static QString name(PlatformFamily family);

    /**
     * @brief Best guess of the Windows installation directory.
     *
     * Uses the drive letter of @p homePath ("D:\Users\me" -> "D:\Windows").
     * Falls back to "C:\Windows" when the home path does not start with a letter.
     */
    static QString windowsDirectory(const QString &homePath);

    // <windowsDirectory>\System32\DriverStore\FileRepository
    static QString driverStorePath(const QString &homePath);
};

} // namespace system
} // namespace smi

#endif // SMI_SYSTEM_HOST_PLATFORM_H
