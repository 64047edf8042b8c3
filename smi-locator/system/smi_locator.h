// Copyright (C) 2025
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef SMI_SYSTEM_SMI_LOCATOR_H
#define SMI_SYSTEM_SMI_LOCATOR_H

#include "system/filesystem.h"
#include "system/host_platform.h"
#include "system/locator_config.h"

#include <QMutex>
#include <QString>
#include <QStringList>

#include <memory>
#include <optional>

namespace smi {
namespace system {

/**
 * @brief Finds the nvidia-smi executable and formats its query arguments
 *
 * Discovery strategy depends on the platform family:
 * - Windows: scans the driver store for directories holding nvidia-smi.exe and
 *   picks the executable with the latest creation time (first one on a tie).
 *   Any file system error during the scan fails the whole discovery.
 * - Linux: "nvidia-smi", expected on PATH. No file system access.
 * - anything else: not supported.
 *
 * A successful result is cached for the lifetime of the locator. Failures are
 * not cached, so the next resolve() scans again. Concurrent resolve() calls
 * are serialized.
 */
class SmiLocator
{
public:
    SmiLocator(std::shared_ptr<FileSystem> fileSystem,
               PlatformFamily platform,
               const QString &homePath,
               const LocatorConfig &config = LocatorConfig());
    ~SmiLocator();

    SmiLocator(const SmiLocator &) = delete;
    SmiLocator &operator=(const SmiLocator &) = delete;

    // Process-wide locator, configured from the environment on first use
    static SmiLocator &instance();

    std::optional<QString> resolve();
    PlatformFamily platform() const { return m_platform; }

    // "-lms <ms> --query-gpu=... --format=csv,noheader,nounits"
    static QString buildQueryArgs(int intervalMs);
    // Same arguments as buildQueryArgs(), one per element, for QProcess
    static QStringList queryArguments(int intervalMs);
    // name, memory.total, memory.used, memory.free, utilization.gpu, utilization.memory
    static QStringList queryFields();

    // Empty for platforms without discovery support
    static QString executableName(PlatformFamily platform);

private:
    std::optional<QString> discover() const;
    std::optional<QString> discoverInDriverStore() const;

    std::shared_ptr<FileSystem> m_fileSystem;
    PlatformFamily m_platform;
    QString m_homePath;
    LocatorConfig m_config;

    QMutex m_mutex;
    std::optional<QString> m_resolvedPath; // written once, under m_mutex
};

} // namespace system
} // namespace smi

#endif // SMI_SYSTEM_SMI_LOCATOR_H
